#include "LivenessProbe.hpp"

#include <utility>

namespace {
// stat exits 1 for a missing path; ssh reserves 255 for its own failures.
constexpr int kStatMissingExitCode = 1;
} // namespace

LivenessProbe::LivenessProbe(std::string stateDir, bool runningWhenPresent)
    : stateDir_(std::move(stateDir)),
      runningWhenPresent_(runningWhenPresent) {
    while (stateDir_.size() > 1 && stateDir_.back() == '/') {
        stateDir_.pop_back();
    }
}

bool LivenessProbe::IsRunning(RemoteExecutor& executor, const std::string& containerId) const {
    if (containerId.empty()) {
        return false;
    }

    const CommandResult result = executor.Run(BuildProbeCommand(containerId));
    if (!result.error.empty()) {
        return false;
    }

    if (result.exitCode == 0) {
        return runningWhenPresent_;
    }
    if (result.exitCode == kStatMissingExitCode) {
        return !runningWhenPresent_;
    }

    return false;
}

std::vector<std::string> LivenessProbe::BuildProbeCommand(const std::string& containerId) const {
    return {"stat", stateDir_ + "/" + containerId};
}

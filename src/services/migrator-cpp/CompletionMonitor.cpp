#include "CompletionMonitor.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

namespace {
MigrationError MakeRestoreError(MigrationErrorKind kind, const std::string& message) {
    MigrationError error;
    error.kind = kind;
    error.step = "restore";
    error.message = message;
    return error;
}

// Single outcome slot shared by the monitor and both observer threads.
class ResolveOnce {
public:
    explicit ResolveOnce(CompletionMonitor::Clock::time_point clockStart)
        : clockStart_(clockStart),
          future_(promise_.get_future()) {}

    // Returns false when another signal already won.
    bool Resolve(bool succeeded, std::optional<MigrationError> cause = std::nullopt) {
        if (resolved_.exchange(true)) {
            return false;
        }

        const auto downtime = std::chrono::duration_cast<std::chrono::milliseconds>(
            CompletionMonitor::Clock::now() - clockStart_);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopped_ = true;
        }
        stopSignal_.notify_all();

        promise_.set_value(succeeded
            ? MigrationOutcome::Success(downtime)
            : MigrationOutcome::Failure(std::move(*cause), downtime));
        return true;
    }

    bool Resolved() const {
        return resolved_.load();
    }

    // Sleeps for one interval; returns false once the outcome is resolved.
    bool WaitInterval(std::chrono::milliseconds interval) {
        std::unique_lock<std::mutex> lock(mutex_);
        return !stopSignal_.wait_for(lock, interval, [this] { return stopped_; });
    }

    std::future<MigrationOutcome>& Future() {
        return future_;
    }

private:
    CompletionMonitor::Clock::time_point clockStart_;
    std::atomic<bool> resolved_{false};
    std::promise<MigrationOutcome> promise_;
    std::future<MigrationOutcome> future_;
    std::mutex mutex_;
    std::condition_variable stopSignal_;
    bool stopped_ = false;
};

void WaitForProcess(
    std::shared_ptr<ResolveOnce> state,
    std::shared_ptr<ProcessHandle> restore,
    CompletionMonitor::LivenessCheck isRunning) {
    const CommandResult result = restore->Wait();
    if (state->Resolved()) {
        return;
    }

    if (!result.Ok()) {
        state->Resolve(false, MakeRestoreError(MigrationErrorKind::RestoreFailure, result.Describe()));
        return;
    }

    // A clean exit alone is not proof the container came up.
    if (isRunning()) {
        state->Resolve(true);
        return;
    }
    state->Resolve(false, MakeRestoreError(
        MigrationErrorKind::RestoreFailure, "restore exited before the container reached running state"));
}

void PollLiveness(
    std::shared_ptr<ResolveOnce> state,
    CompletionMonitor::LivenessCheck isRunning,
    std::chrono::milliseconds interval) {
    if (isRunning()) {
        state->Resolve(true);
        return;
    }

    while (state->WaitInterval(interval)) {
        if (isRunning()) {
            state->Resolve(true);
            return;
        }
    }
}
} // namespace

CompletionMonitor::CompletionMonitor(MonitorOptions options)
    : options_(options) {
    if (options_.pollInterval <= std::chrono::milliseconds::zero()) {
        options_.pollInterval = std::chrono::milliseconds(200);
    }
}

MigrationOutcome CompletionMonitor::Await(
    std::unique_ptr<ProcessHandle> restore,
    LivenessCheck isRunning,
    Clock::time_point clockStart) const {
    auto state = std::make_shared<ResolveOnce>(clockStart);

    if (!restore || !isRunning) {
        state->Resolve(false, MakeRestoreError(MigrationErrorKind::RestoreFailure, "no restore process to monitor"));
        return state->Future().get();
    }

    std::shared_ptr<ProcessHandle> process(std::move(restore));
    std::cout << "[Monitor] Waiting for container to start..." << std::endl;
    try {
        // Neither observer is joined: the restore process normally outlives
        // the migration, and a liveness check may hang on an unresponsive
        // host. Both share ownership of the state they touch.
        std::thread(WaitForProcess, state, process, isRunning).detach();
        std::thread(PollLiveness, state, isRunning, options_.pollInterval).detach();
    } catch (const std::system_error& ex) {
        std::cerr << "[Monitor] Failed to start observer: " << ex.what() << std::endl;
        state->Resolve(false, MakeRestoreError(MigrationErrorKind::RestoreFailure, ex.what()));
    }

    auto& future = state->Future();
    if (options_.timeout > std::chrono::milliseconds::zero()
        && future.wait_for(options_.timeout) == std::future_status::timeout) {
        state->Resolve(false, MakeRestoreError(
            MigrationErrorKind::RestoreTimeout,
            "container not running after " + std::to_string(options_.timeout.count()) + "ms"));
    }

    MigrationOutcome outcome = future.get();
    return outcome;
}

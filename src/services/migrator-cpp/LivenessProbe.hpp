#pragma once

#include "CommandExecutor.hpp"

#include <string>
#include <vector>

// Decides whether a container is running from the runtime's state marker
// <stateDir>/<containerId> on the executor's host.
class LivenessProbe {
public:
    explicit LivenessProbe(std::string stateDir = "/var/run/opencontainer/containers", bool runningWhenPresent = true);

    bool IsRunning(RemoteExecutor& executor, const std::string& containerId) const;

    std::vector<std::string> BuildProbeCommand(const std::string& containerId) const;

private:
    std::string stateDir_;
    bool runningWhenPresent_ = true;
};

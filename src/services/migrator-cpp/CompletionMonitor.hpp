#pragma once

#include "CommandExecutor.hpp"
#include "MigrationTypes.hpp"

#include <chrono>
#include <functional>
#include <memory>

struct MonitorOptions {
    std::chrono::milliseconds pollInterval{200};
    // Upper bound on the whole wait; zero waits until a task resolves.
    std::chrono::milliseconds timeout{0};
};

// Races the restore process against destination liveness polling. The first
// conclusive signal resolves the outcome; later signals are ignored.
class CompletionMonitor {
public:
    using Clock = std::chrono::steady_clock;
    using LivenessCheck = std::function<bool()>;

    explicit CompletionMonitor(MonitorOptions options = MonitorOptions());

    MigrationOutcome Await(std::unique_ptr<ProcessHandle> restore, LivenessCheck isRunning, Clock::time_point clockStart) const;

private:
    MonitorOptions options_;
};

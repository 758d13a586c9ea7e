#pragma once

#include "CheckpointPipeline.hpp"
#include "CompletionMonitor.hpp"
#include "LivenessProbe.hpp"
#include "MigrationTypes.hpp"
#include "Tracing.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

class MigrationOrchestrator {
public:
    using Clock = CompletionMonitor::Clock;
    using ClockSource = std::function<Clock::time_point()>;

    MigrationOrchestrator(CheckpointPipeline& pipeline, LivenessProbe probe, CompletionMonitor monitor);

    // Overrides the downtime clock; the default reads steady_clock.
    void SetClockSource(ClockSource clock);

    MigrationOutcome Migrate(const MigrationPlan& plan);

private:
    std::optional<MigrationError> PrepareBoth(const MigrationPlan& plan, const ImageGeneration& generation);
    std::optional<MigrationError> RunSinglePass(const MigrationPlan& plan, ImageGeneration& finalGeneration);
    std::optional<MigrationError> RunPreDumpPasses(const MigrationPlan& plan, ImageGeneration& finalGeneration);
    std::unique_ptr<ProcessHandle> StartRestore(const MigrationPlan& plan, const ImageGeneration& generation, std::optional<MigrationError>& outError);
    void StartClock();
    void OnStage(MigrationStage stage);
    MigrationOutcome Fail(MigrationError error);

    CheckpointPipeline& pipeline_;
    LivenessProbe probe_;
    CompletionMonitor monitor_;
    ClockSource clock_;
    Clock::time_point clockStart_;
    MigrationProgress progress_;
    SpanHandle span_;
};

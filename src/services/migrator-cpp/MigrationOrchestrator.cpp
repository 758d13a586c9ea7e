#include "MigrationOrchestrator.hpp"

#include "Tracing.hpp"

#include <iostream>
#include <utility>

MigrationOrchestrator::MigrationOrchestrator(CheckpointPipeline& pipeline, LivenessProbe probe, CompletionMonitor monitor)
    : pipeline_(pipeline),
      probe_(std::move(probe)),
      monitor_(std::move(monitor)),
      clock_([] { return Clock::now(); }) {}

void MigrationOrchestrator::SetClockSource(ClockSource clock) {
    if (clock) {
        clock_ = std::move(clock);
    }
}

MigrationOutcome MigrationOrchestrator::Migrate(const MigrationPlan& plan) {
    progress_ = MigrationProgress{};

    if (!plan.source || !plan.destination || plan.containerId.empty()) {
        MigrationError error;
        error.kind = MigrationErrorKind::ValidationError;
        error.step = "plan";
        error.message = "plan is missing an executor or container id";
        return Fail(std::move(error));
    }

    span_ = Tracer::Instance().StartSpan("migration.migrate");
    auto& span = span_;
    Tracer::Instance().SetAttribute(span, "container.id", plan.containerId);
    Tracer::Instance().SetAttribute(span, "source", plan.source->Describe());
    Tracer::Instance().SetAttribute(span, "destination", plan.destination->Describe());
    Tracer::Instance().SetAttribute(span, "pre_dump", plan.preDumpEnabled ? "true" : "false");

    pipeline_.SetStageObserver([this](MigrationStage stage) { OnStage(stage); });

    std::cout << "[Migrate] Preparing everything to do a checkpoint of " << plan.containerId << std::endl;

    ImageGeneration finalGeneration;
    std::optional<MigrationError> error;
    if (plan.preDumpEnabled) {
        error = RunPreDumpPasses(plan, finalGeneration);
    } else {
        error = RunSinglePass(plan, finalGeneration);
    }
    pipeline_.SetStageObserver({});

    if (error) {
        Tracer::Instance().SetAttribute(span, "error.kind", ToString(error->kind));
        Tracer::Instance().EndSpan(span, false);
        return Fail(std::move(*error));
    }

    std::unique_ptr<ProcessHandle> restore = StartRestore(plan, finalGeneration, error);
    if (error) {
        Tracer::Instance().SetAttribute(span, "error.kind", ToString(error->kind));
        Tracer::Instance().EndSpan(span, false);
        return Fail(std::move(*error));
    }

    progress_.lastStage = MigrationStage::MONITORING;
    auto destination = plan.destination;
    const LivenessProbe probe = probe_;
    const std::string containerId = plan.containerId;
    MigrationOutcome outcome = monitor_.Await(
        std::move(restore),
        [destination, probe, containerId] { return probe.IsRunning(*destination, containerId); },
        clockStart_);

    progress_.lastStage = outcome.succeeded ? MigrationStage::COMPLETED : MigrationStage::FAILED;
    outcome.progress = progress_;

    Tracer::Instance().SetAttribute(span, "downtime_ms", static_cast<int64_t>(outcome.downtime.count()));
    Tracer::Instance().EndSpan(span, outcome.succeeded);

    if (outcome.succeeded) {
        std::cout << "[Migrate] Restore finished successfully, total downtime: " << outcome.downtime.count() << "ms" << std::endl;
    } else {
        std::cerr << "[Migrate] Error performing restore: " << outcome.failureCause->Describe() << std::endl;
    }
    return outcome;
}

std::optional<MigrationError> MigrationOrchestrator::PrepareBoth(const MigrationPlan& plan, const ImageGeneration& generation) {
    progress_.lastStage = MigrationStage::PREPARING;
    if (auto error = pipeline_.PrepareDirectory(*plan.source, generation.sourceImagePath)) {
        return error;
    }
    return pipeline_.PrepareDirectory(*plan.destination, generation.destinationImagePath);
}

std::optional<MigrationError> MigrationOrchestrator::RunSinglePass(const MigrationPlan& plan, ImageGeneration& finalGeneration) {
    finalGeneration = ImageGeneration::Single(plan.sourceRoot, plan.destinationRoot);
    if (auto error = PrepareBoth(plan, finalGeneration)) {
        return error;
    }

    StartClock();
    return pipeline_.Run(plan, finalGeneration);
}

std::optional<MigrationError> MigrationOrchestrator::RunPreDumpPasses(const MigrationPlan& plan, ImageGeneration& finalGeneration) {
    const ImageGeneration preDump = ImageGeneration::PreDump(plan.sourceRoot, plan.destinationRoot);
    if (auto error = PrepareBoth(plan, preDump)) {
        return error;
    }

    std::cout << "[Migrate] Copying predump image to dst" << std::endl;
    if (auto error = pipeline_.Run(plan, preDump)) {
        return error;
    }

    finalGeneration = ImageGeneration::Final(plan.sourceRoot, plan.destinationRoot, preDump);
    if (auto error = PrepareBoth(plan, finalGeneration)) {
        return error;
    }

    StartClock();
    return pipeline_.Run(plan, finalGeneration);
}

std::unique_ptr<ProcessHandle> MigrationOrchestrator::StartRestore(
    const MigrationPlan& plan,
    const ImageGeneration& generation,
    std::optional<MigrationError>& outError) {
    progress_.lastStage = MigrationStage::RESTORING;
    std::cout << "[Migrate] Performing the restore" << std::endl;

    std::string error;
    auto handle = pipeline_.Tool().StartRestore(
        *plan.destination,
        plan.containerId,
        generation.destinationImagePath,
        plan.destinationRoot + "/config.json",
        plan.destinationRoot + "/runtime.json",
        error);
    if (!handle) {
        std::cerr << "[Migrate] Error performing restore: " << error << std::endl;
        MigrationError launchError;
        launchError.kind = MigrationErrorKind::RestoreLaunchError;
        launchError.step = "restore " + generation.destinationImagePath;
        launchError.message = error;
        outError = std::move(launchError);
        return nullptr;
    }

    progress_.restoreStarted = true;
    return handle;
}

void MigrationOrchestrator::StartClock() {
    clockStart_ = clock_();
    Tracer::Instance().AddEvent(span_, "downtime.start");
}

void MigrationOrchestrator::OnStage(MigrationStage stage) {
    progress_.lastStage = stage;
    if (stage == MigrationStage::CHECKPOINTING) {
        // From here on the source container may already be stopped.
        progress_.finalCheckpointStarted = true;
    }
}

MigrationOutcome MigrationOrchestrator::Fail(MigrationError error) {
    std::cerr << "[Migrate] Migration aborted: " << error.Describe() << std::endl;
    progress_.lastStage = MigrationStage::FAILED;
    MigrationOutcome outcome = MigrationOutcome::Failure(std::move(error));
    outcome.progress = progress_;
    return outcome;
}

#include "MigrationTypes.hpp"

#include <utility>

namespace {
std::string TrimTrailingSlashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}
} // namespace

std::string ToString(MigrationErrorKind kind) {
    switch (kind) {
    case MigrationErrorKind::SetupError:
        return "SetupError";
    case MigrationErrorKind::CheckpointError:
        return "CheckpointError";
    case MigrationErrorKind::ArchiveError:
        return "ArchiveError";
    case MigrationErrorKind::TransferError:
        return "TransferError";
    case MigrationErrorKind::UnpackError:
        return "UnpackError";
    case MigrationErrorKind::RestoreLaunchError:
        return "RestoreLaunchError";
    case MigrationErrorKind::RestoreFailure:
        return "RestoreFailure";
    case MigrationErrorKind::RestoreTimeout:
        return "RestoreTimeout";
    case MigrationErrorKind::ValidationError:
        return "ValidationError";
    }
    return "UnknownError";
}

std::string ToString(MigrationStage stage) {
    switch (stage) {
    case MigrationStage::IDLE:
        return "IDLE";
    case MigrationStage::PREPARING:
        return "PREPARING";
    case MigrationStage::PRE_DUMPING:
        return "PRE_DUMPING";
    case MigrationStage::CHECKPOINTING:
        return "CHECKPOINTING";
    case MigrationStage::TRANSFERRING:
        return "TRANSFERRING";
    case MigrationStage::RESTORING:
        return "RESTORING";
    case MigrationStage::MONITORING:
        return "MONITORING";
    case MigrationStage::COMPLETED:
        return "COMPLETED";
    case MigrationStage::FAILED:
        return "FAILED";
    }
    return "UNKNOWN";
}

std::string MigrationError::Describe() const {
    std::string text = ToString(kind);
    if (!step.empty()) {
        text += " (" + step + ")";
    }
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

MigrationPlan MigrationPlan::Create(
    std::shared_ptr<RemoteExecutor> source,
    std::shared_ptr<RemoteExecutor> destination,
    const std::string& sourceRoot,
    const std::string& destinationRoot,
    bool preDumpEnabled) {
    MigrationPlan plan;
    plan.source = std::move(source);
    plan.destination = std::move(destination);
    plan.sourceRoot = TrimTrailingSlashes(sourceRoot);
    plan.destinationRoot = TrimTrailingSlashes(destinationRoot);
    plan.containerId = ContainerIdFromPath(plan.sourceRoot);
    plan.preDumpEnabled = preDumpEnabled;
    return plan;
}

std::string MigrationPlan::ContainerIdFromPath(const std::string& path) {
    const std::string trimmed = TrimTrailingSlashes(path);
    const auto lastSlash = trimmed.find_last_of('/');
    if (lastSlash == std::string::npos) {
        return trimmed;
    }
    return trimmed.substr(lastSlash + 1);
}

std::string ImageGeneration::SourceArchivePath(const std::string& sourceRoot) const {
    return sourceRoot + "/" + archiveFileName;
}

std::string ImageGeneration::DestinationArchivePath() const {
    return destinationImagePath + "/" + archiveFileName;
}

ImageGeneration ImageGeneration::Single(const std::string& sourceRoot, const std::string& destinationRoot) {
    ImageGeneration generation;
    generation.sourceImagePath = sourceRoot + "/images";
    generation.destinationImagePath = destinationRoot + "/images";
    generation.archiveFileName = "dump.tar.gz";
    return generation;
}

ImageGeneration ImageGeneration::PreDump(const std::string& sourceRoot, const std::string& destinationRoot) {
    ImageGeneration generation;
    generation.index = 0;
    generation.sourceImagePath = sourceRoot + "/images/0";
    generation.destinationImagePath = destinationRoot + "/images/0";
    generation.archiveFileName = "predump.tar.gz";
    generation.preDump = true;
    return generation;
}

ImageGeneration ImageGeneration::Final(
    const std::string& sourceRoot,
    const std::string& destinationRoot,
    const ImageGeneration& preDump) {
    ImageGeneration generation;
    generation.index = preDump.index + 1;
    generation.sourceImagePath = sourceRoot + "/images/" + std::to_string(generation.index);
    generation.destinationImagePath = destinationRoot + "/images/" + std::to_string(generation.index);
    generation.archiveFileName = "dump.tar.gz";
    generation.prevImagesDir = preDump.sourceImagePath;
    return generation;
}

MigrationOutcome MigrationOutcome::Success(std::chrono::milliseconds downtime) {
    MigrationOutcome outcome;
    outcome.succeeded = true;
    outcome.downtime = downtime;
    return outcome;
}

MigrationOutcome MigrationOutcome::Failure(MigrationError cause, std::chrono::milliseconds downtime) {
    MigrationOutcome outcome;
    outcome.succeeded = false;
    outcome.downtime = downtime;
    outcome.failureCause = std::move(cause);
    return outcome;
}

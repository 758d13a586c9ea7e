#include "CheckpointPipeline.hpp"

#include "Tracing.hpp"

#include <iostream>
#include <utility>

namespace {
MigrationError MakeError(MigrationErrorKind kind, const std::string& step, const std::string& message) {
    MigrationError error;
    error.kind = kind;
    error.step = step;
    error.message = message;
    return error;
}

std::string GenerationLabel(const ImageGeneration& generation) {
    return generation.index < 0 ? "single" : std::to_string(generation.index);
}
} // namespace

CheckpointPipeline::CheckpointPipeline(CheckpointTool tool, ArchiveManager archive, TransferService& transfer)
    : tool_(std::move(tool)),
      archive_(std::move(archive)),
      transfer_(transfer) {}

void CheckpointPipeline::SetStageObserver(StageObserver observer) {
    observer_ = std::move(observer);
}

std::optional<MigrationError> CheckpointPipeline::PrepareDirectory(RemoteExecutor& executor, const std::string& path) const {
    const CommandResult result = executor.Run({"mkdir", "-p", path});
    if (!result.Ok()) {
        std::cerr << "[Pipeline] Error preparing " << path << " on " << executor.Describe() << ": "
                  << result.Describe() << std::endl;
        return MakeError(MigrationErrorKind::SetupError, "prepare " + path, result.Describe());
    }

    return std::nullopt;
}

std::optional<MigrationError> CheckpointPipeline::Checkpoint(
    RemoteExecutor& executor,
    const std::string& containerId,
    const std::string& imagesPath,
    bool preDump,
    const std::optional<std::string>& prevImagesDir) const {
    std::cout << "[Pipeline] Performing the checkpoint predump = " << (preDump ? "true" : "false") << std::endl;

    std::string error;
    if (!tool_.Checkpoint(executor, containerId, imagesPath, preDump, prevImagesDir, error)) {
        std::cerr << "[Pipeline] Error performing checkpoint: " << error << std::endl;
        return MakeError(MigrationErrorKind::CheckpointError, "checkpoint " + imagesPath, error);
    }

    return std::nullopt;
}

std::optional<MigrationError> CheckpointPipeline::Archive(
    RemoteExecutor& executor,
    const std::string& archivePath,
    const std::string& sourceDir) const {
    std::string error;
    if (!archive_.Compress(executor, sourceDir, archivePath, error)) {
        std::cerr << "[Pipeline] Error compressing image in source: " << error << std::endl;
        return MakeError(MigrationErrorKind::ArchiveError, "archive " + archivePath, error);
    }

    return std::nullopt;
}

std::optional<MigrationError> CheckpointPipeline::Transfer(const ResourceLocator& source, const ResourceLocator& destination) const {
    std::cout << "[Pipeline] Copying " << source.ToString() << " to " << destination.ToString() << std::endl;

    std::string error;
    if (!transfer_.Copy(source, destination, error)) {
        std::cerr << "[Pipeline] Error copying image files to dst: " << error << std::endl;
        return MakeError(MigrationErrorKind::TransferError, "transfer " + source.ToString(), error);
    }

    return std::nullopt;
}

std::optional<MigrationError> CheckpointPipeline::Unpack(
    RemoteExecutor& executor,
    const std::string& archivePath,
    const std::string& destDir) const {
    std::cout << "[Pipeline] Preparing image at destination host" << std::endl;

    std::string error;
    if (!archive_.Decompress(executor, archivePath, destDir, error)) {
        std::cerr << "[Pipeline] Error uncompressing image in destination: " << error << std::endl;
        return MakeError(MigrationErrorKind::UnpackError, "unpack " + archivePath, error);
    }

    return std::nullopt;
}

std::optional<MigrationError> CheckpointPipeline::Run(const MigrationPlan& plan, const ImageGeneration& generation) const {
    auto span = Tracer::Instance().StartSpan("migration.generation");
    Tracer::Instance().SetAttribute(span, "container.id", plan.containerId);
    Tracer::Instance().SetAttribute(span, "generation", GenerationLabel(generation));
    Tracer::Instance().SetAttribute(span, "pre_dump", generation.preDump ? "true" : "false");

    auto finish = [&span](std::optional<MigrationError> error) {
        if (error) {
            Tracer::Instance().SetAttribute(span, "error.kind", ToString(error->kind));
        }
        Tracer::Instance().EndSpan(span, !error);
        return error;
    };

    Notify(generation.preDump ? MigrationStage::PRE_DUMPING : MigrationStage::CHECKPOINTING);
    if (auto error = Checkpoint(*plan.source, plan.containerId, generation.sourceImagePath, generation.preDump, generation.prevImagesDir)) {
        return finish(std::move(error));
    }

    const std::string sourceArchive = generation.SourceArchivePath(plan.sourceRoot);
    if (auto error = Archive(*plan.source, sourceArchive, generation.sourceImagePath)) {
        return finish(std::move(error));
    }

    Notify(MigrationStage::TRANSFERRING);
    if (auto error = Transfer(plan.source->Locator(sourceArchive), plan.destination->Locator(generation.destinationImagePath))) {
        return finish(std::move(error));
    }

    if (auto error = Unpack(*plan.destination, generation.DestinationArchivePath(), generation.destinationImagePath)) {
        return finish(std::move(error));
    }

    return finish(std::nullopt);
}

void CheckpointPipeline::Notify(MigrationStage stage) const {
    if (observer_) {
        observer_(stage);
    }
}

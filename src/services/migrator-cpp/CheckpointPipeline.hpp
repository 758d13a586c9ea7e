#pragma once

#include "ArchiveManager.hpp"
#include "CheckpointTool.hpp"
#include "CommandExecutor.hpp"
#include "MigrationTypes.hpp"
#include "TransferService.hpp"

#include <functional>
#include <optional>
#include <string>

// Runs one image generation: checkpoint, archive, transfer, unpack. Every
// step is fatal; the first failure is returned and nothing further runs.
class CheckpointPipeline {
public:
    using StageObserver = std::function<void(MigrationStage)>;

    CheckpointPipeline(CheckpointTool tool, ArchiveManager archive, TransferService& transfer);

    void SetStageObserver(StageObserver observer);

    std::optional<MigrationError> PrepareDirectory(RemoteExecutor& executor, const std::string& path) const;
    std::optional<MigrationError> Checkpoint(
        RemoteExecutor& executor,
        const std::string& containerId,
        const std::string& imagesPath,
        bool preDump,
        const std::optional<std::string>& prevImagesDir) const;
    std::optional<MigrationError> Archive(RemoteExecutor& executor, const std::string& archivePath, const std::string& sourceDir) const;
    std::optional<MigrationError> Transfer(const ResourceLocator& source, const ResourceLocator& destination) const;
    std::optional<MigrationError> Unpack(RemoteExecutor& executor, const std::string& archivePath, const std::string& destDir) const;

    // Checkpoint through unpack for one generation. Directories must already
    // exist on both hosts.
    std::optional<MigrationError> Run(const MigrationPlan& plan, const ImageGeneration& generation) const;

    const CheckpointTool& Tool() const { return tool_; }

private:
    void Notify(MigrationStage stage) const;

    CheckpointTool tool_;
    ArchiveManager archive_;
    TransferService& transfer_;
    StageObserver observer_;
};

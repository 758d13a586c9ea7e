#pragma once

#include "CommandExecutor.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

class CheckpointTool {
public:
    explicit CheckpointTool(std::string runtime = "runc", bool useSudo = true);

    bool Checkpoint(
        RemoteExecutor& executor,
        const std::string& containerId,
        const std::string& imagesPath,
        bool preDump,
        const std::optional<std::string>& prevImagesDir,
        std::string& outError) const;

    std::unique_ptr<ProcessHandle> StartRestore(
        RemoteExecutor& executor,
        const std::string& containerId,
        const std::string& imagesPath,
        const std::string& configFile,
        const std::string& runtimeFile,
        std::string& outError) const;

    std::vector<std::string> BuildCheckpointCommand(
        const std::string& containerId,
        const std::string& imagesPath,
        bool preDump,
        const std::optional<std::string>& prevImagesDir) const;

    std::vector<std::string> BuildRestoreCommand(
        const std::string& containerId,
        const std::string& imagesPath,
        const std::string& configFile,
        const std::string& runtimeFile) const;

private:
    std::vector<std::string> BaseCommand(const std::string& containerId) const;

    std::string runtime_;
    bool useSudo_ = true;
};

#include "CheckpointTool.hpp"

#include <utility>

CheckpointTool::CheckpointTool(std::string runtime, bool useSudo)
    : runtime_(std::move(runtime)),
      useSudo_(useSudo) {}

bool CheckpointTool::Checkpoint(
    RemoteExecutor& executor,
    const std::string& containerId,
    const std::string& imagesPath,
    bool preDump,
    const std::optional<std::string>& prevImagesDir,
    std::string& outError) const {
    if (containerId.empty() || imagesPath.empty()) {
        outError = "missing container id or image path";
        return false;
    }

    const CommandResult result = executor.Run(BuildCheckpointCommand(containerId, imagesPath, preDump, prevImagesDir));
    if (!result.Ok()) {
        outError = result.Describe();
        return false;
    }

    return true;
}

std::unique_ptr<ProcessHandle> CheckpointTool::StartRestore(
    RemoteExecutor& executor,
    const std::string& containerId,
    const std::string& imagesPath,
    const std::string& configFile,
    const std::string& runtimeFile,
    std::string& outError) const {
    if (containerId.empty() || imagesPath.empty()) {
        outError = "missing container id or image path";
        return nullptr;
    }

    auto handle = executor.Start(BuildRestoreCommand(containerId, imagesPath, configFile, runtimeFile), outError);
    if (!handle && outError.empty()) {
        outError = "restore process did not start";
    }
    return handle;
}

std::vector<std::string> CheckpointTool::BuildCheckpointCommand(
    const std::string& containerId,
    const std::string& imagesPath,
    bool preDump,
    const std::optional<std::string>& prevImagesDir) const {
    std::vector<std::string> command = BaseCommand(containerId);
    command.push_back("checkpoint");
    command.push_back("--image-path");
    command.push_back(imagesPath);
    if (preDump) {
        command.push_back("--pre-dump");
    }
    if (prevImagesDir && !prevImagesDir->empty()) {
        command.push_back("--prev-images-dir");
        command.push_back(*prevImagesDir);
    }
    return command;
}

std::vector<std::string> CheckpointTool::BuildRestoreCommand(
    const std::string& containerId,
    const std::string& imagesPath,
    const std::string& configFile,
    const std::string& runtimeFile) const {
    std::vector<std::string> command = BaseCommand(containerId);
    command.push_back("restore");
    command.push_back("--image-path");
    command.push_back(imagesPath);
    command.push_back("--config-file");
    command.push_back(configFile);
    command.push_back("--runtime-file");
    command.push_back(runtimeFile);
    return command;
}

std::vector<std::string> CheckpointTool::BaseCommand(const std::string& containerId) const {
    std::vector<std::string> command;
    if (useSudo_) {
        command.push_back("sudo");
    }
    command.push_back(runtime_);
    command.push_back("--id");
    command.push_back(containerId);
    return command;
}

#include "ArchiveManager.hpp"

ArchiveManager::ArchiveManager(bool useSudo)
    : useSudo_(useSudo) {}

bool ArchiveManager::Compress(RemoteExecutor& executor, const std::string& dir, const std::string& tarPath, std::string& outError) const {
    if (dir.empty() || tarPath.empty()) {
        outError = "missing archive source or target";
        return false;
    }

    return Run(executor, BuildCompressCommand(dir, tarPath), outError);
}

bool ArchiveManager::Decompress(RemoteExecutor& executor, const std::string& tarPath, const std::string& outputDir, std::string& outError) const {
    if (tarPath.empty() || outputDir.empty()) {
        outError = "missing archive or output directory";
        return false;
    }

    return Run(executor, BuildDecompressCommand(tarPath, outputDir), outError);
}

std::vector<std::string> ArchiveManager::BuildCompressCommand(const std::string& dir, const std::string& tarPath) const {
    std::vector<std::string> command;
    if (useSudo_) {
        command.push_back("sudo");
    }
    const std::string sourceDir = (!dir.empty() && dir.back() == '/') ? dir : dir + "/";
    command.insert(command.end(), {"tar", "-czf", tarPath, "-C", sourceDir, "."});
    return command;
}

std::vector<std::string> ArchiveManager::BuildDecompressCommand(const std::string& tarPath, const std::string& outputDir) const {
    std::vector<std::string> command;
    if (useSudo_) {
        command.push_back("sudo");
    }
    command.insert(command.end(), {"tar", "-C", outputDir, "-xvzf", tarPath});
    return command;
}

bool ArchiveManager::Run(RemoteExecutor& executor, const std::vector<std::string>& command, std::string& outError) const {
    const CommandResult result = executor.Run(command);
    if (!result.Ok()) {
        outError = result.Describe();
        return false;
    }

    return true;
}

#pragma once

#include "CommandExecutor.hpp"

#include <string>
#include <vector>

class ArchiveManager {
public:
    explicit ArchiveManager(bool useSudo = true);

    bool Compress(RemoteExecutor& executor, const std::string& dir, const std::string& tarPath, std::string& outError) const;
    bool Decompress(RemoteExecutor& executor, const std::string& tarPath, const std::string& outputDir, std::string& outError) const;

    std::vector<std::string> BuildCompressCommand(const std::string& dir, const std::string& tarPath) const;
    std::vector<std::string> BuildDecompressCommand(const std::string& tarPath, const std::string& outputDir) const;

private:
    bool Run(RemoteExecutor& executor, const std::vector<std::string>& command, std::string& outError) const;

    bool useSudo_ = true;
};

#include "TransferService.hpp"

#include <utility>

ScpTransfer::ScpTransfer(CommandRunner runner)
    : runner_(std::move(runner)) {}

bool ScpTransfer::Copy(const ResourceLocator& source, const ResourceLocator& destination, std::string& outError) {
    if (source.path.empty() || destination.path.empty()) {
        outError = "empty transfer path";
        return false;
    }

    const CommandResult result = Run(BuildCopyCommand(source, destination));
    if (!result.Ok()) {
        outError = result.Describe();
        return false;
    }

    return true;
}

std::vector<std::string> ScpTransfer::BuildCopyCommand(const ResourceLocator& source, const ResourceLocator& destination) {
    if (source.IsLocal() && destination.IsLocal()) {
        return {"cp", "-r", source.path, destination.path};
    }

    std::vector<std::string> command = {"scp", "-r"};
    const std::vector<std::string> options = SshExecutor::ClientOptions();
    command.insert(command.end(), options.begin(), options.end());
    if (!source.IsLocal() && !destination.IsLocal()) {
        // Route remote-to-remote copies through this host.
        command.push_back("-3");
    }

    command.push_back(Operand(source));
    command.push_back(Operand(destination));
    return command;
}

// -P would apply to both ends, so a custom port goes into that end's
// scp:// URI instead.
std::string ScpTransfer::Operand(const ResourceLocator& locator) {
    if (locator.IsLocal() || locator.port <= 0) {
        return locator.ToString();
    }

    std::string uri = "scp://";
    if (!locator.user.empty()) {
        uri += locator.user + "@";
    }
    uri += locator.host + ":" + std::to_string(locator.port);
    // The path keeps its own leading slash so it stays absolute on the far end.
    uri += "/" + locator.path;
    return uri;
}

CommandResult ScpTransfer::Run(const std::vector<std::string>& argv) const {
    if (runner_) {
        return runner_(argv);
    }

    LocalExecutor local;
    return local.Run(argv);
}

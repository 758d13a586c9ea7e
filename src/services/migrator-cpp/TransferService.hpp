#pragma once

#include "CommandExecutor.hpp"

#include <functional>
#include <string>
#include <vector>

class TransferService {
public:
    virtual ~TransferService() = default;

    virtual bool Copy(const ResourceLocator& source, const ResourceLocator& destination, std::string& outError) = 0;
};

// Copies with scp (or cp when both ends are local), run on the local host.
class ScpTransfer : public TransferService {
public:
    using CommandRunner = std::function<CommandResult(const std::vector<std::string>&)>;

    explicit ScpTransfer(CommandRunner runner = CommandRunner());

    bool Copy(const ResourceLocator& source, const ResourceLocator& destination, std::string& outError) override;

    static std::vector<std::string> BuildCopyCommand(const ResourceLocator& source, const ResourceLocator& destination);
    static std::string Operand(const ResourceLocator& locator);

private:
    CommandResult Run(const std::vector<std::string>& argv) const;

    CommandRunner runner_;
};

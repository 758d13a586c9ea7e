#pragma once

#include <memory>
#include <string>
#include <vector>

struct CommandResult {
    int exitCode = -1;
    std::string out;
    std::string err;
    // Set when the command could not be launched or waited on.
    std::string error;

    bool Ok() const { return error.empty() && exitCode == 0; }
    std::string Describe() const;
};

struct ResourceLocator {
    std::string user;
    std::string host;
    int port = 0;
    std::string path;

    bool IsLocal() const { return host.empty(); }
    std::string ToString() const;
};

class ProcessHandle {
public:
    virtual ~ProcessHandle() = default;

    // Blocks until the process exits.
    virtual CommandResult Wait() = 0;
};

class RemoteExecutor {
public:
    virtual ~RemoteExecutor() = default;

    virtual CommandResult Run(const std::vector<std::string>& argv) = 0;
    virtual std::unique_ptr<ProcessHandle> Start(const std::vector<std::string>& argv, std::string& outError) = 0;
    virtual ResourceLocator Locator(const std::string& path) const = 0;
    virtual std::string Describe() const = 0;
};

class LocalExecutor : public RemoteExecutor {
public:
    CommandResult Run(const std::vector<std::string>& argv) override;
    std::unique_ptr<ProcessHandle> Start(const std::vector<std::string>& argv, std::string& outError) override;
    ResourceLocator Locator(const std::string& path) const override;
    std::string Describe() const override;
};

class SshExecutor : public RemoteExecutor {
public:
    SshExecutor(std::string host, std::string user = {}, int port = 0);

    CommandResult Run(const std::vector<std::string>& argv) override;
    std::unique_ptr<ProcessHandle> Start(const std::vector<std::string>& argv, std::string& outError) override;
    ResourceLocator Locator(const std::string& path) const override;
    std::string Describe() const override;

    std::vector<std::string> BuildSshCommand(const std::vector<std::string>& argv) const;

    // Options shared by ssh and scp. A dead peer is dropped after about 15s
    // instead of hanging the caller.
    static std::vector<std::string> ClientOptions();

    static std::string QuoteArgument(const std::string& argument);
    static std::string JoinQuoted(const std::vector<std::string>& argv);

private:
    std::string host_;
    std::string user_;
    int port_ = 0;
    LocalExecutor local_;
};

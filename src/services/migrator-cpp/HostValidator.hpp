#pragma once

#include "CommandExecutor.hpp"
#include "MigrationTypes.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>

// A migration endpoint: ssh://[user@]host[:port]/path or a local absolute path.
struct Endpoint {
    std::string user;
    std::string host;
    int port = 0;
    std::string path;

    bool IsLocal() const { return host.empty(); }
    std::string ToString() const;

    static std::optional<Endpoint> Parse(const std::string& address, std::string& outError);
};

struct ResolvedHosts {
    Endpoint source;
    Endpoint destination;
    std::shared_ptr<RemoteExecutor> sourceExecutor;
    std::shared_ptr<RemoteExecutor> destinationExecutor;
};

class HostValidator {
public:
    using ExecutorFactory = std::function<std::shared_ptr<RemoteExecutor>(const Endpoint&)>;

    explicit HostValidator(ExecutorFactory factory = ExecutorFactory());

    std::optional<ResolvedHosts> Resolve(const std::string& sourceAddress, const std::string& destinationAddress, MigrationError& outError) const;

    static std::shared_ptr<RemoteExecutor> DefaultExecutor(const Endpoint& endpoint);

private:
    bool CheckEndpoint(const Endpoint& endpoint, const std::string& role, MigrationError& outError) const;
    bool CheckReachable(RemoteExecutor& executor, const std::string& role, MigrationError& outError) const;

    ExecutorFactory factory_;
};

#include "HostValidator.hpp"

#include <exception>
#include <utility>

namespace {
constexpr const char* kSshScheme = "ssh://";

MigrationError ValidationFailure(const std::string& step, const std::string& message) {
    MigrationError error;
    error.kind = MigrationErrorKind::ValidationError;
    error.step = step;
    error.message = message;
    return error;
}

bool ParsePort(const std::string& text, int& outPort) {
    try {
        size_t index = 0;
        const int port = std::stoi(text, &index);
        if (index == text.size() && port > 0 && port <= 65535) {
            outPort = port;
            return true;
        }
    } catch (const std::exception&) {
    }

    return false;
}
} // namespace

std::string Endpoint::ToString() const {
    if (IsLocal()) {
        return path;
    }

    std::string text = kSshScheme;
    if (!user.empty()) {
        text += user + "@";
    }
    text += host;
    if (port > 0) {
        text += ":" + std::to_string(port);
    }
    return text + path;
}

std::optional<Endpoint> Endpoint::Parse(const std::string& address, std::string& outError) {
    if (address.empty()) {
        outError = "empty address";
        return std::nullopt;
    }

    Endpoint endpoint;
    if (address.rfind(kSshScheme, 0) != 0) {
        if (address.find("://") != std::string::npos) {
            outError = "unsupported scheme in " + address;
            return std::nullopt;
        }
        endpoint.path = address;
        return endpoint;
    }

    const std::string rest = address.substr(std::string(kSshScheme).size());
    const auto pathStart = rest.find('/');
    if (pathStart == std::string::npos) {
        outError = "missing container path in " + address;
        return std::nullopt;
    }

    std::string authority = rest.substr(0, pathStart);
    endpoint.path = rest.substr(pathStart);

    const auto at = authority.find('@');
    if (at != std::string::npos) {
        endpoint.user = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        if (!ParsePort(authority.substr(colon + 1), endpoint.port)) {
            outError = "invalid port in " + address;
            return std::nullopt;
        }
        authority = authority.substr(0, colon);
    }

    if (authority.empty()) {
        outError = "missing host in " + address;
        return std::nullopt;
    }
    endpoint.host = authority;
    return endpoint;
}

HostValidator::HostValidator(ExecutorFactory factory)
    : factory_(factory ? std::move(factory) : ExecutorFactory(&HostValidator::DefaultExecutor)) {}

std::optional<ResolvedHosts> HostValidator::Resolve(
    const std::string& sourceAddress,
    const std::string& destinationAddress,
    MigrationError& outError) const {
    std::string parseError;
    auto source = Endpoint::Parse(sourceAddress, parseError);
    if (!source) {
        outError = ValidationFailure("src", parseError);
        return std::nullopt;
    }

    auto destination = Endpoint::Parse(destinationAddress, parseError);
    if (!destination) {
        outError = ValidationFailure("dst", parseError);
        return std::nullopt;
    }

    if (!CheckEndpoint(*source, "src", outError) || !CheckEndpoint(*destination, "dst", outError)) {
        return std::nullopt;
    }

    if (source->ToString() == destination->ToString()) {
        outError = ValidationFailure("dst", "source and destination are the same location");
        return std::nullopt;
    }

    ResolvedHosts hosts;
    hosts.source = *source;
    hosts.destination = *destination;
    hosts.sourceExecutor = factory_(hosts.source);
    hosts.destinationExecutor = factory_(hosts.destination);
    if (!hosts.sourceExecutor || !hosts.destinationExecutor) {
        outError = ValidationFailure("executor", "no executor for endpoint");
        return std::nullopt;
    }

    if (!CheckReachable(*hosts.sourceExecutor, "src", outError)
        || !CheckReachable(*hosts.destinationExecutor, "dst", outError)) {
        return std::nullopt;
    }

    return hosts;
}

std::shared_ptr<RemoteExecutor> HostValidator::DefaultExecutor(const Endpoint& endpoint) {
    if (endpoint.IsLocal()) {
        return std::make_shared<LocalExecutor>();
    }
    return std::make_shared<SshExecutor>(endpoint.host, endpoint.user, endpoint.port);
}

bool HostValidator::CheckEndpoint(const Endpoint& endpoint, const std::string& role, MigrationError& outError) const {
    if (endpoint.path.empty() || endpoint.path.front() != '/') {
        outError = ValidationFailure(role, "path must be absolute: " + endpoint.path);
        return false;
    }

    if (MigrationPlan::ContainerIdFromPath(endpoint.path).empty()) {
        outError = ValidationFailure(role, "path does not name a container: " + endpoint.path);
        return false;
    }

    return true;
}

bool HostValidator::CheckReachable(RemoteExecutor& executor, const std::string& role, MigrationError& outError) const {
    const CommandResult result = executor.Run({"true"});
    if (!result.Ok()) {
        outError = ValidationFailure(role, executor.Describe() + " unreachable: " + result.Describe());
        return false;
    }

    return true;
}

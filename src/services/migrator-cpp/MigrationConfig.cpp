#include "MigrationConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    std::cerr << "[Config] Ignoring invalid boolean " << name << "=" << value << std::endl;
    return defaultValue;
}

long long GetEnvMillis(const char* name, long long defaultValue) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return defaultValue;
    }

    try {
        size_t index = 0;
        const long long parsed = std::stoll(value, &index);
        if (index == std::string(value).size() && parsed >= 0) {
            return parsed;
        }
    } catch (const std::exception&) {
    }

    std::cerr << "[Config] Ignoring invalid duration " << name << "=" << value << std::endl;
    return defaultValue;
}

MonitorOptions MigrationConfig::Monitor() const {
    MonitorOptions options;
    options.pollInterval = pollInterval;
    options.timeout = restoreTimeout;
    return options;
}

MigrationConfig MigrationConfig::FromEnvironment() {
    MigrationConfig config;
    config.runtime = GetEnvOrDefault("CMT_RUNTIME", config.runtime);
    config.useSudo = GetEnvBool("CMT_USE_SUDO", config.useSudo);
    config.stateDir = GetEnvOrDefault("CMT_STATE_DIR", config.stateDir);
    config.runningWhenPresent = GetEnvBool("CMT_LIVENESS_RUNNING_WHEN_PRESENT", config.runningWhenPresent);

    const long long interval = GetEnvMillis("CMT_POLL_INTERVAL_MS", config.pollInterval.count());
    if (interval > 0) {
        config.pollInterval = std::chrono::milliseconds(interval);
    }
    config.restoreTimeout = std::chrono::milliseconds(GetEnvMillis("CMT_RESTORE_TIMEOUT_MS", config.restoreTimeout.count()));

    config.reportUrl = GetEnvOrDefault("CMT_REPORT_URL", "");
    config.apiKey = GetEnvOrDefault("CMT_API_KEY", "");

    config.trace.enabled = GetEnvBool("CMT_OTEL_ENABLED", false);
    config.trace.endpoint = GetEnvOrDefault("CMT_OTEL_ENDPOINT", "");
    config.trace.serviceName = GetEnvOrDefault("CMT_OTEL_SERVICE_NAME", "");
    if (config.trace.serviceName.empty()) {
        config.trace.serviceName = "cmt-migrator";
    }
    return config;
}

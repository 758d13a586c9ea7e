#pragma once

#include "CompletionMonitor.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <string>

struct MigrationConfig {
    std::string runtime = "runc";
    bool useSudo = true;
    std::string stateDir = "/var/run/opencontainer/containers";
    bool runningWhenPresent = true;
    std::chrono::milliseconds pollInterval{200};
    std::chrono::milliseconds restoreTimeout{300000};
    std::string reportUrl;
    std::string apiKey;
    TraceConfig trace;

    MonitorOptions Monitor() const;

    static MigrationConfig FromEnvironment();
};

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue);
bool GetEnvBool(const char* name, bool defaultValue);
long long GetEnvMillis(const char* name, long long defaultValue);

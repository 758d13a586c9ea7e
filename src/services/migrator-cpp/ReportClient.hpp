#pragma once

#include "MigrationTypes.hpp"

#include <nlohmann/json.hpp>

#include <string>

struct MigrationReport {
    std::string containerId;
    std::string source;
    std::string destination;
    bool preDump = false;
    MigrationOutcome outcome;
};

// Posts migration outcomes to an external control plane.
class ReportClient {
public:
    explicit ReportClient(std::string url, std::string apiKey = {});

    bool SendOutcome(const MigrationReport& report);

    static nlohmann::json BuildOutcomePayload(const MigrationReport& report);

private:
    std::string url_;
    std::string apiKey_;
};

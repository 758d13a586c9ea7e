#include "ReportClient.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>

#include <chrono>
#include <iostream>
#include <thread>
#include <utility>

namespace {
constexpr int kMaxRetries = 3;
constexpr auto kConnectTimeout = std::chrono::seconds(3);
constexpr auto kRequestTimeout = std::chrono::seconds(5);

bool IsSuccessStatus(const cpr::Response& response) {
    return response.status_code == 200 || response.status_code == 201 || response.status_code == 202;
}

int BackoffSeconds(int attempt) {
    return 1 << attempt;
}

void LogRetry(int attempt) {
    const int waitSeconds = BackoffSeconds(attempt);
    std::cerr << "[Report] Request failed (Attempt " << (attempt + 1) << "/" << kMaxRetries
              << "). Retrying in " << waitSeconds << "s..." << std::endl;
}

cpr::Header BuildHeaders(const std::string& traceparent, const std::string& apiKey) {
    cpr::Header headers{{"Content-Type", "application/json"}};
    if (!traceparent.empty()) {
        headers["traceparent"] = traceparent;
    }
    if (!apiKey.empty()) {
        headers["X-API-Key"] = apiKey;
    }
    return headers;
}
} // namespace

ReportClient::ReportClient(std::string url, std::string apiKey)
    : url_(std::move(url)),
      apiKey_(std::move(apiKey)) {}

bool ReportClient::SendOutcome(const MigrationReport& report) {
    if (url_.empty()) {
        return false;
    }

    const std::string body = BuildOutcomePayload(report).dump();

    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        auto span = Tracer::Instance().StartSpan("migration.report");
        Tracer::Instance().SetAttribute(span, "http.method", "POST");
        Tracer::Instance().SetAttribute(span, "http.url", url_);
        Tracer::Instance().SetAttribute(span, "retry.attempt", static_cast<int64_t>(attempt + 1));

        cpr::Response response = cpr::Post(
            cpr::Url{url_},
            cpr::Body{body},
            BuildHeaders(span.traceparent, apiKey_),
            cpr::ConnectTimeout{kConnectTimeout},
            cpr::Timeout{kRequestTimeout});

        const bool requestOk = response.error.code == cpr::ErrorCode::OK;
        const bool statusOk = IsSuccessStatus(response);
        Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
        Tracer::Instance().EndSpan(span, requestOk && statusOk);

        if (requestOk && statusOk) {
            return true;
        }

        if (attempt + 1 < kMaxRetries) {
            LogRetry(attempt);
            std::this_thread::sleep_for(std::chrono::seconds(BackoffSeconds(attempt)));
            continue;
        }

        if (!requestOk) {
            std::cerr << "[Report] outcome report failed: " << response.error.message << std::endl;
        } else {
            std::cerr << "[Report] outcome report failed with HTTP " << response.status_code << std::endl;
        }
    }

    return false;
}

nlohmann::json ReportClient::BuildOutcomePayload(const MigrationReport& report) {
    const MigrationOutcome& outcome = report.outcome;
    nlohmann::json payload = {
        {"containerId", report.containerId},
        {"source", report.source},
        {"destination", report.destination},
        {"preDump", report.preDump},
        {"status", outcome.succeeded ? "COMPLETED" : "FAILED"},
        {"downtimeMs", outcome.downtime.count()},
        {"progress", {
            {"lastStage", ToString(outcome.progress.lastStage)},
            {"finalCheckpointStarted", outcome.progress.finalCheckpointStarted},
            {"restoreStarted", outcome.progress.restoreStarted}
        }}
    };

    if (outcome.failureCause) {
        payload["error"] = {
            {"kind", ToString(outcome.failureCause->kind)},
            {"step", outcome.failureCause->step},
            {"message", outcome.failureCause->message}
        };
    } else {
        payload["error"] = nullptr;
    }
    return payload;
}

#include "FakeHosts.hpp"
#include "MigrationConfig.hpp"
#include "ReportClient.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <cstdlib>
#include <string>

namespace {
int CheckSuccessPayload() {
    MigrationReport report;
    report.containerId = "web";
    report.source = "ssh://node1/var/lib/cmt/web";
    report.destination = "ssh://node2/srv/web";
    report.preDump = true;
    report.outcome = MigrationOutcome::Success(std::chrono::milliseconds(182));
    report.outcome.progress.lastStage = MigrationStage::COMPLETED;
    report.outcome.progress.finalCheckpointStarted = true;
    report.outcome.progress.restoreStarted = true;

    const nlohmann::json payload = ReportClient::BuildOutcomePayload(report);
    if (payload.value("status", "") != "COMPLETED" || payload.value("downtimeMs", 0) != 182) {
        return Fail("Unexpected success payload: " + payload.dump());
    }
    if (!payload.value("preDump", false) || payload.value("containerId", "") != "web") {
        return Fail("Success payload lost plan fields: " + payload.dump());
    }
    if (!payload["error"].is_null()) {
        return Fail("Success payload must not carry an error: " + payload.dump());
    }
    if (payload["progress"].value("lastStage", "") != "COMPLETED") {
        return Fail("Success payload lost progress: " + payload.dump());
    }

    return 0;
}

int CheckFailurePayload() {
    MigrationError cause;
    cause.kind = MigrationErrorKind::TransferError;
    cause.step = "transfer node1:/var/lib/cmt/web/predump.tar.gz";
    cause.message = "connection reset";

    MigrationReport report;
    report.containerId = "web";
    report.outcome = MigrationOutcome::Failure(cause);
    report.outcome.progress.lastStage = MigrationStage::FAILED;

    const nlohmann::json payload = ReportClient::BuildOutcomePayload(report);
    if (payload.value("status", "") != "FAILED") {
        return Fail("Unexpected failure status: " + payload.dump());
    }
    if (!payload["error"].is_object() || payload["error"].value("kind", "") != "TransferError"
        || payload["error"].value("message", "") != "connection reset") {
        return Fail("Failure payload lost the cause: " + payload.dump());
    }
    if (payload["progress"].value("finalCheckpointStarted", true)) {
        return Fail("Failure payload should show the source untouched: " + payload.dump());
    }

    return 0;
}

int CheckSendWithoutUrl() {
    ReportClient client("");
    MigrationReport report;
    if (client.SendOutcome(report)) {
        return Fail("Reporting without a URL must not claim delivery.");
    }

    return 0;
}

int CheckConfigFromEnvironment() {
    ::setenv("CMT_RUNTIME", "crun", 1);
    ::setenv("CMT_USE_SUDO", "no", 1);
    ::setenv("CMT_POLL_INTERVAL_MS", "50", 1);
    ::setenv("CMT_RESTORE_TIMEOUT_MS", "bogus", 1);
    ::setenv("CMT_LIVENESS_RUNNING_WHEN_PRESENT", "false", 1);

    const MigrationConfig config = MigrationConfig::FromEnvironment();
    if (config.runtime != "crun" || config.useSudo || config.runningWhenPresent) {
        return Fail("Environment overrides were not applied.");
    }
    if (config.Monitor().pollInterval != std::chrono::milliseconds(50)) {
        return Fail("Poll interval override was not applied.");
    }
    if (config.restoreTimeout != std::chrono::milliseconds(300000)) {
        return Fail("An invalid timeout must fall back to the default.");
    }

    ::setenv("CMT_POLL_INTERVAL_MS", "0", 1);
    if (MigrationConfig::FromEnvironment().pollInterval != std::chrono::milliseconds(200)) {
        return Fail("A zero poll interval must keep the default.");
    }

    return 0;
}

int CheckSpanTraceParent() {
    Tracer& tracer = Tracer::Instance();
    TraceConfig config;
    config.serviceName = "cmt-migrator";
    tracer.Configure(config);
    if (tracer.Enabled()) {
        return Fail("Tracing must stay off unless it is enabled.");
    }

    SpanHandle span = tracer.StartSpan("migration.migrate");
    // 00-<32 hex trace id>-<16 hex span id>-01
    if (span.traceparent.size() != 55 || span.traceparent.compare(0, 3, "00-") != 0
        || span.traceparent[35] != '-' || span.traceparent.compare(52, 3, "-01") != 0) {
        return Fail("Malformed traceparent: " + span.traceparent);
    }
    for (size_t i = 3; i < 52; ++i) {
        const char ch = span.traceparent[i];
        const bool hex = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');
        if (i != 35 && !hex) {
            return Fail("Traceparent ids must be lower-case hex: " + span.traceparent);
        }
    }
    if (tracer.StartSpan("migration.generation").traceparent == span.traceparent) {
        return Fail("Each span needs its own trace id.");
    }

    tracer.AddEvent(span, "downtime.start");
    tracer.EndSpan(span, true);
    tracer.EndSpan(span, false);
    if (span.open) {
        return Fail("An ended span must stay closed.");
    }

    tracer.Shutdown();
    return 0;
}
} // namespace

int main() {
    if (int rc = CheckSuccessPayload()) {
        return rc;
    }
    if (int rc = CheckFailurePayload()) {
        return rc;
    }
    if (int rc = CheckSendWithoutUrl()) {
        return rc;
    }
    if (int rc = CheckConfigFromEnvironment()) {
        return rc;
    }
    return CheckSpanTraceParent();
}

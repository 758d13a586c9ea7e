#include "ArchiveManager.hpp"
#include "CheckpointPipeline.hpp"
#include "CheckpointTool.hpp"
#include "CompletionMonitor.hpp"
#include "HostValidator.hpp"
#include "LivenessProbe.hpp"
#include "MigrationConfig.hpp"
#include "MigrationOrchestrator.hpp"
#include "ReportClient.hpp"
#include "Tracing.hpp"
#include "TransferService.hpp"

#include <iostream>
#include <string>

namespace {
constexpr int kExitUsage = 2;

struct MigrateArgs {
    std::string src;
    std::string dst;
    bool preDump = false;
};

void PrintUsage(std::ostream& out) {
    out << "Usage: cmt migrate --src <endpoint> --dst <endpoint> [--pre-dump]\n"
        << "\n"
        << "Migrate a running container.\n"
        << "  --src       Source host where the container is running\n"
        << "  --dst       Target host to migrate the container\n"
        << "  --pre-dump  Perform a pre-dump to minimize downtime\n"
        << "\n"
        << "Endpoints are ssh://[user@]host[:port]/path/<container-id> or a local path."
        << std::endl;
}

// Accepts both "--flag value" and "--flag=value".
bool ParseMigrateArgs(int argc, char** argv, MigrateArgs& outArgs) {
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool hasValue = false;

        const auto equals = arg.find('=');
        if (equals != std::string::npos) {
            value = arg.substr(equals + 1);
            arg = arg.substr(0, equals);
            hasValue = true;
        }

        if (arg == "--pre-dump" || arg == "-pre-dump") {
            outArgs.preDump = !hasValue || value == "true" || value == "1";
            continue;
        }

        if (arg != "--src" && arg != "-src" && arg != "--dst" && arg != "-dst") {
            std::cerr << "[Migrate] Unknown flag: " << arg << std::endl;
            return false;
        }

        if (!hasValue) {
            if (i + 1 >= argc) {
                std::cerr << "[Migrate] Missing value for " << arg << std::endl;
                return false;
            }
            value = argv[++i];
        }

        if (arg == "--src" || arg == "-src") {
            outArgs.src = value;
        } else {
            outArgs.dst = value;
        }
    }

    if (outArgs.src.empty() || outArgs.dst.empty()) {
        std::cerr << "[Migrate] Both --src and --dst are required" << std::endl;
        return false;
    }
    return true;
}

int RunMigrate(const MigrateArgs& args, const MigrationConfig& config) {
    std::cout << "[Migrate] Performing validations" << std::endl;
    HostValidator validator;
    MigrationError validationError;
    auto hosts = validator.Resolve(args.src, args.dst, validationError);
    if (!hosts) {
        std::cerr << "[Migrate] Validation failed: " << validationError.Describe() << std::endl;
        return 1;
    }

    const MigrationPlan plan = MigrationPlan::Create(
        hosts->sourceExecutor,
        hosts->destinationExecutor,
        hosts->source.path,
        hosts->destination.path,
        args.preDump);

    ScpTransfer transfer;
    CheckpointPipeline pipeline(CheckpointTool(config.runtime, config.useSudo), ArchiveManager(config.useSudo), transfer);
    MigrationOrchestrator orchestrator(
        pipeline,
        LivenessProbe(config.stateDir, config.runningWhenPresent),
        CompletionMonitor(config.Monitor()));

    const MigrationOutcome outcome = orchestrator.Migrate(plan);

    if (!config.reportUrl.empty()) {
        MigrationReport report;
        report.containerId = plan.containerId;
        report.source = hosts->source.ToString();
        report.destination = hosts->destination.ToString();
        report.preDump = plan.preDumpEnabled;
        report.outcome = outcome;

        ReportClient reporter(config.reportUrl, config.apiKey);
        if (!reporter.SendOutcome(report)) {
            std::cerr << "[Report] Outcome was not delivered to " << config.reportUrl << std::endl;
        }
    }

    if (!outcome.succeeded && outcome.progress.finalCheckpointStarted && !outcome.progress.restoreStarted) {
        std::cerr << "[Migrate] Container " << plan.containerId << " may be stopped on "
                  << plan.source->Describe() << " with no restore in progress" << std::endl;
    }

    return outcome.succeeded ? 0 : 1;
}
} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h") {
        PrintUsage(std::cout);
        return 0;
    }
    if (command != "migrate") {
        std::cerr << "[Migrate] Unknown command: " << command << std::endl;
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    MigrateArgs args;
    if (!ParseMigrateArgs(argc, argv, args)) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    const MigrationConfig config = MigrationConfig::FromEnvironment();
    Tracer::Instance().Configure(config.trace);
    if (Tracer::Instance().Enabled()) {
        std::cout << "[Migrate] Exporting traces to " << (config.trace.endpoint.empty() ? "default OTLP endpoint" : config.trace.endpoint) << std::endl;
    }

    const int status = RunMigrate(args, config);
    Tracer::Instance().Shutdown();
    return status;
}

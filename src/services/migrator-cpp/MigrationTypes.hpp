#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

class RemoteExecutor;

enum class MigrationErrorKind {
    SetupError,
    CheckpointError,
    ArchiveError,
    TransferError,
    UnpackError,
    RestoreLaunchError,
    RestoreFailure,
    RestoreTimeout,
    ValidationError
};

struct MigrationError {
    MigrationErrorKind kind = MigrationErrorKind::SetupError;
    std::string step;
    std::string message;

    std::string Describe() const;
};

std::string ToString(MigrationErrorKind kind);

enum class MigrationStage {
    IDLE,
    PREPARING,
    PRE_DUMPING,
    CHECKPOINTING,
    TRANSFERRING,
    RESTORING,
    MONITORING,
    COMPLETED,
    FAILED
};

std::string ToString(MigrationStage stage);

struct MigrationPlan {
    std::shared_ptr<RemoteExecutor> source;
    std::shared_ptr<RemoteExecutor> destination;
    std::string sourceRoot;
    std::string destinationRoot;
    std::string containerId;
    bool preDumpEnabled = false;

    static MigrationPlan Create(
        std::shared_ptr<RemoteExecutor> source,
        std::shared_ptr<RemoteExecutor> destination,
        const std::string& sourceRoot,
        const std::string& destinationRoot,
        bool preDumpEnabled);

    static std::string ContainerIdFromPath(const std::string& path);
};

// One checkpoint pass. index is -1 for the single-pass layout.
struct ImageGeneration {
    int index = -1;
    std::string sourceImagePath;
    std::string destinationImagePath;
    std::string archiveFileName;
    bool preDump = false;
    std::optional<std::string> prevImagesDir;

    std::string SourceArchivePath(const std::string& sourceRoot) const;
    std::string DestinationArchivePath() const;

    static ImageGeneration Single(const std::string& sourceRoot, const std::string& destinationRoot);
    static ImageGeneration PreDump(const std::string& sourceRoot, const std::string& destinationRoot);
    static ImageGeneration Final(
        const std::string& sourceRoot,
        const std::string& destinationRoot,
        const ImageGeneration& preDump);
};

struct MigrationProgress {
    MigrationStage lastStage = MigrationStage::IDLE;
    bool finalCheckpointStarted = false;
    bool restoreStarted = false;
};

struct MigrationOutcome {
    bool succeeded = false;
    std::chrono::milliseconds downtime{0};
    std::optional<MigrationError> failureCause;
    MigrationProgress progress;

    static MigrationOutcome Success(std::chrono::milliseconds downtime);
    static MigrationOutcome Failure(MigrationError cause, std::chrono::milliseconds downtime = std::chrono::milliseconds{0});
};

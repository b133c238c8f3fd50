/**
 * @file backup_pipeline.hpp
 * @brief Orchestration of one backup run.
 *
 * A run walks a strictly sequential state machine:
 *
 *   Pending -> CredentialsLoaded -> Probed -> Exported -> ExportValidated
 *           -> Compressed -> Committed -> ReVerified
 *
 * and moves to Failed from any state. Each step failure is terminal for the run: the
 * scratch files of the run are removed, the health record is set to unhealthy, and the
 * error is logged and returned. The daemon itself keeps running. A successful run also
 * removes exports of its kind that interrupted runs left in the scratch directory.
 */

#ifndef BACKUP_PIPELINE_HPP
#define BACKUP_PIPELINE_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include "artifact_validator.hpp"
#include "backup_types.hpp"
#include "clock.hpp"
#include "credential_source.hpp"
#include "export_client.hpp"
#include "health_state.hpp"
#include "retention_store.hpp"
#include "structured_log.hpp"

enum class PipelineStage {
    Pending,
    CredentialsLoaded,
    Probed,
    Exported,
    ExportValidated,
    Compressed,
    Committed,
    ReVerified,
    Failed
};

std::string toString(PipelineStage stage);

/**
 * @brief Summary of a successful run.
 */
struct BackupRunReport {
    BackupKind kind = BackupKind::Nightly;
    std::string runId;
    PipelineStage stage = PipelineStage::Pending;
    std::uint64_t exportBytes = 0;        ///< Size of the raw export.
    std::uint64_t compressedBytes = 0;    ///< Size of the committed gzip artifact.
    std::chrono::milliseconds duration{0};
    std::filesystem::path slotPath;
};

/**
 * @brief Settings of the pipeline that are not owned by a collaborator.
 */
struct PipelineOptions {
    std::filesystem::path scratchDir;     ///< Must share a filesystem with the backup root.
    std::string exportExtension = "surql";
    int compressionLevel = 9;
    bool rollbackOnCorruption = true;     ///< Restore the replaced artifact if re-verification fails.
};

/**
 * @brief Runs backups of either kind. Safe to call concurrently for different kinds.
 */
class BackupPipeline {
public:
    BackupPipeline(CredentialSource& credentials, ExportClient& exportClient, const ArtifactValidator& validator,
                   RetentionStore& retention, HealthState& health, Clock& clock, const StructuredLogger& logger,
                   PipelineOptions options);

    /**
     * @brief Executes one backup run of the given kind.
     *
     * @param kind Slot to refresh.
     * @return std::expected<BackupRunReport, BackupError> The run summary, or the error that failed the run;
     *         its message names the last stage the run reached.
     */
    std::expected<BackupRunReport, BackupError> run(BackupKind kind);

private:
    std::string nextRunId();
    void setHealth(HealthStatus status);

    /// Removes exports of this kind left in the scratch directory by interrupted runs.
    void sweepScratch(const std::string& type);

    CredentialSource& credentials;
    ExportClient& exportClient;
    const ArtifactValidator& validator;
    RetentionStore& retention;
    HealthState& health;
    Clock& clock;
    const StructuredLogger& logger;
    PipelineOptions options;
    std::atomic<std::uint64_t> runCounter{0};
};

#endif // BACKUP_PIPELINE_HPP

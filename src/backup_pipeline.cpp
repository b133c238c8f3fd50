#include "backup_pipeline.hpp"
#include "gzip_codec.hpp"
#include <fmt/format.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "db-backup";

} // namespace

std::string toString(PipelineStage stage) {
    switch (stage) {
    case PipelineStage::Pending:
        return "Pending";
    case PipelineStage::CredentialsLoaded:
        return "CredentialsLoaded";
    case PipelineStage::Probed:
        return "Probed";
    case PipelineStage::Exported:
        return "Exported";
    case PipelineStage::ExportValidated:
        return "ExportValidated";
    case PipelineStage::Compressed:
        return "Compressed";
    case PipelineStage::Committed:
        return "Committed";
    case PipelineStage::ReVerified:
        return "ReVerified";
    case PipelineStage::Failed:
        return "Failed";
    }
    return "Unknown";
}

BackupPipeline::BackupPipeline(CredentialSource& credentials, ExportClient& exportClient,
                               const ArtifactValidator& validator, RetentionStore& retention, HealthState& health,
                               Clock& clock, const StructuredLogger& logger, PipelineOptions options)
    : credentials(credentials),
      exportClient(exportClient),
      validator(validator),
      retention(retention),
      health(health),
      clock(clock),
      logger(logger),
      options(std::move(options)) {}

std::string BackupPipeline::nextRunId() {
    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(clock.now().time_since_epoch()).count();
    return fmt::format("{}_{}_{}", epochMs, ::getpid(), ++runCounter);
}

void BackupPipeline::sweepScratch(const std::string& type) {
    const std::string prefix = fmt::format("{}_", type);
    const std::string exportSuffix = fmt::format(".{}", options.exportExtension);
    const std::string compressedSuffix = fmt::format("{}.gz", exportSuffix);

    std::error_code ec;
    for (fs::directory_iterator it(options.scratchDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (!name.starts_with(prefix) || !(name.ends_with(exportSuffix) || name.ends_with(compressedSuffix))) {
            continue;
        }
        std::error_code removeError;
        if (fs::remove(it->path(), removeError)) {
            logger.info(kComponent, fmt::format("Removed leftover scratch file {}", it->path().string()));
        } else if (removeError) {
            logger.warn(kComponent, fmt::format("Failed to remove leftover scratch file {}: {}",
                                                it->path().string(), removeError.message()));
        }
    }
    if (ec) {
        logger.warn(kComponent, fmt::format("Failed to scan scratch directory {}: {}",
                                            options.scratchDir.string(), ec.message()));
    }
}

void BackupPipeline::setHealth(HealthStatus status) {
    if (!health.update(status, clock.now())) {
        logger.warn(kComponent, fmt::format("Failed to write health snapshot: {}", health.mirrorFile()));
    }
}

std::expected<BackupRunReport, BackupError> BackupPipeline::run(BackupKind kind) {
    const auto start = clock.now();
    const std::string type = toString(kind);

    BackupRunReport report;
    report.kind = kind;
    report.runId = nextRunId();
    report.slotPath = retention.path(kind);

    const fs::path scratch = options.scratchDir / fmt::format("{}_{}.{}", type, report.runId, options.exportExtension);
    fs::path compressed = scratch;
    compressed += ".gz";

    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - start);
    };

    auto cleanup = [&] {
        for (const auto& file : {scratch, compressed}) {
            std::error_code ec;
            fs::remove(file, ec);
            if (ec) {
                logger.warn(kComponent, fmt::format("Failed to remove scratch file {}: {}",
                                                    file.string(), ec.message()));
            }
        }
    };

    auto fail = [&](const BackupError& cause, const std::string& message) -> std::expected<BackupRunReport, BackupError> {
        BackupError error{cause.code, fmt::format("{} [last stage: {}]", cause.message, toString(report.stage))};
        cleanup();
        setHealth(HealthStatus::Unhealthy);
        BackupEvent event{type, "failed", elapsed().count(), std::nullopt, std::nullopt};
        if (report.exportBytes > 0) {
            event.fileSizeBytes = static_cast<std::int64_t>(report.exportBytes);
        }
        if (report.compressedBytes > 0) {
            event.compressedSizeBytes = static_cast<std::int64_t>(report.compressedBytes);
        }
        logger.log(LogLevel::Error, kComponent, fmt::format("{}: {}", message, error.describe()), event);
        return std::unexpected(error);
    };

    setHealth(HealthStatus::Running);
    logger.log(LogLevel::Info, kComponent, fmt::format("Starting {} backup",
                                                       type), BackupEvent{type, "started", {}, {}, {}});

    auto creds = credentials.load();
    if (!creds) {
        return fail(creds.error(), "Failed to read credentials");
    }
    report.stage = PipelineStage::CredentialsLoaded;

    if (!exportClient.probe()) {
        return fail(BackupError{BackupErrorCode::DatabaseUnreachable, "database health check did not succeed"},
                    "Pre-backup health check failed");
    }
    report.stage = PipelineStage::Probed;
    logger.info(kComponent, "Database health check passed");

    std::error_code ec;
    fs::create_directories(options.scratchDir, ec);
    if (ec) {
        return fail(BackupError{BackupErrorCode::ExportFailed,
                        fmt::format("cannot create scratch directory {}: {}",
                                    options.scratchDir.string(), ec.message())},
                    "Export command failed");
    }
    if (auto exported = exportClient.exportTo(*creds, scratch.string()); !exported) {
        return fail(exported.error(), "Export command failed");
    }
    report.stage = PipelineStage::Exported;

    if (auto valid = validator.validateExport(scratch.string()); !valid) {
        return fail(valid.error(), "Export validation failed");
    }
    report.exportBytes = fs::file_size(scratch, ec);
    if (ec) {
        report.exportBytes = 0;
    }
    report.stage = PipelineStage::ExportValidated;
    logger.info(kComponent, "Export file validation passed");

    auto compressedSize = compressFile(scratch.string(), compressed.string(), options.compressionLevel);
    if (!compressedSize) {
        return fail(compressedSize.error(), "Compression failed");
    }
    report.compressedBytes = *compressedSize;
    fs::remove(scratch, ec);
    report.stage = PipelineStage::Compressed;

    if (auto committed = retention.commit(kind, compressed, options.rollbackOnCorruption); !committed) {
        if (retention.canRollback(kind)) {
            if (auto rolledBack = retention.rollback(kind); !rolledBack) {
                logger.error(kComponent, fmt::format("Rollback failed: {}", rolledBack.error().describe()));
            }
        }
        return fail(committed.error(), "Failed to move backup to final location");
    }
    report.stage = PipelineStage::Committed;

    if (auto verified = validator.validateCompressed(report.slotPath.string()); !verified) {
        std::string detail = verified.error().message;
        if (options.rollbackOnCorruption) {
            if (auto rolledBack = retention.rollback(kind); rolledBack) {
                detail += fmt::format("; previous {} backup restored", type);
            } else {
                detail += fmt::format("; rollback failed: {}", rolledBack.error().message);
            }
        }
        return fail(BackupError{BackupErrorCode::PostCommitCorruption, detail}, "Post-backup integrity check failed");
    }
    retention.discardShadow(kind);
    report.stage = PipelineStage::ReVerified;

    cleanup();
    sweepScratch(type);
    report.duration = elapsed();
    setHealth(HealthStatus::Healthy);
    logger.log(LogLevel::Info, kComponent, fmt::format("{} backup completed successfully", type),
               BackupEvent{type, "success", report.duration.count(),
                           static_cast<std::int64_t>(report.exportBytes),
                           static_cast<std::int64_t>(report.compressedBytes)});
    return report;
}

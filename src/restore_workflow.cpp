#include "restore_workflow.hpp"
#include "gzip_codec.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <istream>
#include <ostream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "restore";

/// Removes a scratch file when the restore leaves scope, whatever the outcome.
class ScratchGuard {
public:
    ScratchGuard(fs::path path, const StructuredLogger& logger) : path(std::move(path)), logger(logger) {}

    ~ScratchGuard() {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            logger.warn(kComponent, fmt::format("Failed to remove scratch file {}: {}", path.string(), ec.message()));
        }
    }

    ScratchGuard(const ScratchGuard&) = delete;
    ScratchGuard& operator=(const ScratchGuard&) = delete;

private:
    fs::path path;
    const StructuredLogger& logger;
};

} // namespace

std::string toString(RestoreOutcome outcome) {
    switch (outcome) {
    case RestoreOutcome::Verified:
        return "verified";
    case RestoreOutcome::Restored:
        return "restored";
    case RestoreOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

RestoreWorkflow::RestoreWorkflow(const RetentionStore& retention, const ArtifactValidator& validator,
                                 CredentialSource& credentials, ExportClient& exportClient, Clock& clock,
                                 const StructuredLogger& logger, fs::path scratchDir, std::string exportExtension)
    : retention(retention),
      validator(validator),
      credentials(credentials),
      exportClient(exportClient),
      clock(clock),
      logger(logger),
      scratchDir(std::move(scratchDir)),
      exportExtension(std::move(exportExtension)) {}

fs::path RestoreWorkflow::scratchPath(BackupKind kind) const {
    auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(clock.now().time_since_epoch()).count();
    return scratchDir / fmt::format("restore_{}_{}_{}.{}", toString(kind), epochMs, ::getpid(), exportExtension);
}

bool RestoreWorkflow::confirm(BackupKind kind, std::istream& in, std::ostream& out) const {
    out << "WARNING: This will restore the database from the " << toString(kind) << " backup.\n"
        << "All data written since that backup will be lost.\n"
        << "Type 'yes' to continue: " << std::flush;

    std::string answer;
    if (!std::getline(in, answer)) {
        return false;
    }
    // Surrounding whitespace is rejected; only a CRLF terminal's carriage return is dropped.
    if (!answer.empty() && answer.back() == '\r') {
        answer.pop_back();
    }
    std::transform(answer.begin(), answer.end(), answer.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return answer == "yes";
}

std::expected<RestoreReport, BackupError> RestoreWorkflow::restore(const RestoreRequest& request, std::istream& in,
                                                                   std::ostream& out) {
    const auto start = clock.now();
    const std::string type = toString(request.kind);

    RestoreReport report;
    report.slotPath = retention.path(request.kind);

    auto elapsed = [&] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock.now() - start);
    };
    auto fail = [&](const BackupError& error) -> std::expected<RestoreReport, BackupError> {
        logger.log(LogLevel::Error, kComponent, fmt::format("Restore of {} backup failed: {}", type, error.describe()),
                   BackupEvent{type, "restore_failed", elapsed().count(), std::nullopt, std::nullopt});
        return std::unexpected(error);
    };

    SlotInfo slot = retention.stat(request.kind);
    if (!slot.exists) {
        return fail(BackupError{BackupErrorCode::SlotEmpty,
            fmt::format("no {} backup at {}", type, report.slotPath.string())});
    }
    report.compressedBytes = slot.sizeBytes;

    if (auto intact = validator.validateCompressed(report.slotPath.string()); !intact) {
        return fail(intact.error());
    }
    logger.info(kComponent, fmt::format("Backup file integrity verified: {}", report.slotPath.string()));

    if (!request.verifyOnly && !request.force && !confirm(request.kind, in, out)) {
        logger.info(kComponent, fmt::format("Restore of {} backup cancelled by operator", type));
        report.outcome = RestoreOutcome::Cancelled;
        report.duration = elapsed();
        return report;
    }

    std::error_code ec;
    fs::create_directories(scratchDir, ec);
    if (ec) {
        return fail(BackupError{BackupErrorCode::CorruptArchive,
                                fmt::format("cannot create scratch directory {}: {}",
                                            scratchDir.string(), ec.message())});
    }

    const fs::path scratch = scratchPath(request.kind);
    ScratchGuard guard(scratch, logger);

    auto restoredBytes = decompressFile(report.slotPath.string(), scratch.string());
    if (!restoredBytes) {
        return fail(restoredBytes.error());
    }
    report.restoredBytes = *restoredBytes;

    if (auto valid = validator.validateExport(scratch.string()); !valid) {
        return fail(valid.error());
    }

    if (request.verifyOnly) {
        report.outcome = RestoreOutcome::Verified;
        report.duration = elapsed();
        logger.log(LogLevel::Info, kComponent, fmt::format("Verification of {} backup passed", type),
                   BackupEvent{type, "verified", report.duration.count(),
                               static_cast<std::int64_t>(report.restoredBytes),
                               static_cast<std::int64_t>(report.compressedBytes)});
        return report;
    }

    auto creds = credentials.load();
    if (!creds) {
        return fail(creds.error());
    }

    logger.log(LogLevel::Info, kComponent, fmt::format("Starting restore of {} backup", type),
               BackupEvent{type, "restore_started", std::nullopt, std::nullopt, std::nullopt});
    if (auto imported = exportClient.importFrom(*creds, scratch.string()); !imported) {
        return fail(imported.error());
    }

    report.outcome = RestoreOutcome::Restored;
    report.duration = elapsed();
    logger.log(LogLevel::Info, kComponent, fmt::format("Restore of {} backup completed successfully", type),
               BackupEvent{type, "restored", report.duration.count(),
                           static_cast<std::int64_t>(report.restoredBytes),
                           static_cast<std::int64_t>(report.compressedBytes)});
    return report;
}

/**
 * @file restore_workflow.hpp
 * @brief Restores the live database from one retention slot.
 *
 * The workflow only ever reads the slot. The decompressed export lives in a scratch file
 * that is removed on every path, so an interrupted or failed restore leaves the backup
 * history unchanged.
 */

#ifndef RESTORE_WORKFLOW_HPP
#define RESTORE_WORKFLOW_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <iosfwd>
#include <string>
#include "artifact_validator.hpp"
#include "backup_types.hpp"
#include "clock.hpp"
#include "credential_source.hpp"
#include "export_client.hpp"
#include "retention_store.hpp"
#include "structured_log.hpp"

struct RestoreRequest {
    BackupKind kind = BackupKind::Nightly;
    bool force = false;        ///< Skip the interactive confirmation.
    bool verifyOnly = false;   ///< Check the slot and stop; touches no data.
};

enum class RestoreOutcome {
    Verified,   ///< verifyOnly run passed.
    Restored,   ///< The database was imported from the slot.
    Cancelled   ///< The operator declined the confirmation.
};

std::string toString(RestoreOutcome outcome);

struct RestoreReport {
    RestoreOutcome outcome = RestoreOutcome::Cancelled;
    std::filesystem::path slotPath;
    std::uint64_t compressedBytes = 0;   ///< Size of the slot file.
    std::uint64_t restoredBytes = 0;     ///< Size of the decompressed export (0 if not decompressed).
    std::chrono::milliseconds duration{0};
};

class RestoreWorkflow {
public:
    /**
     * @brief Constructs a restore workflow.
     *
     * @param retention Slots to read from.
     * @param validator Checks applied to the slot and to the decompressed export.
     * @param credentials Source of the database credentials, loaded only after confirmation.
     * @param exportClient Client performing the import.
     * @param clock Time source for the report.
     * @param logger Event log.
     * @param scratchDir Directory for the decompressed export.
     * @param exportExtension Extension of the decompressed export ("surql").
     */
    RestoreWorkflow(const RetentionStore& retention, const ArtifactValidator& validator,
                    CredentialSource& credentials, ExportClient& exportClient, Clock& clock,
                    const StructuredLogger& logger, std::filesystem::path scratchDir, std::string exportExtension);

    /**
     * @brief Runs a restore or a verification.
     *
     * Unless request.force is set, the operator is asked on @p out to type "yes" on @p in
     * before anything is decompressed or imported.
     *
     * @param request Slot and mode.
     * @param in Source of the operator's confirmation.
     * @param out Destination of the confirmation prompt.
     * @return std::expected<RestoreReport, BackupError> The outcome, or SlotEmpty, CorruptArchive,
     *         EmptyArtifact, MalformedArtifact, CredentialsUnavailable or ImportFailed.
     */
    std::expected<RestoreReport, BackupError> restore(const RestoreRequest& request, std::istream& in,
                                                      std::ostream& out);

private:
    bool confirm(BackupKind kind, std::istream& in, std::ostream& out) const;
    std::filesystem::path scratchPath(BackupKind kind) const;

    const RetentionStore& retention;
    const ArtifactValidator& validator;
    CredentialSource& credentials;
    ExportClient& exportClient;
    Clock& clock;
    const StructuredLogger& logger;
    std::filesystem::path scratchDir;
    std::string exportExtension;
};

#endif // RESTORE_WORKFLOW_HPP

/**
 * @file backup_types.hpp
 * @brief Core value types shared by the RollingVault backup and restore components.
 *
 * Defines the backup kinds that map onto retention slots, the health status values,
 * the error taxonomy reported by every pipeline step, and the retry policy used for
 * bounded waits against external collaborators.
 */

#ifndef BACKUP_TYPES_HPP
#define BACKUP_TYPES_HPP

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Kind of backup run. Each kind owns exactly one retention slot.
 */
enum class BackupKind {
    Nightly,
    Weekly
};

/// Both kinds, in slot order.
inline constexpr std::array<BackupKind, 2> kAllBackupKinds{BackupKind::Nightly, BackupKind::Weekly};

/**
 * @brief Returns the lowercase name of a backup kind ("nightly" or "weekly").
 */
std::string toString(BackupKind kind);

/**
 * @brief Parses a backup kind name.
 *
 * @param name "nightly" or "weekly" (exact, lowercase).
 * @return std::optional<BackupKind> The kind, or std::nullopt for any other input.
 */
std::optional<BackupKind> parseBackupKind(std::string_view name);

/**
 * @brief Status of the most recent backup run as seen by the health endpoint.
 */
enum class HealthStatus {
    Starting,  ///< No run has completed since the daemon started.
    Running,   ///< A run is in progress.
    Healthy,   ///< The most recent run succeeded.
    Unhealthy  ///< The most recent run failed.
};

std::string toString(HealthStatus status);

/**
 * @brief Error taxonomy for backup and restore operations.
 */
enum class BackupErrorCode {
    CredentialsUnavailable,
    DatabaseUnreachable,
    ExportFailed,
    EmptyArtifact,
    MalformedArtifact,
    CompressionFailed,
    CorruptArchive,
    CommitFailed,
    PostCommitCorruption,
    ImportFailed,
    SlotEmpty,
    InvalidRequest
};

std::string toString(BackupErrorCode code);

/**
 * @brief Error value carried through std::expected by every component.
 */
struct BackupError {
    BackupErrorCode code;  ///< Taxonomy entry.
    std::string message;   ///< Human-readable context (paths, errno text, exit codes).

    /// "<Code>: <message>", used for log lines and CLI output.
    std::string describe() const;
};

/**
 * @brief Bounded retry policy for calls against external collaborators.
 *
 * A policy with N attempts performs at most N calls and sleeps `backoff` between
 * consecutive attempts (never after the last one).
 */
struct RetryPolicy {
    int attempts = 3;
    std::chrono::milliseconds backoff{std::chrono::seconds(5)};
};

#endif // BACKUP_TYPES_HPP

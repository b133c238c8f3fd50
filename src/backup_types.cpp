#include "backup_types.hpp"
#include <fmt/format.h>

std::string toString(BackupKind kind) {
    switch (kind) {
    case BackupKind::Nightly:
        return "nightly";
    case BackupKind::Weekly:
        return "weekly";
    }
    return "unknown";
}

std::optional<BackupKind> parseBackupKind(std::string_view name) {
    if (name == "nightly") {
        return BackupKind::Nightly;
    }
    if (name == "weekly") {
        return BackupKind::Weekly;
    }
    return std::nullopt;
}

std::string toString(HealthStatus status) {
    switch (status) {
    case HealthStatus::Starting:
        return "starting";
    case HealthStatus::Running:
        return "running";
    case HealthStatus::Healthy:
        return "healthy";
    case HealthStatus::Unhealthy:
        return "unhealthy";
    }
    return "unknown";
}

std::string toString(BackupErrorCode code) {
    switch (code) {
    case BackupErrorCode::CredentialsUnavailable:
        return "CredentialsUnavailable";
    case BackupErrorCode::DatabaseUnreachable:
        return "DatabaseUnreachable";
    case BackupErrorCode::ExportFailed:
        return "ExportFailed";
    case BackupErrorCode::EmptyArtifact:
        return "EmptyArtifact";
    case BackupErrorCode::MalformedArtifact:
        return "MalformedArtifact";
    case BackupErrorCode::CompressionFailed:
        return "CompressionFailed";
    case BackupErrorCode::CorruptArchive:
        return "CorruptArchive";
    case BackupErrorCode::CommitFailed:
        return "CommitFailed";
    case BackupErrorCode::PostCommitCorruption:
        return "PostCommitCorruption";
    case BackupErrorCode::ImportFailed:
        return "ImportFailed";
    case BackupErrorCode::SlotEmpty:
        return "SlotEmpty";
    case BackupErrorCode::InvalidRequest:
        return "InvalidRequest";
    }
    return "Unknown";
}

std::string BackupError::describe() const {
    if (message.empty()) {
        return toString(code);
    }
    return fmt::format("{}: {}", toString(code), message);
}

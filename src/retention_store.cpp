#include "retention_store.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::size_t slotIndex(BackupKind kind) {
    return kind == BackupKind::Nightly ? 0 : 1;
}

bool syncPath(const fs::path& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

} // namespace

RetentionStore::RetentionStore(fs::path backupRoot, fs::path shadowDir, std::string exportExtension)
    : backupRoot(std::move(backupRoot)), shadowDir(std::move(shadowDir)), exportExtension(std::move(exportExtension)) {}

fs::path RetentionStore::path(BackupKind kind) const {
    return backupRoot / fmt::format("{}_backup.{}.gz", toString(kind), exportExtension);
}

fs::path RetentionStore::shadowPath(BackupKind kind) const {
    return shadowDir / fmt::format("{}_backup.{}.gz.shadow", toString(kind), exportExtension);
}

SlotInfo RetentionStore::stat(BackupKind kind) const {
    SlotInfo info;
    std::error_code ec;
    auto status = fs::status(path(kind), ec);
    if (ec || !fs::is_regular_file(status)) {
        return info;
    }
    auto size = fs::file_size(path(kind), ec);
    if (ec) {
        return info;
    }
    info.exists = true;
    info.sizeBytes = size;
    info.lastWrite = fs::last_write_time(path(kind), ec);
    return info;
}

std::expected<void, BackupError> RetentionStore::commit(BackupKind kind, const fs::path& artifactPath, bool keepShadow) {
    std::error_code ec;
    if (!fs::is_regular_file(artifactPath, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("Artifact does not exist: {}", artifactPath.string())});
    }
    if (!syncPath(artifactPath, O_RDONLY)) {
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("Failed to flush artifact {}: {}", artifactPath.string(), std::strerror(errno))});
    }

    fs::create_directories(backupRoot, ec);
    const fs::path slot = path(kind);
    const fs::path shadow = shadowPath(kind);
    rollbackArmed[slotIndex(kind)] = false;
    fs::remove(shadow, ec);

    if (keepShadow && fs::is_regular_file(slot, ec)) {
        fs::create_directories(shadowDir, ec);
        if (::link(slot.c_str(), shadow.c_str()) != 0) {
            return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
                fmt::format("Failed to keep shadow of {}: {}", slot.string(), std::strerror(errno))});
        }
    }

    fs::rename(artifactPath, slot, ec);
    if (ec) {
        fs::remove(shadow, ec);
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("Failed to move backup to final location {}: {}", slot.string(), ec.message())});
    }
    rollbackArmed[slotIndex(kind)] = keepShadow;

    // The rename is durable only once the directory entry is on disk.
    if (!syncPath(backupRoot, O_RDONLY | O_DIRECTORY)) {
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("Backup moved to {} but flushing {} failed: {}",
                        slot.string(), backupRoot.string(), std::strerror(errno))});
    }
    return {};
}

std::expected<void, BackupError> RetentionStore::rollback(BackupKind kind) {
    if (!rollbackArmed[slotIndex(kind)]) {
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("No commit to roll back for {}", toString(kind))});
    }
    rollbackArmed[slotIndex(kind)] = false;

    std::error_code ec;
    const fs::path slot = path(kind);
    const fs::path shadow = shadowPath(kind);
    if (fs::is_regular_file(shadow, ec)) {
        fs::rename(shadow, slot, ec);
        if (ec) {
            return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
                fmt::format("Failed to restore previous {} backup: {}", toString(kind), ec.message())});
        }
    } else {
        fs::remove(slot, ec);
        if (ec) {
            return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
                fmt::format("Failed to remove rejected {} backup: {}", toString(kind), ec.message())});
        }
    }
    if (!syncPath(backupRoot, O_RDONLY | O_DIRECTORY)) {
        return std::unexpected(BackupError{BackupErrorCode::CommitFailed,
            fmt::format("Rolled back {} backup but flushing {} failed: {}",
                        toString(kind), backupRoot.string(), std::strerror(errno))});
    }
    return {};
}

bool RetentionStore::canRollback(BackupKind kind) const {
    return rollbackArmed[slotIndex(kind)];
}

void RetentionStore::discardShadow(BackupKind kind) {
    rollbackArmed[slotIndex(kind)] = false;
    std::error_code ec;
    fs::remove(shadowPath(kind), ec);
}

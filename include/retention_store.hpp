/**
 * @file retention_store.hpp
 * @brief Two-slot rolling retention of committed backup artifacts.
 *
 * Each backup kind owns one fixed file name in the backup root
 * (`<root>/nightly_backup.<ext>.gz`, `<root>/weekly_backup.<ext>.gz`). Committing a new
 * artifact renames it over the slot, which retires the previous artifact in the same
 * atomic step: readers see either the old file or the new one, never a partial file and
 * never an empty slot.
 *
 * A commit may keep a shadow of the replaced artifact in the scratch directory (hard link,
 * same filesystem) so that a commit whose re-verification fails can be rolled back.
 */

#ifndef RETENTION_STORE_HPP
#define RETENTION_STORE_HPP

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Metadata of one slot.
 */
struct SlotInfo {
    bool exists = false;
    std::uint64_t sizeBytes = 0;
    std::filesystem::file_time_type lastWrite{};
};

/**
 * @brief Owns the nightly and weekly slots on durable storage.
 */
class RetentionStore {
public:
    /**
     * @brief Constructs a store.
     *
     * @param backupRoot Directory holding the slots.
     * @param shadowDir Directory for shadows of replaced artifacts; must be on the same filesystem.
     * @param exportExtension Extension of the uncompressed export ("surql").
     */
    RetentionStore(std::filesystem::path backupRoot, std::filesystem::path shadowDir, std::string exportExtension);

    /**
     * @brief Returns the slot path for a kind.
     */
    std::filesystem::path path(BackupKind kind) const;

    /**
     * @brief Returns whether the slot exists and its size.
     */
    SlotInfo stat(BackupKind kind) const;

    /**
     * @brief Atomically replaces the slot with the given artifact.
     *
     * The artifact is flushed to disk, renamed over the slot, and the directory entry is
     * flushed. The artifact path no longer exists afterwards.
     *
     * @param kind Slot to replace.
     * @param artifactPath Compressed artifact on the same filesystem as the backup root.
     * @param keepShadow If true and the slot held an artifact, keep it as a shadow for rollback().
     * @return std::expected<void, BackupError> Success or CommitFailed.
     */
    std::expected<void, BackupError> commit(BackupKind kind, const std::filesystem::path& artifactPath,
                                            bool keepShadow = false);

    /**
     * @brief Restores the shadow kept by the last commit() over the slot.
     *
     * If the commit had no predecessor the slot is removed instead, returning the store
     * to its state before the commit.
     *
     * @return std::expected<void, BackupError> Success or CommitFailed.
     */
    std::expected<void, BackupError> rollback(BackupKind kind);

    /**
     * @brief Returns true if the last commit() of this kind kept a shadow that rollback() can restore.
     */
    bool canRollback(BackupKind kind) const;

    /**
     * @brief Removes the shadow of a kind, if any.
     */
    void discardShadow(BackupKind kind);

    const std::filesystem::path& root() const { return backupRoot; }

private:
    std::filesystem::path shadowPath(BackupKind kind) const;

    std::filesystem::path backupRoot;
    std::filesystem::path shadowDir;
    std::string exportExtension;
    std::array<bool, 2> rollbackArmed{};      ///< Set by commit(keepShadow), indexed by kind.
};

#endif // RETENTION_STORE_HPP

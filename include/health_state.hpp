/**
 * @file health_state.hpp
 * @brief Process-wide record of the most recent backup outcome.
 *
 * One writer (the backup pipeline) and many readers (the health server, the daemon).
 * Only BackupPipeline can change the record; everyone else reads snapshots.
 */

#ifndef HEALTH_STATE_HPP
#define HEALTH_STATE_HPP

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Snapshot of the health record.
 */
struct HealthRecord {
    HealthStatus status = HealthStatus::Starting;
    std::optional<std::chrono::system_clock::time_point> lastUpdated; ///< Unset until the first run starts.
};

/**
 * @brief Mutex-guarded health record, optionally mirrored to a JSON file.
 *
 * The mirror file holds {"status", "last_updated", "service"} and is replaced atomically
 * on every update so external tools never read a partial file.
 */
class HealthState {
public:
    /**
     * @param mirrorFile Path of the on-disk snapshot; empty to disable mirroring.
     * @param serviceName Value of the "service" field in the mirror file.
     */
    explicit HealthState(std::string mirrorFile = {}, std::string serviceName = "db-backup");

    HealthState(const HealthState&) = delete;
    HealthState& operator=(const HealthState&) = delete;

    HealthRecord snapshot() const;

    /**
     * @brief Writes the current record to the mirror file.
     *
     * @return bool False if mirroring is enabled and the file could not be written.
     */
    bool writeMirror() const;

    const std::string& mirrorFile() const { return mirrorPath; }

private:
    friend class BackupPipeline;

    /// Replaces the record (last write wins) and refreshes the mirror. Returns writeMirror().
    bool update(HealthStatus status, std::chrono::system_clock::time_point at);

    std::string mirrorPath;
    std::string serviceName;
    mutable std::mutex mutex;
    mutable std::mutex mirrorMutex;  ///< Serializes writers of the mirror file.
    HealthRecord record;
};

#endif // HEALTH_STATE_HPP

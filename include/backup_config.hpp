/**
 * @file backup_config.hpp
 * @brief Configuration management for the RollingVault backup daemon.
 *
 * Defines the configuration class holding storage locations, database access settings,
 * retry and staleness policy constants, and the nightly/weekly schedule. Values are loaded
 * from a JSON file; every key is optional and falls back to the defaults of the container
 * deployment (backups under /backups, logs under /logs/surrealdb-backup, secrets under
 * /keyvault/surrealdb).
 *
 * @note The environment variables SURREALDB_ENDPOINT and HEALTH_CHECK_PORT override the
 * corresponding file values, matching the deployment's container environment.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <chrono>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Settings for reaching the database and driving its export/import CLI.
 */
struct DatabaseConfig {
    std::string endpoint;                      ///< Base URL of the database (e.g., "http://core-surrealdb:8000").
    std::string cliPath;                       ///< Path to the export/import command-line tool.
    std::chrono::seconds commandTimeout;       ///< Wall-clock ceiling for one export or import.
    std::chrono::seconds probeTimeout;         ///< Per-attempt timeout of the liveness probe.
};

/**
 * @brief Time-of-day schedule for the two backup kinds.
 */
struct ScheduleConfig {
    std::string nightlyTime;                   ///< "HH:MM:SS", every day.
    std::string weeklyTime;                    ///< "HH:MM:SS", on weeklyDay.
    std::string weeklyDay;                     ///< Lowercase day name ("sunday").
};

/**
 * @brief Configuration class for the backup daemon and the restore command.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and validation.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration holding only built-in defaults (plus environment overrides).
     */
    BackupConfig();

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * Loads settings from the specified file, applying defaults where keys are absent.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is inaccessible, unparsable, or holds invalid values.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Ensures the backup root, scratch directory, and log directory exist.
     *
     * @throws std::filesystem::filesystem_error If a directory cannot be created.
     */
    void prepareDirectories() const;

    std::string backupRoot;                    ///< Directory holding the two retention slots.
    std::string tempDir;                       ///< Scratch area; must share a filesystem with backupRoot.
    std::string logDir;                        ///< Directory for backup.log and health.log.
    std::string keyvaultDir;                   ///< Directory holding the four secret files.
    std::string exportExtension;               ///< Extension of the text export ("surql").
    std::string transactionMarker;             ///< Token every well-formed export contains.
    std::string serviceName;                   ///< Service name reported by /health.
    DatabaseConfig database;                   ///< Database access settings.
    RetryPolicy probePolicy;                   ///< Attempts and backoff of the liveness probe.
    std::chrono::seconds credentialWait;       ///< Total time to wait for the secret files.
    std::chrono::seconds credentialPoll;       ///< Interval between secret-file polls.
    int healthPort;                            ///< TCP port of the health endpoint.
    std::chrono::hours stalenessThreshold;     ///< Age after which a healthy record is reported unhealthy.
    bool rollbackOnCorruption;                 ///< Restore the previous slot content on PostCommitCorruption.
    ScheduleConfig schedule;                   ///< Nightly/weekly trigger times.

private:
    void applyEnvironment();
    void validate() const;
};

#endif // BACKUP_CONFIG_HPP

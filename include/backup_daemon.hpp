/**
 * @file backup_daemon.hpp
 * @brief Wires the backup components together and runs the scheduling loop.
 *
 * The daemon owns one instance of every component, starts the health endpoint, and runs
 * nightly and weekly backups at their configured local times. Runs are executed one after
 * another on the daemon thread, so two runs never overlap.
 */

#ifndef BACKUP_DAEMON_HPP
#define BACKUP_DAEMON_HPP

#include <chrono>
#include <csignal>
#include <expected>
#include "artifact_validator.hpp"
#include "backup_config.hpp"
#include "backup_pipeline.hpp"
#include "clock.hpp"
#include "credential_source.hpp"
#include "export_client.hpp"
#include "health_state.hpp"
#include "retention_store.hpp"
#include "structured_log.hpp"

/// Set by SIGINT/SIGTERM; polled by the daemon loop.
extern volatile std::sig_atomic_t gShutdownFlag;

/**
 * @brief Installs the SIGINT/SIGTERM handler that sets gShutdownFlag.
 */
void installShutdownHandler();

/**
 * @brief Calculates the next scheduled run of a kind, in local time.
 *
 * Nightly runs fire every day at schedule.nightlyTime; weekly runs fire on schedule.weeklyDay
 * at schedule.weeklyTime. A trigger equal to @p now is considered past.
 *
 * @param schedule Trigger times.
 * @param kind Kind to schedule.
 * @param now Reference time.
 * @return std::chrono::system_clock::time_point The first trigger strictly after @p now.
 * @throws std::runtime_error If the schedule holds an invalid time or day name.
 */
std::chrono::system_clock::time_point nextRunTime(const ScheduleConfig& schedule, BackupKind kind,
                                                  std::chrono::system_clock::time_point now);

/**
 * @brief Backup service: scheduler, pipeline and health endpoint.
 */
class BackupDaemon {
public:
    /**
     * @brief Constructs the service components from a configuration.
     *
     * @param config Validated configuration.
     */
    explicit BackupDaemon(const BackupConfig& config);

    /**
     * @brief Runs one backup immediately (what a cron job invokes).
     */
    std::expected<BackupRunReport, BackupError> runOnce(BackupKind kind);

    /**
     * @brief Runs the backup system in daemon mode.
     *
     * Serves /health and executes scheduled backups until gShutdownFlag is set.
     *
     * @return int Process exit code.
     */
    int runDaemon();

private:
    void sleepUntil(std::chrono::system_clock::time_point deadline);

    BackupConfig config;                  ///< Service configuration.
    SystemClock clock;
    StructuredLogger logger;
    KeyvaultCredentialSource credentials;
    SurrealExportClient exportClient;
    ArtifactValidator validator;
    RetentionStore retention;
    HealthState health;
    BackupPipeline pipeline;
};

#endif // BACKUP_DAEMON_HPP

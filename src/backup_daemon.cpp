#include "backup_daemon.hpp"
#include "health_server.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>
#include <signal.h>
#include <map>
#include <stdexcept>

namespace fs = std::filesystem;

volatile std::sig_atomic_t gShutdownFlag = 0;

namespace {

constexpr const char* kComponent = "db-backup";

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

std::string formatLocal(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

} // namespace

void installShutdownHandler() {
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

std::chrono::system_clock::time_point nextRunTime(const ScheduleConfig& schedule, BackupKind kind,
                                                  std::chrono::system_clock::time_point now) {
    const std::string& timeOfDay = kind == BackupKind::Nightly ? schedule.nightlyTime : schedule.weeklyTime;

    int hour = -1, minute = -1, second = -1;
    if (std::sscanf(timeOfDay.c_str(), "%d:%d:%d", &hour, &minute, &second) != 3 || hour < 0 || hour > 23 ||
        minute < 0 || minute > 59 || second < 0 || second > 59) {
        throw std::runtime_error(fmt::format("Invalid schedule time format: {}", timeOfDay));
    }

    std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&nowT, &tmNow);

    std::tm tmNext = tmNow;
    tmNext.tm_hour = hour;
    tmNext.tm_min = minute;
    tmNext.tm_sec = second;
    tmNext.tm_isdst = -1;
    auto nextTime = std::chrono::system_clock::from_time_t(std::mktime(&tmNext));

    if (kind == BackupKind::Nightly) {
        if (nextTime <= now) {
            tmNext.tm_mday += 1;
            tmNext.tm_isdst = -1;
            nextTime = std::chrono::system_clock::from_time_t(std::mktime(&tmNext));
        }
        return nextTime;
    }

    static const std::map<std::string, int> dayMap = {
        {"sunday", 0}, {"monday", 1}, {"tuesday", 2}, {"wednesday", 3},
        {"thursday", 4}, {"friday", 5}, {"saturday", 6}
    };
    auto it = dayMap.find(schedule.weeklyDay);
    if (it == dayMap.end()) {
        throw std::runtime_error(fmt::format("Invalid day of week: {}", schedule.weeklyDay));
    }
    int daysToAdd = (it->second - tmNow.tm_wday + 7) % 7;
    if (daysToAdd == 0 && nextTime <= now) {
        daysToAdd = 7;
    }
    tmNext.tm_mday += daysToAdd;
    tmNext.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tmNext));
}

BackupDaemon::BackupDaemon(const BackupConfig& config)
    : config(config),
      logger((fs::path(config.logDir) / "backup.log").string()),
      credentials(config.keyvaultDir, clock, config.credentialWait, config.credentialPoll),
      exportClient(config.database.endpoint, config.database.cliPath, config.database.commandTimeout,
                   config.database.probeTimeout, config.probePolicy, clock),
      validator(config.transactionMarker),
      retention(config.backupRoot, config.tempDir, config.exportExtension),
      health((fs::path(config.logDir) / "health.log").string(), config.serviceName),
      pipeline(credentials, exportClient, validator, retention, health, clock, logger,
               PipelineOptions{config.tempDir, config.exportExtension, 9, config.rollbackOnCorruption}) {}

std::expected<BackupRunReport, BackupError> BackupDaemon::runOnce(BackupKind kind) {
    return pipeline.run(kind);
}

void BackupDaemon::sleepUntil(std::chrono::system_clock::time_point deadline) {
    while (!gShutdownFlag) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock.now());
        if (remaining.count() <= 0) {
            return;
        }
        clock.sleepFor(std::min(remaining, std::chrono::milliseconds(1000)));
    }
}

int BackupDaemon::runDaemon() {
    installShutdownHandler();

    if (!health.writeMirror()) {
        logger.warn(kComponent, fmt::format("Failed to write health snapshot: {}", health.mirrorFile()));
    }

    HealthServer server(health, retention, config.serviceName, config.stalenessThreshold, logger);
    if (auto started = server.start(config.healthPort); !started) {
        logger.error(kComponent, fmt::format("Failed to start health check server: {}", started.error()));
        return 1;
    }

    logger.info(kComponent, fmt::format("Daemon mode started. Logging to {}", logger.logFile()));

    // A run that overruns the other kind's trigger delays that run; it is never skipped.
    std::map<BackupKind, std::chrono::system_clock::time_point> nextRuns;
    while (!gShutdownFlag) {
        try {
            auto now = clock.now();
            for (BackupKind kind : kAllBackupKinds) {
                if (!nextRuns.contains(kind)) {
                    nextRuns[kind] = nextRunTime(config.schedule, kind, now);
                }
            }
            BackupKind due = nextRuns[BackupKind::Nightly] <= nextRuns[BackupKind::Weekly] ? BackupKind::Nightly
                                                                                           : BackupKind::Weekly;
            auto dueAt = nextRuns[due];

            logger.info(kComponent, fmt::format("Next {} backup scheduled at {}", toString(due), formatLocal(dueAt)));
            sleepUntil(dueAt);
            if (gShutdownFlag) {
                break;
            }
            nextRuns[due] = nextRunTime(config.schedule, due, dueAt);

            // The result is logged by the pipeline; a failed run never stops the daemon.
            if (auto result = pipeline.run(due); result) {
                logger.info(kComponent, fmt::format("Run {} committed {}", result->runId, result->slotPath.string()));
            }
        } catch (const std::exception& e) {
            logger.error(kComponent, fmt::format("Daemon error: {}", e.what()));
            nextRuns.clear();
            sleepUntil(clock.now() + std::chrono::seconds(60));
        }
    }

    server.stop();
    logger.info(kComponent, "Daemon shutting down gracefully");
    return 0;
}

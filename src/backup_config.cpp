#include "backup_config.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <json/json.h>

namespace fs = std::filesystem;

namespace {

const std::string kDefaultBackupRoot = "/backups";

bool isValidTimeOfDay(const std::string& value) {
    int hour = -1, minute = -1, second = -1;
    char extra = '\0';
    if (std::sscanf(value.c_str(), "%d:%d:%d%c", &hour, &minute, &second, &extra) != 3) {
        return false;
    }
    return hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 && second >= 0 && second <= 59;
}

bool isValidDayName(const std::string& day) {
    for (const char* name : {"sunday", "monday", "tuesday", "wednesday", "thursday", "friday", "saturday"}) {
        if (day == name) {
            return true;
        }
    }
    return false;
}

} // namespace

BackupConfig::BackupConfig()
    : backupRoot(kDefaultBackupRoot),
      tempDir(fmt::format("{}/temp", kDefaultBackupRoot)),
      logDir("/logs/surrealdb-backup"),
      keyvaultDir("/keyvault/surrealdb"),
      exportExtension("surql"),
      transactionMarker("BEGIN TRANSACTION"),
      serviceName("db-backup"),
      database{"http://core-surrealdb:8000", "/usr/local/bin/surreal", std::chrono::seconds(3600), std::chrono::seconds(5)},
      probePolicy{3, std::chrono::seconds(5)},
      credentialWait(60),
      credentialPoll(2),
      healthPort(8080),
      stalenessThreshold(24),
      rollbackOnCorruption(true),
      schedule{"02:00:00", "03:00:00", "sunday"} {
    applyEnvironment();
}

BackupConfig::BackupConfig(const std::string& configFile) : BackupConfig() {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("Failed to open config file: {}", configFile));
    }
    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string errors;
    if (!Json::parseFromStream(builder, file, &configJson, &errors)) {
        throw std::runtime_error(fmt::format("Failed to parse config file: {} ({})", configFile, errors));
    }
    if (!configJson.isObject()) {
        throw std::runtime_error(fmt::format("Config file must contain a JSON object: {}", configFile));
    }

    try {
        backupRoot = configJson.get("backup_root", backupRoot).asString();
        tempDir = configJson.get("temp_dir", fmt::format("{}/temp", backupRoot)).asString();
        logDir = configJson.get("log_dir", logDir).asString();
        keyvaultDir = configJson.get("keyvault_dir", keyvaultDir).asString();
        exportExtension = configJson.get("export_extension", exportExtension).asString();
        transactionMarker = configJson.get("transaction_marker", transactionMarker).asString();
        serviceName = configJson.get("service_name", serviceName).asString();

        const Json::Value& db = configJson["database"];
        if (db.isObject()) {
            database.endpoint = db.get("endpoint", database.endpoint).asString();
            database.cliPath = db.get("cli", database.cliPath).asString();
            database.commandTimeout = std::chrono::seconds(
                db.get("command_timeout_seconds", static_cast<Json::Int64>(database.commandTimeout.count())).asInt64());
            database.probeTimeout = std::chrono::seconds(
                db.get("probe_timeout_seconds", static_cast<Json::Int64>(database.probeTimeout.count())).asInt64());
        }

        const Json::Value& probe = configJson["probe"];
        if (probe.isObject()) {
            probePolicy.attempts = probe.get("attempts", probePolicy.attempts).asInt();
            probePolicy.backoff = std::chrono::seconds(probe.get("backoff_seconds",
                static_cast<Json::Int64>(std::chrono::duration_cast<std::chrono::seconds>(probePolicy.backoff).count())).asInt64());
        }

        const Json::Value& credentials = configJson["credentials"];
        if (credentials.isObject()) {
            credentialWait = std::chrono::seconds(
                credentials.get("wait_seconds", static_cast<Json::Int64>(credentialWait.count())).asInt64());
            credentialPoll = std::chrono::seconds(
                credentials.get("poll_seconds", static_cast<Json::Int64>(credentialPoll.count())).asInt64());
        }

        const Json::Value& health = configJson["health"];
        if (health.isObject()) {
            healthPort = health.get("port", healthPort).asInt();
            stalenessThreshold = std::chrono::hours(
                health.get("staleness_hours", static_cast<Json::Int64>(stalenessThreshold.count())).asInt64());
        }

        const Json::Value& retention = configJson["retention"];
        if (retention.isObject()) {
            rollbackOnCorruption = retention.get("rollback_on_corruption", rollbackOnCorruption).asBool();
        }

        const Json::Value& scheduleJson = configJson["schedule"];
        if (scheduleJson.isObject()) {
            schedule.nightlyTime = scheduleJson.get("nightly_time", schedule.nightlyTime).asString();
            schedule.weeklyTime = scheduleJson.get("weekly_time", schedule.weeklyTime).asString();
            schedule.weeklyDay = scheduleJson.get("weekly_day", schedule.weeklyDay).asString();
        }
    } catch (const Json::Exception& e) {
        throw std::runtime_error(fmt::format("Invalid value in config file {}: {}", configFile, e.what()));
    }

    applyEnvironment();
    validate();
}

void BackupConfig::applyEnvironment() {
    if (const char* endpoint = std::getenv("SURREALDB_ENDPOINT"); endpoint && *endpoint) {
        database.endpoint = endpoint;
    }
    if (const char* port = std::getenv("HEALTH_CHECK_PORT"); port && *port) {
        char* end = nullptr;
        long value = std::strtol(port, &end, 10);
        if (*end != '\0' || value < 0 || value > 65535) {
            throw std::runtime_error(fmt::format("Invalid HEALTH_CHECK_PORT: {}", port));
        }
        healthPort = static_cast<int>(value);
    }
}

void BackupConfig::validate() const {
    if (backupRoot.empty() || tempDir.empty() || logDir.empty() || keyvaultDir.empty()) {
        throw std::runtime_error("backup_root, temp_dir, log_dir and keyvault_dir must not be empty");
    }
    if (transactionMarker.empty()) {
        throw std::runtime_error("transaction_marker must not be empty");
    }
    if (exportExtension.empty() || exportExtension.find('/') != std::string::npos) {
        throw std::runtime_error(fmt::format("Invalid export_extension: {}", exportExtension));
    }
    if (probePolicy.attempts < 1 || probePolicy.backoff.count() < 0) {
        throw std::runtime_error("probe.attempts must be at least 1 and probe.backoff_seconds non-negative");
    }
    if (credentialWait.count() < 0 || credentialPoll.count() <= 0) {
        throw std::runtime_error("credentials.poll_seconds must be positive and wait_seconds non-negative");
    }
    if (database.commandTimeout.count() <= 0 || database.probeTimeout.count() <= 0) {
        throw std::runtime_error("database timeouts must be positive");
    }
    if (healthPort < 0 || healthPort > 65535) {
        throw std::runtime_error(fmt::format("Invalid health.port: {}", healthPort));
    }
    if (stalenessThreshold.count() <= 0) {
        throw std::runtime_error("health.staleness_hours must be positive");
    }
    if (!isValidTimeOfDay(schedule.nightlyTime)) {
        throw std::runtime_error(fmt::format("Invalid schedule.nightly_time: {}", schedule.nightlyTime));
    }
    if (!isValidTimeOfDay(schedule.weeklyTime)) {
        throw std::runtime_error(fmt::format("Invalid schedule.weekly_time: {}", schedule.weeklyTime));
    }
    if (!isValidDayName(schedule.weeklyDay)) {
        throw std::runtime_error(fmt::format("Invalid schedule.weekly_day: {}", schedule.weeklyDay));
    }
}

void BackupConfig::prepareDirectories() const {
    fs::create_directories(backupRoot);
    fs::create_directories(tempDir);
    fs::create_directories(logDir);
}

/**
 * @file structured_log.hpp
 * @brief JSON-lines event log for RollingVault.
 *
 * Every event is one JSON object on one line, appended to the configured log file and
 * echoed to the console (stdout for INFO/WARN, stderr for ERROR).
 */

#ifndef STRUCTURED_LOG_HPP
#define STRUCTURED_LOG_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <json/json.h>

enum class LogLevel {
    Info,
    Warn,
    Error
};

std::string toString(LogLevel level);

/**
 * @brief Backup-specific fields attached to pipeline and restore events.
 *
 * Unset numeric fields are serialized as JSON null.
 */
struct BackupEvent {
    std::string backupType;                         ///< "nightly", "weekly" or empty.
    std::string status;                             ///< "started", "failed", "success", ...
    std::optional<std::int64_t> durationMs;
    std::optional<std::int64_t> fileSizeBytes;
    std::optional<std::int64_t> compressedSizeBytes;
};

/**
 * @brief Thread-safe structured logger.
 */
class StructuredLogger {
public:
    /**
     * @brief Constructs a logger appending to the given file.
     *
     * @param logFile Path of the JSON-lines file; empty to log to the console only.
     * @param echoToConsole If false, events are only written to the file.
     */
    explicit StructuredLogger(std::string logFile, bool echoToConsole = true);

    void log(LogLevel level, const std::string& component, const std::string& message) const;

    /**
     * @brief Logs an event carrying backup fields (backup_type, status, duration_ms,
     * file_size_bytes, compressed_size_bytes).
     */
    void log(LogLevel level, const std::string& component, const std::string& message,
             const BackupEvent& event) const;

    void info(const std::string& component, const std::string& message) const {
        log(LogLevel::Info, component, message);
    }

    void warn(const std::string& component, const std::string& message) const {
        log(LogLevel::Warn, component, message);
    }

    void error(const std::string& component, const std::string& message) const {
        log(LogLevel::Error, component, message);
    }

    const std::string& logFile() const { return logPath; }

private:
    void write(LogLevel level, Json::Value entry) const;

    std::string logPath;
    bool echoToConsole;
    mutable std::mutex mutex;
};

#endif // STRUCTURED_LOG_HPP

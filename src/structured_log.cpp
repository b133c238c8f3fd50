#include "structured_log.hpp"
#include "clock.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

namespace {

Json::Value optionalInt(const std::optional<std::int64_t>& value) {
    if (!value) {
        return Json::Value(Json::nullValue);
    }
    return Json::Value(static_cast<Json::Int64>(*value));
}

} // namespace

std::string toString(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

StructuredLogger::StructuredLogger(std::string logFile, bool echoToConsole)
    : logPath(std::move(logFile)), echoToConsole(echoToConsole) {
    if (!logPath.empty()) {
        std::error_code ec;
        fs::create_directories(fs::path(logPath).parent_path(), ec);
    }
}

void StructuredLogger::log(LogLevel level, const std::string& component, const std::string& message) const {
    Json::Value entry(Json::objectValue);
    entry["timestamp"] = formatIsoUtc(std::chrono::system_clock::now());
    entry["level"] = toString(level);
    entry["component"] = component;
    entry["message"] = message;
    write(level, std::move(entry));
}

void StructuredLogger::log(LogLevel level, const std::string& component, const std::string& message,
                           const BackupEvent& event) const {
    Json::Value entry(Json::objectValue);
    entry["timestamp"] = formatIsoUtc(std::chrono::system_clock::now());
    entry["level"] = toString(level);
    entry["component"] = component;
    entry["message"] = message;
    entry["backup_type"] = event.backupType;
    entry["status"] = event.status;
    entry["duration_ms"] = optionalInt(event.durationMs);
    entry["file_size_bytes"] = optionalInt(event.fileSizeBytes);
    entry["compressed_size_bytes"] = optionalInt(event.compressedSizeBytes);
    write(level, std::move(entry));
}

void StructuredLogger::write(LogLevel level, Json::Value entry) const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string line = Json::writeString(builder, entry);

    std::lock_guard<std::mutex> lock(mutex);
    if (echoToConsole) {
        if (level == LogLevel::Error) {
            std::cerr << line << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    }

    if (logPath.empty()) {
        return;
    }
    std::ofstream log(logPath, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else if (echoToConsole) {
        std::cerr << "Error: Cannot write to log file: " << logPath << std::endl;
    }
}

#include "health_state.hpp"
#include "clock.hpp"
#include <filesystem>
#include <fstream>
#include <json/json.h>

namespace fs = std::filesystem;

HealthState::HealthState(std::string mirrorFile, std::string serviceName)
    : mirrorPath(std::move(mirrorFile)), serviceName(std::move(serviceName)) {}

HealthRecord HealthState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return record;
}

bool HealthState::update(HealthStatus status, std::chrono::system_clock::time_point at) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        record.status = status;
        record.lastUpdated = at;
    }
    return writeMirror();
}

bool HealthState::writeMirror() const {
    if (mirrorPath.empty()) {
        return true;
    }

    std::lock_guard<std::mutex> mirrorLock(mirrorMutex);
    HealthRecord current = snapshot();
    Json::Value snapshotJson(Json::objectValue);
    snapshotJson["status"] = toString(current.status);
    snapshotJson["last_updated"] = current.lastUpdated ? formatIsoUtc(*current.lastUpdated) : std::string("never");
    snapshotJson["service"] = serviceName;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";

    std::error_code ec;
    fs::path target(mirrorPath);
    fs::create_directories(target.parent_path(), ec);
    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return false;
        }
        out << Json::writeString(builder, snapshotJson) << '\n';
        out.flush();
        if (!out) {
            return false;
        }
    }
    fs::rename(temp, target, ec);
    return !ec;
}

#include "health_server.hpp"
#include "clock.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace {

constexpr const char* kComponent = "health-server";
constexpr std::size_t kMaxRequestBytes = 8192;

std::string reasonPhrase(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 503:
        return "Service Unavailable";
    default:
        return "Error";
    }
}

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

HttpResponse errorResponse(int statusCode, const std::string& message) {
    Json::Value body(Json::objectValue);
    body["error"] = message;
    return HttpResponse{statusCode, compactJson(body)};
}

bool sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

HealthServer::HealthServer(const HealthState& state, const RetentionStore& store, std::string serviceName,
                           std::chrono::seconds stalenessThreshold, const StructuredLogger& logger)
    : state(state), store(store), serviceName(std::move(serviceName)),
      stalenessThreshold(stalenessThreshold), logger(logger) {}

HealthServer::~HealthServer() {
    stop();
}

bool HealthServer::isHealthy(const HealthRecord& record, std::chrono::system_clock::time_point now) const {
    if (record.status != HealthStatus::Healthy || !record.lastUpdated) {
        return false;
    }
    return now - *record.lastUpdated < stalenessThreshold;
}

Json::Value HealthServer::composeHealth(std::chrono::system_clock::time_point now) const {
    HealthRecord record = state.snapshot();

    Json::Value body(Json::objectValue);
    body["status"] = isHealthy(record, now) ? "healthy" : "unhealthy";
    body["service"] = serviceName;
    body["timestamp"] = formatIsoUtc(now);
    body["last_backup"] = record.lastUpdated ? formatIsoUtc(*record.lastUpdated) : std::string("never");

    Json::Value backups(Json::objectValue);
    for (BackupKind kind : kAllBackupKinds) {
        SlotInfo info = store.stat(kind);
        Json::Value slot(Json::objectValue);
        slot["exists"] = info.exists;
        slot["size_bytes"] = static_cast<Json::UInt64>(info.exists ? info.sizeBytes : 0);
        backups[toString(kind)] = slot;
    }
    body["backups"] = backups;
    return body;
}

HttpResponse HealthServer::handle(const std::string& method, const std::string& target,
                                  std::chrono::system_clock::time_point now) const {
    std::string path = target.substr(0, target.find('?'));
    if (path != "/health") {
        return errorResponse(404, "Not Found");
    }
    if (method != "GET") {
        return errorResponse(405, "Method Not Allowed");
    }

    Json::Value body = composeHealth(now);
    int statusCode = body["status"].asString() == "healthy" ? 200 : 503;
    return HttpResponse{statusCode, compactJson(body)};
}

std::expected<void, std::string> HealthServer::start(int port, const std::string& bindAddress) {
    if (running.load()) {
        return std::unexpected("Health server already running");
    }

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(fmt::format("socket failed: {}", std::strerror(errno)));
    }
    int reuse = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) != 0) {
        logger.warn(kComponent, fmt::format("SO_REUSEADDR failed: {}", std::strerror(errno)));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    if (::inet_pton(AF_INET, bindAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        return std::unexpected(fmt::format("Invalid bind address: {}", bindAddress));
    }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        return std::unexpected(fmt::format("bind to port {} failed: {}", port, reason));
    }
    if (::listen(fd, 16) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        return std::unexpected(fmt::format("listen failed: {}", reason));
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        return std::unexpected(fmt::format("getsockname failed: {}", reason));
    }

    listenFd = fd;
    boundPort = ntohs(bound.sin_port);
    running = true;
    worker = std::thread(&HealthServer::serve, this);
    logger.info(kComponent, fmt::format("Starting health check server on port {}", boundPort));
    return {};
}

void HealthServer::stop() {
    if (!running.exchange(false)) {
        return;
    }
    if (worker.joinable()) {
        worker.join();
    }
    ::close(listenFd);
    listenFd = -1;
    logger.info(kComponent, "Health check server stopped");
}

void HealthServer::serve() {
    while (running.load()) {
        pollfd pfd{listenFd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger.error(kComponent, fmt::format("poll failed: {}", std::strerror(errno)));
            break;
        }
        if (ready == 0) {
            continue;
        }

        int clientFd = ::accept4(listenFd, nullptr, nullptr, SOCK_CLOEXEC);
        if (clientFd < 0) {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED) {
                logger.warn(kComponent, fmt::format("accept failed: {}", std::strerror(errno)));
            }
            continue;
        }
        serveClient(clientFd);
        ::close(clientFd);
    }
}

void HealthServer::serveClient(int clientFd) const {
    // A stalled client must not hold the single server thread for long.
    timeval timeout{5, 0};
    if (::setsockopt(clientFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) != 0 ||
        ::setsockopt(clientFd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) != 0) {
        logger.warn(kComponent, fmt::format("Failed to set client timeouts: {}", std::strerror(errno)));
        return;
    }

    std::string request;
    char buf[1024];
    while (request.find("\r\n\r\n") == std::string::npos && request.find("\n\n") == std::string::npos &&
           request.size() < kMaxRequestBytes) {
        ssize_t n = ::recv(clientFd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        request.append(buf, static_cast<std::size_t>(n));
    }

    HttpResponse response;
    std::string requestLine = request.substr(0, request.find('\n'));
    if (!requestLine.empty() && requestLine.back() == '\r') {
        requestLine.pop_back();
    }
    auto firstSpace = requestLine.find(' ');
    auto secondSpace = firstSpace == std::string::npos ? std::string::npos : requestLine.find(' ', firstSpace + 1);
    if (firstSpace == std::string::npos || secondSpace == std::string::npos || secondSpace == firstSpace + 1) {
        response = errorResponse(400, "Bad Request");
    } else {
        std::string method = requestLine.substr(0, firstSpace);
        std::string target = requestLine.substr(firstSpace + 1, secondSpace - firstSpace - 1);
        response = handle(method, target, std::chrono::system_clock::now());
    }

    std::string raw = fmt::format("HTTP/1.1 {} {}\r\n"
                                  "Content-Type: application/json\r\n"
                                  "Content-Length: {}\r\n"
                                  "Connection: close\r\n\r\n{}",
                                  response.statusCode, reasonPhrase(response.statusCode), response.body.size(),
                                  response.body);
    if (!sendAll(clientFd, raw)) {
        logger.warn(kComponent, fmt::format("Failed to send response: {}", std::strerror(errno)));
    }
}

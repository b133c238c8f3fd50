#include "backup_pipeline.hpp"
#include "health_server.hpp"
#include "test_support.hpp"
#include <arpa/inet.h>
#include <cstdint>
#include <gtest/gtest.h>
#include <json/json.h>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

using namespace std::chrono_literals;
using namespace testing_support;

namespace {

Json::Value parseBody(const std::string& body) {
    std::istringstream in(body);
    Json::Value value;
    Json::CharReaderBuilder builder;
    std::string errors;
    EXPECT_TRUE(Json::parseFromStream(builder, in, &value, &errors)) << errors;
    return value;
}

std::string exchange(int port, const std::string& request) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return {};
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<std::uint16_t>(port));
    ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        ::close(fd);
        return {};
    }
    ::send(fd, request.data(), request.size(), MSG_NOSIGNAL);

    std::string response;
    char buf[1024];
    ssize_t n;
    while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
        response.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return response;
}

} // namespace

class HealthServerTest : public ::testing::Test {
protected:
    void runBackup(BackupKind kind) {
        BackupPipeline pipeline(credentials, exportClient, validator, retention, health, clock, logger,
                                PipelineOptions{dir / "temp", "surql", 9, true});
        (void)pipeline.run(kind);
    }

    TempDir dir;
    FakeClock clock;
    FakeCredentialSource credentials;
    FakeExportClient exportClient;
    ArtifactValidator validator{"BEGIN TRANSACTION"};
    RetentionStore retention{dir / "backups", dir / "temp", "surql"};
    HealthState health;
    StructuredLogger logger{"", false};
    HealthServer server{health, retention, "db-backup", 24h, logger};
};

TEST_F(HealthServerTest, ReportsUnhealthyBeforeFirstBackup) {
    HttpResponse response = server.handle("GET", "/health", clock.now());
    EXPECT_EQ(response.statusCode, 503);

    Json::Value body = parseBody(response.body);
    EXPECT_EQ(body["status"].asString(), "unhealthy");
    EXPECT_EQ(body["service"].asString(), "db-backup");
    EXPECT_EQ(body["last_backup"].asString(), "never");
    EXPECT_EQ(body["timestamp"].asString(), formatIsoUtc(clock.now()));
    EXPECT_FALSE(body["backups"]["nightly"]["exists"].asBool());
    EXPECT_EQ(body["backups"]["weekly"]["size_bytes"].asUInt64(), 0u);
}

TEST_F(HealthServerTest, FreshSuccessfulBackupIsHealthy) {
    runBackup(BackupKind::Nightly);
    const auto backupTime = clock.now();

    HttpResponse response = server.handle("GET", "/health", backupTime + 1h);
    EXPECT_EQ(response.statusCode, 200);

    Json::Value body = parseBody(response.body);
    EXPECT_EQ(body["status"].asString(), "healthy");
    EXPECT_EQ(body["last_backup"].asString(), formatIsoUtc(backupTime));
    EXPECT_TRUE(body["backups"]["nightly"]["exists"].asBool());
    EXPECT_EQ(body["backups"]["nightly"]["size_bytes"].asUInt64(), retention.stat(BackupKind::Nightly).sizeBytes);
    EXPECT_FALSE(body["backups"]["weekly"]["exists"].asBool());
}

TEST_F(HealthServerTest, StaleSuccessIsUnhealthy) {
    runBackup(BackupKind::Nightly);
    ASSERT_EQ(health.snapshot().status, HealthStatus::Healthy);

    HttpResponse response = server.handle("GET", "/health", clock.now() + 25h);
    EXPECT_EQ(response.statusCode, 503);
    EXPECT_EQ(parseBody(response.body)["status"].asString(), "unhealthy");
    EXPECT_TRUE(parseBody(response.body)["backups"]["nightly"]["exists"].asBool());
}

TEST_F(HealthServerTest, FreshFailureIsUnhealthy) {
    exportClient.reachable = false;
    runBackup(BackupKind::Nightly);

    HttpResponse response = server.handle("GET", "/health", clock.now());
    EXPECT_EQ(response.statusCode, 503);
    EXPECT_EQ(parseBody(response.body)["last_backup"].asString(), formatIsoUtc(clock.now()));
}

TEST_F(HealthServerTest, RoutesOtherRequests) {
    HttpResponse notFound = server.handle("GET", "/metrics", clock.now());
    EXPECT_EQ(notFound.statusCode, 404);
    EXPECT_EQ(parseBody(notFound.body)["error"].asString(), "Not Found");

    EXPECT_EQ(server.handle("POST", "/health", clock.now()).statusCode, 405);
    EXPECT_EQ(server.handle("GET", "/health?verbose=1", clock.now()).statusCode, 503);
}

TEST_F(HealthServerTest, ServesRequestsOverTcp) {
    runBackup(BackupKind::Weekly);
    auto started = server.start(0, "127.0.0.1");
    ASSERT_TRUE(started.has_value()) << started.error();
    ASSERT_GT(server.port(), 0);

    // The record was written at the fake clock's time, which is "now" here.
    std::string ok = exchange(server.port(), "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n");
    EXPECT_EQ(ok.rfind("HTTP/1.1 200 OK\r\n", 0), 0u) << ok;
    EXPECT_NE(ok.find("Content-Type: application/json"), std::string::npos);
    Json::Value body = parseBody(ok.substr(ok.find("\r\n\r\n") + 4));
    EXPECT_TRUE(body["backups"]["weekly"]["exists"].asBool());

    std::string missing = exchange(server.port(), "GET /nope HTTP/1.1\r\n\r\n");
    EXPECT_EQ(missing.rfind("HTTP/1.1 404 Not Found\r\n", 0), 0u) << missing;

    std::string garbage = exchange(server.port(), "garbage\r\n\r\n");
    EXPECT_EQ(garbage.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u) << garbage;

    server.stop();
    EXPECT_TRUE(exchange(server.port(), "GET /health HTTP/1.1\r\n\r\n").empty());
}

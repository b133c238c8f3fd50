/**
 * @file health_server.hpp
 * @brief Minimal HTTP responder exposing the backup health endpoint.
 *
 * Serves `GET /health` from its own thread. The server is read-only: it composes its answer
 * from a HealthState snapshot and the retention slot metadata, never blocks on a running
 * backup, and never starts one.
 */

#ifndef HEALTH_SERVER_HPP
#define HEALTH_SERVER_HPP

#include <atomic>
#include <chrono>
#include <expected>
#include <string>
#include <thread>
#include <json/json.h>
#include "health_state.hpp"
#include "retention_store.hpp"
#include "structured_log.hpp"

/**
 * @brief Status code and JSON body of one response.
 */
struct HttpResponse {
    int statusCode = 200;
    std::string body;
};

/**
 * @brief Health endpoint server.
 */
class HealthServer {
public:
    /**
     * @brief Constructs a server; nothing is bound until start().
     *
     * @param state Health record written by the backup pipeline.
     * @param store Retention slots reported under "backups".
     * @param serviceName Value of the "service" field.
     * @param stalenessThreshold Age after which a healthy record is reported unhealthy.
     * @param logger Event log.
     */
    HealthServer(const HealthState& state, const RetentionStore& store, std::string serviceName,
                 std::chrono::seconds stalenessThreshold, const StructuredLogger& logger);

    /**
     * @brief Stops the server thread if it is running.
     */
    ~HealthServer();

    HealthServer(const HealthServer&) = delete;
    HealthServer& operator=(const HealthServer&) = delete;

    /**
     * @brief Binds the listening socket and starts the server thread.
     *
     * @param port TCP port; 0 picks an ephemeral port (see port()).
     * @param bindAddress IPv4 address to listen on.
     * @return std::expected<void, std::string> Success or a socket error.
     */
    std::expected<void, std::string> start(int port, const std::string& bindAddress = "0.0.0.0");

    /**
     * @brief Stops accepting connections and joins the server thread.
     */
    void stop();

    /**
     * @brief Returns the bound port, or 0 before start().
     */
    int port() const { return boundPort; }

    /**
     * @brief Routes one request. Pure with respect to the socket layer.
     *
     * @param method HTTP method ("GET").
     * @param target Request target; a query string is ignored for routing.
     * @param now Time used for the staleness check and the "timestamp" field.
     */
    HttpResponse handle(const std::string& method, const std::string& target,
                        std::chrono::system_clock::time_point now) const;

    /**
     * @brief Returns true if the record is healthy and younger than the staleness threshold.
     */
    bool isHealthy(const HealthRecord& record, std::chrono::system_clock::time_point now) const;

    /**
     * @brief Builds the /health body for the given time.
     */
    Json::Value composeHealth(std::chrono::system_clock::time_point now) const;

private:
    void serve();
    void serveClient(int clientFd) const;

    const HealthState& state;
    const RetentionStore& store;
    std::string serviceName;
    std::chrono::seconds stalenessThreshold;
    const StructuredLogger& logger;

    std::thread worker;
    std::atomic<bool> running{false};
    int listenFd = -1;
    int boundPort = 0;
};

#endif // HEALTH_SERVER_HPP

/**
 * @file export_client.hpp
 * @brief Database export/import access for RollingVault.
 *
 * Provides the interface used by the backup pipeline and the restore workflow to talk to
 * the database, and an implementation that drives the SurrealDB command-line tool and the
 * server's HTTP health endpoint.
 *
 * @note Requires the database CLI (default /usr/local/bin/surreal) and libcurl.
 */

#ifndef EXPORT_CLIENT_HPP
#define EXPORT_CLIENT_HPP

#include <chrono>
#include <expected>
#include <string>
#include <vector>
#include "backup_types.hpp"
#include "clock.hpp"
#include "credential_source.hpp"

/**
 * @brief Interface for database export, import and liveness probing.
 */
class ExportClient {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~ExportClient() = default;

    /**
     * @brief Checks that the database is reachable.
     *
     * Retries according to the client's retry policy.
     *
     * @return bool True if any attempt succeeded.
     */
    virtual bool probe() = 0;

    /**
     * @brief Exports the credentials' namespace/database as a text script.
     *
     * @param creds Credentials selecting the namespace and database.
     * @param destPath Path of the script to create.
     * @return std::expected<void, BackupError> Success or ExportFailed.
     */
    virtual std::expected<void, BackupError> exportTo(const CredentialBundle& creds, const std::string& destPath) = 0;

    /**
     * @brief Imports a text script into the credentials' namespace/database.
     *
     * @param creds Credentials selecting the namespace and database.
     * @param sourcePath Path of the script to import.
     * @return std::expected<void, BackupError> Success or ImportFailed.
     */
    virtual std::expected<void, BackupError> importFrom(const CredentialBundle& creds, const std::string& sourcePath) = 0;
};

/**
 * @brief Outcome of one child-process run.
 */
struct CommandResult {
    int exitCode = -1;        ///< Exit status, or -1 if the child was killed by a signal.
    bool timedOut = false;    ///< True if the child was killed because it exceeded the timeout.
    std::string output;       ///< Tail of the combined stdout/stderr.
};

/**
 * @brief Runs a program with the given argument vector (no shell) and waits for it.
 *
 * The child's stdin is /dev/null; stdout and stderr are captured. The child is killed with
 * SIGKILL once `timeout` has elapsed.
 *
 * @param argv Program followed by its arguments; argv[0] is looked up in PATH.
 * @param timeout Wall-clock ceiling for the child.
 * @return std::expected<CommandResult, std::string> The result, or an error if the child could not be started.
 */
std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout);

/**
 * @brief SurrealDB export client using the `surreal export` / `surreal import` commands.
 */
class SurrealExportClient : public ExportClient {
public:
    /**
     * @brief Constructs a SurrealDB client.
     *
     * @param endpoint Server base URL (e.g., "http://core-surrealdb:8000").
     * @param cliPath Path to the surreal binary.
     * @param commandTimeout Ceiling for one export or import.
     * @param probeTimeout Ceiling for one health-endpoint request.
     * @param probePolicy Attempts and backoff for probe().
     * @param clock Sleeper used between probe attempts.
     */
    SurrealExportClient(std::string endpoint, std::string cliPath,
                        std::chrono::milliseconds commandTimeout, std::chrono::milliseconds probeTimeout,
                        RetryPolicy probePolicy, Clock& clock);

    bool probe() override;
    std::expected<void, BackupError> exportTo(const CredentialBundle& creds, const std::string& destPath) override;
    std::expected<void, BackupError> importFrom(const CredentialBundle& creds, const std::string& sourcePath) override;

private:
    bool probeOnce() const;
    std::vector<std::string> commandLine(const std::string& verb, const CredentialBundle& creds,
                                         const std::string& path) const;

    std::string endpoint;
    std::string cliPath;
    std::chrono::milliseconds commandTimeout;
    std::chrono::milliseconds probeTimeout;
    RetryPolicy probePolicy;
    Clock& clock;
};

#endif // EXPORT_CLIENT_HPP

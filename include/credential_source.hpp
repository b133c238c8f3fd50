/**
 * @file credential_source.hpp
 * @brief Database credential acquisition for RollingVault.
 *
 * Credentials are delivered by an external secret store as four files in a mounted
 * directory. The files may appear some time after the daemon starts, so loading
 * polls with a bounded wait.
 */

#ifndef CREDENTIAL_SOURCE_HPP
#define CREDENTIAL_SOURCE_HPP

#include <chrono>
#include <expected>
#include <string>
#include "backup_types.hpp"
#include "clock.hpp"

/**
 * @brief Complete set of database credentials. Values are opaque strings.
 */
struct CredentialBundle {
    std::string username;
    std::string password;
    std::string ns;        ///< Database namespace.
    std::string database;
};

/**
 * @brief Interface for credential sources.
 */
class CredentialSource {
public:
    virtual ~CredentialSource() = default;

    /**
     * @brief Loads a complete credential bundle.
     *
     * @return The bundle, or CredentialsUnavailable. A partial bundle is never returned.
     */
    virtual std::expected<CredentialBundle, BackupError> load() = 0;
};

/**
 * @brief Reads credentials from the files username, password, namespace and database.
 *
 * Polls the directory every `pollInterval` until all four files exist or `maxWait`
 * has elapsed. Trailing newlines are stripped from each value.
 */
class KeyvaultCredentialSource : public CredentialSource {
public:
    KeyvaultCredentialSource(std::string directory, Clock& clock,
                             std::chrono::milliseconds maxWait, std::chrono::milliseconds pollInterval);

    std::expected<CredentialBundle, BackupError> load() override;

private:
    bool allPresent() const;

    std::string directory;
    Clock& clock;
    std::chrono::milliseconds maxWait;
    std::chrono::milliseconds pollInterval;
};

#endif // CREDENTIAL_SOURCE_HPP

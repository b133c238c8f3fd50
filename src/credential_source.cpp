#include "credential_source.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <optional>

namespace fs = std::filesystem;

namespace {

constexpr std::array<const char*, 4> kSecretNames{"username", "password", "namespace", "database"};

std::optional<std::string> readSecret(const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::string value((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::nullopt;
    }
    while (!value.empty() && (value.back() == '\n' || value.back() == '\r')) {
        value.pop_back();
    }
    return value;
}

} // namespace

KeyvaultCredentialSource::KeyvaultCredentialSource(std::string directory, Clock& clock,
                                                   std::chrono::milliseconds maxWait,
                                                   std::chrono::milliseconds pollInterval)
    : directory(std::move(directory)), clock(clock), maxWait(maxWait), pollInterval(pollInterval) {}

bool KeyvaultCredentialSource::allPresent() const {
    std::error_code ec;
    for (const char* name : kSecretNames) {
        if (!fs::is_regular_file(fs::path(directory) / name, ec)) {
            return false;
        }
    }
    return true;
}

std::expected<CredentialBundle, BackupError> KeyvaultCredentialSource::load() {
    const auto deadline = clock.now() + maxWait;
    while (!allPresent()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock.now());
        if (remaining.count() <= 0) {
            return std::unexpected(BackupError{BackupErrorCode::CredentialsUnavailable,
                fmt::format("Timeout waiting for keyvault credentials in {}", directory)});
        }
        clock.sleepFor(std::min(pollInterval, remaining));
    }

    std::array<std::string, 4> values;
    for (std::size_t i = 0; i < kSecretNames.size(); ++i) {
        auto value = readSecret(fs::path(directory) / kSecretNames[i]);
        if (!value) {
            return std::unexpected(BackupError{BackupErrorCode::CredentialsUnavailable,
                fmt::format("Failed to read secret: {}", kSecretNames[i])});
        }
        values[i] = std::move(*value);
    }
    return CredentialBundle{values[0], values[1], values[2], values[3]};
}

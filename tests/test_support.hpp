#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "clock.hpp"
#include "credential_source.hpp"
#include "export_client.hpp"

namespace testing_support {

/// Unique directory under the system temp dir, removed with its contents on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return root; }
    std::filesystem::path operator/(const std::string& name) const { return root / name; }

private:
    std::filesystem::path root;
};

/// Clock whose sleeps advance the current time instead of blocking.
class FakeClock : public Clock {
public:
    explicit FakeClock(std::chrono::system_clock::time_point start = std::chrono::system_clock::now())
        : current(start) {}

    std::chrono::system_clock::time_point now() const override { return current; }

    void sleepFor(std::chrono::milliseconds duration) override {
        sleeps.push_back(duration);
        current += duration;
        if (onSleep) {
            onSleep();
        }
    }

    void advance(std::chrono::milliseconds duration) { current += duration; }
    void set(std::chrono::system_clock::time_point time) { current = time; }

    std::chrono::milliseconds totalSlept() const {
        std::chrono::milliseconds total{0};
        for (auto d : sleeps) {
            total += d;
        }
        return total;
    }

    std::vector<std::chrono::milliseconds> sleeps;
    std::function<void()> onSleep;  ///< Runs after every sleep.

private:
    std::chrono::system_clock::time_point current;
};

class FakeCredentialSource : public CredentialSource {
public:
    std::expected<CredentialBundle, BackupError> load() override {
        ++loads;
        if (!bundle) {
            return std::unexpected(BackupError{BackupErrorCode::CredentialsUnavailable, "secret missing"});
        }
        return *bundle;
    }

    std::optional<CredentialBundle> bundle = CredentialBundle{"root", "secret", "core", "main"};
    int loads = 0;
};

/// ExportClient that writes a canned script and records imports.
class FakeExportClient : public ExportClient {
public:
    bool probe() override;
    std::expected<void, BackupError> exportTo(const CredentialBundle& creds, const std::string& destPath) override;
    std::expected<void, BackupError> importFrom(const CredentialBundle& creds, const std::string& sourcePath) override;

    bool reachable = true;
    bool failExport = false;
    bool failImport = false;
    std::string exportContent = kDefaultExport;
    int probeCalls = 0;
    int exportCalls = 0;
    int importCalls = 0;
    std::string importedContent;
    std::function<void(const std::string&)> onExport;  ///< Runs after a successful export with its path.

    static const std::string kDefaultExport;
};

void writeFile(const std::filesystem::path& path, const std::string& content);
std::string readFile(const std::filesystem::path& path);

/// Gzip-compresses content into path.
void writeGzip(const std::filesystem::path& path, const std::string& content);

/// Decompresses a gzip file; empty on failure.
std::string readGzip(const std::filesystem::path& path);

/// Deterministic, poorly compressible text of the given size.
std::string noisyText(std::size_t size, unsigned seed = 7);

/// Number of directory entries (0 if the directory does not exist).
std::size_t entryCount(const std::filesystem::path& dir);

} // namespace testing_support

#endif // TEST_SUPPORT_HPP

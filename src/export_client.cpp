#include "export_client.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fmt/format.h>
#include <mutex>
#include <thread>
#include <curl/curl.h>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxCapturedOutput = 4096;

size_t discardCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

void ensureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void appendTail(std::string& output, const char* data, std::size_t size) {
    output.append(data, size);
    if (output.size() > kMaxCapturedOutput) {
        output.erase(0, output.size() - kMaxCapturedOutput);
    }
}

std::string describeFailure(const CommandResult& result) {
    std::string detail;
    if (result.timedOut) {
        detail = "timed out";
    } else if (result.exitCode < 0) {
        detail = "terminated by signal";
    } else {
        detail = fmt::format("exit code {}", result.exitCode);
    }
    if (!result.output.empty()) {
        detail += fmt::format(": {}", result.output);
    }
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    return detail;
}

} // namespace

std::expected<CommandResult, std::string> runCommand(const std::vector<std::string>& argv,
                                                     std::chrono::milliseconds timeout) {
    if (argv.empty()) {
        return std::unexpected("Empty command line");
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(fmt::format("pipe failed: {}", std::strerror(errno)));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = 0;
    int spawnResult = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    close(fds[1]);
    if (spawnResult != 0) {
        close(fds[0]);
        return std::unexpected(fmt::format("Failed to start {}: {}", argv[0], std::strerror(spawnResult)));
    }

    CommandResult result;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    bool outputOpen = true;
    int status = 0;
    bool reaped = false;
    char buf[4096];

    while (!reaped) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 && !result.timedOut) {
            kill(pid, SIGKILL);
            result.timedOut = true;
        }

        if (outputOpen && !result.timedOut) {
            pollfd pfd{fds[0], POLLIN, 0};
            int ready = poll(&pfd, 1, static_cast<int>(std::min<std::int64_t>(remaining.count(), 200)));
            if (ready > 0) {
                ssize_t n = read(fds[0], buf, sizeof(buf));
                if (n > 0) {
                    appendTail(result.output, buf, static_cast<std::size_t>(n));
                } else if (n == 0 || errno != EINTR) {
                    outputOpen = false;
                }
            } else if (ready < 0 && errno != EINTR) {
                outputOpen = false;
            }
            continue;
        }

        pid_t waited = waitpid(pid, &status, result.timedOut ? 0 : WNOHANG);
        if (waited == pid) {
            reaped = true;
        } else if (waited < 0 && errno != EINTR) {
            close(fds[0]);
            return std::unexpected(fmt::format("waitpid failed: {}", std::strerror(errno)));
        } else if (waited == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    close(fds[0]);

    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

SurrealExportClient::SurrealExportClient(std::string endpoint, std::string cliPath,
                                         std::chrono::milliseconds commandTimeout,
                                         std::chrono::milliseconds probeTimeout,
                                         RetryPolicy probePolicy, Clock& clock)
    : endpoint(std::move(endpoint)),
      cliPath(std::move(cliPath)),
      commandTimeout(commandTimeout),
      probeTimeout(probeTimeout),
      probePolicy(probePolicy),
      clock(clock) {
    ensureCurlInitialized();
}

bool SurrealExportClient::probeOnce() const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return false;
    }

    std::string url = fmt::format("{}/health", endpoint);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, discardCallback);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(probeTimeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(probeTimeout.count()));
    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);
    return res == CURLE_OK;
}

bool SurrealExportClient::probe() {
    for (int attempt = 1; attempt <= probePolicy.attempts; ++attempt) {
        if (probeOnce()) {
            return true;
        }
        if (attempt < probePolicy.attempts) {
            clock.sleepFor(probePolicy.backoff);
        }
    }
    return false;
}

std::vector<std::string> SurrealExportClient::commandLine(const std::string& verb, const CredentialBundle& creds,
                                                          const std::string& path) const {
    return {cliPath, verb,
            "--endpoint", endpoint,
            "--username", creds.username,
            "--password", creds.password,
            "--namespace", creds.ns,
            "--database", creds.database,
            path};
}

std::expected<void, BackupError> SurrealExportClient::exportTo(const CredentialBundle& creds, const std::string& destPath) {
    std::error_code ec;
    fs::create_directories(fs::path(destPath).parent_path(), ec);

    auto result = runCommand(commandLine("export", creds, destPath), commandTimeout);
    if (!result) {
        return std::unexpected(BackupError{BackupErrorCode::ExportFailed, result.error()});
    }
    if (result->timedOut || result->exitCode != 0) {
        fs::remove(destPath, ec);
        return std::unexpected(BackupError{BackupErrorCode::ExportFailed,
            fmt::format("Export command failed ({})", describeFailure(*result))});
    }
    if (!fs::is_regular_file(destPath, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::ExportFailed,
            fmt::format("Export command produced no file: {}", destPath)});
    }
    return {};
}

std::expected<void, BackupError> SurrealExportClient::importFrom(const CredentialBundle& creds, const std::string& sourcePath) {
    std::error_code ec;
    if (!fs::is_regular_file(sourcePath, ec)) {
        return std::unexpected(BackupError{BackupErrorCode::ImportFailed,
            fmt::format("Import source does not exist: {}", sourcePath)});
    }

    auto result = runCommand(commandLine("import", creds, sourcePath), commandTimeout);
    if (!result) {
        return std::unexpected(BackupError{BackupErrorCode::ImportFailed, result.error()});
    }
    if (result->timedOut || result->exitCode != 0) {
        return std::unexpected(BackupError{BackupErrorCode::ImportFailed,
            fmt::format("Import command failed ({})", describeFailure(*result))});
    }
    return {};
}

#include "backup_config.hpp"
#include "backup_daemon.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

namespace {

const std::string kDefaultConfigFile = "backup_config.json";

void usage(const char* program, std::ostream& out) {
    out << "Usage: " << program << " [--config <path>] (--daemon | --run {nightly|weekly})\n"
        << "\n"
        << "  --daemon          Serve /health and run nightly and weekly backups on schedule\n"
        << "  --run <kind>      Run one backup of the given kind manually and exit;\n"
        << "                    a running daemon's /health does not see this run\n"
        << "  --config <path>   JSON configuration (default: " << kDefaultConfigFile << ")\n"
        << "  -h, --help        Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    bool daemonMode = false;
    bool configGiven = false;
    std::string runKind;
    std::string configFile = kDefaultConfigFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--daemon") {
            daemonMode = true;
        } else if (arg == "--run" && i + 1 < argc) {
            runKind = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
            configGiven = true;
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0], std::cout);
            return 0;
        } else {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            usage(argv[0], std::cerr);
            return 1;
        }
    }

    if (daemonMode == !runKind.empty()) {
        usage(argv[0], std::cerr);
        return 1;
    }
    std::optional<BackupKind> kind;
    if (!daemonMode) {
        kind = parseBackupKind(runKind);
        if (!kind) {
            std::cerr << "Error: Invalid backup type: " << runKind << ". Use nightly or weekly." << std::endl;
            return 1;
        }
    }

    std::unique_ptr<BackupDaemon> daemon;
    try {
        std::unique_ptr<BackupConfig> config;
        if (configGiven || std::filesystem::exists(configFile)) {
            config = std::make_unique<BackupConfig>(configFile);
        } else {
            config = std::make_unique<BackupConfig>();
        }
        config->prepareDirectories();
        daemon = std::make_unique<BackupDaemon>(*config);
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    if (daemonMode) {
        return daemon->runDaemon();
    }

    auto result = daemon->runOnce(*kind);
    if (!result) {
        std::cerr << "Error: " << result.error().describe() << std::endl;
        return 1;
    }
    std::cout << "Backup completed successfully: " << result->slotPath.string() << std::endl;
    return 0;
}

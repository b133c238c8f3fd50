#include "artifact_validator.hpp"
#include "backup_config.hpp"
#include "clock.hpp"
#include "credential_source.hpp"
#include "export_client.hpp"
#include "restore_workflow.hpp"
#include "retention_store.hpp"
#include "structured_log.hpp"
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

namespace fs = std::filesystem;

namespace {

const std::string kDefaultConfigFile = "backup_config.json";

void usage(const std::string& program, std::ostream& out) {
    out << "Usage: " << program << " [OPTIONS] BACKUP_TYPE\n"
        << "\n"
        << "Restore the database from a backup file.\n"
        << "\n"
        << "BACKUP_TYPE:\n"
        << "    nightly    Restore from nightly backup\n"
        << "    weekly     Restore from weekly backup\n"
        << "\n"
        << "OPTIONS:\n"
        << "    -h, --help            Show this help message\n"
        << "    -f, --force           Skip confirmation prompt\n"
        << "    -v, --verify          Verify backup integrity only (don't restore)\n"
        << "    --config <path>       JSON configuration (default: " << kDefaultConfigFile << ")\n"
        << "\n"
        << "Examples:\n"
        << "    " << program << " nightly\n"
        << "    " << program << " weekly --force\n"
        << "    " << program << " nightly --verify\n";
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = fs::path(argv[0]).filename().string();
    std::optional<BackupKind> kind;
    RestoreRequest request;
    bool configGiven = false;
    std::string configFile = kDefaultConfigFile;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(program, std::cout);
            return 0;
        } else if (arg == "-f" || arg == "--force") {
            request.force = true;
        } else if (arg == "-v" || arg == "--verify") {
            request.verifyOnly = true;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
            configGiven = true;
        } else if (auto parsed = parseBackupKind(arg); parsed && !kind) {
            kind = parsed;
        } else {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            usage(program, std::cerr);
            return 1;
        }
    }
    if (!kind) {
        std::cerr << "Error: BACKUP_TYPE is required" << std::endl;
        usage(program, std::cerr);
        return 1;
    }
    request.kind = *kind;

    std::unique_ptr<BackupConfig> config;
    try {
        if (configGiven || fs::exists(configFile)) {
            config = std::make_unique<BackupConfig>(configFile);
        } else {
            config = std::make_unique<BackupConfig>();
        }
        config->prepareDirectories();
    } catch (const std::exception& e) {
        std::cerr << "Error: Failed to load config: " << e.what() << std::endl;
        return 1;
    }

    SystemClock clock;
    StructuredLogger logger((fs::path(config->logDir) / "backup.log").string());
    KeyvaultCredentialSource credentials(config->keyvaultDir, clock, config->credentialWait, config->credentialPoll);
    SurrealExportClient exportClient(config->database.endpoint, config->database.cliPath,
                                     config->database.commandTimeout, config->database.probeTimeout,
                                     config->probePolicy, clock);
    ArtifactValidator validator(config->transactionMarker);
    RetentionStore retention(config->backupRoot, config->tempDir, config->exportExtension);
    RestoreWorkflow workflow(retention, validator, credentials, exportClient, clock, logger, config->tempDir,
                             config->exportExtension);

    auto result = workflow.restore(request, std::cin, std::cout);
    if (!result) {
        std::cerr << "Error: " << result.error().describe() << std::endl;
        return 1;
    }

    switch (result->outcome) {
    case RestoreOutcome::Verified:
        std::cout << "Backup verification successful: " << result->slotPath.string() << " ("
                  << result->restoredBytes << " bytes)" << std::endl;
        break;
    case RestoreOutcome::Restored:
        std::cout << "Restore completed successfully in " << result->duration.count() << " ms ("
                  << result->restoredBytes << " bytes)" << std::endl;
        break;
    case RestoreOutcome::Cancelled:
        std::cout << "Restore cancelled" << std::endl;
        break;
    }
    return 0;
}

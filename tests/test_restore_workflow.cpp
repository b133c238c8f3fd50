#include "backup_pipeline.hpp"
#include "restore_workflow.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace fs = std::filesystem;
using namespace testing_support;

class RestoreWorkflowTest : public ::testing::Test {
protected:
    void backUp(BackupKind kind) {
        BackupPipeline pipeline(credentials, exportClient, validator, retention, health, clock, logger,
                                PipelineOptions{dir / "temp", "surql", 9, true});
        auto report = pipeline.run(kind);
        ASSERT_TRUE(report.has_value()) << report.error().describe();
        exportClient.probeCalls = 0;
        exportClient.exportCalls = 0;
        credentials.loads = 0;
    }

    std::expected<RestoreReport, BackupError> restore(BackupKind kind, bool force, bool verifyOnly,
                                                      const std::string& answer = "") {
        std::istringstream in(answer);
        out.str("");
        return workflow.restore(RestoreRequest{kind, force, verifyOnly}, in, out);
    }

    TempDir dir;
    FakeClock clock;
    FakeCredentialSource credentials;
    FakeExportClient exportClient;
    ArtifactValidator validator{"BEGIN TRANSACTION"};
    RetentionStore retention{dir / "backups", dir / "temp", "surql"};
    HealthState health;
    StructuredLogger logger{"", false};
    RestoreWorkflow workflow{retention, validator, credentials, exportClient, clock, logger, dir / "temp", "surql"};
    std::ostringstream out;
};

TEST_F(RestoreWorkflowTest, EmptySlotIsReported) {
    auto result = restore(BackupKind::Nightly, true, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::SlotEmpty);
    EXPECT_EQ(exportClient.importCalls, 0);
}

TEST_F(RestoreWorkflowTest, CorruptWeeklySlotFailsWithoutPromptOrImport) {
    writeFile(retention.path(BackupKind::Weekly), "this is not a gzip stream");

    auto result = restore(BackupKind::Weekly, false, false, "yes\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::CorruptArchive);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(credentials.loads, 0);
    EXPECT_EQ(exportClient.importCalls, 0);
}

TEST_F(RestoreWorkflowTest, TruncatedSlotIsCorrupt) {
    writeGzip(dir / "full.gz", noisyText(60000));
    std::string bytes = readFile(dir / "full.gz");
    writeFile(retention.path(BackupKind::Nightly), bytes.substr(0, bytes.size() / 2));

    auto result = restore(BackupKind::Nightly, true, false);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::CorruptArchive);
    EXPECT_EQ(exportClient.importCalls, 0);
}

TEST_F(RestoreWorkflowTest, VerifyOnlyIsIdempotentAndTouchesNothing) {
    backUp(BackupKind::Nightly);
    const fs::path slot = retention.path(BackupKind::Nightly);
    const std::string bytes = readFile(slot);
    const auto writtenAt = fs::last_write_time(slot);
    const HealthRecord healthBefore = health.snapshot();

    for (int i = 0; i < 2; ++i) {
        auto result = restore(BackupKind::Nightly, false, true);
        ASSERT_TRUE(result.has_value()) << result.error().describe();
        EXPECT_EQ(result->outcome, RestoreOutcome::Verified);
        EXPECT_EQ(result->restoredBytes, exportClient.exportContent.size());
        EXPECT_EQ(result->compressedBytes, bytes.size());
    }

    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(readFile(slot), bytes);
    EXPECT_EQ(fs::last_write_time(slot), writtenAt);
    EXPECT_EQ(credentials.loads, 0);
    EXPECT_EQ(exportClient.importCalls, 0);
    EXPECT_EQ(health.snapshot().status, healthBefore.status);
    EXPECT_TRUE(health.snapshot().lastUpdated == healthBefore.lastUpdated);
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
}

TEST_F(RestoreWorkflowTest, VerifyOnlyRejectsMalformedContent) {
    writeGzip(retention.path(BackupKind::Weekly), "CREATE person:1;\n");

    auto result = restore(BackupKind::Weekly, false, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::MalformedArtifact);
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
}

TEST_F(RestoreWorkflowTest, DeclinedConfirmationCancelsWithoutSideEffects) {
    backUp(BackupKind::Weekly);

    for (const std::string answer : {"no\n", "y\n", "yes please\n", "", " yes\n", "yes \n", "\tyes\n"}) {
        auto result = restore(BackupKind::Weekly, false, false, answer);
        ASSERT_TRUE(result.has_value()) << result.error().describe();
        EXPECT_EQ(result->outcome, RestoreOutcome::Cancelled);
        EXPECT_NE(out.str().find("Type 'yes' to continue"), std::string::npos);
    }
    EXPECT_EQ(credentials.loads, 0);
    EXPECT_EQ(exportClient.importCalls, 0);
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
}

TEST_F(RestoreWorkflowTest, ConfirmedRestoreImportsExportedData) {
    exportClient.exportContent = "BEGIN TRANSACTION;\nCREATE person:ada SET born = 1815;\nCOMMIT TRANSACTION;\n";
    backUp(BackupKind::Nightly);

    auto result = restore(BackupKind::Nightly, false, false, "YES\n");
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result->outcome, RestoreOutcome::Restored);
    EXPECT_EQ(exportClient.importCalls, 1);
    EXPECT_EQ(exportClient.importedContent, exportClient.exportContent);
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
    EXPECT_TRUE(retention.stat(BackupKind::Nightly).exists);
}

TEST_F(RestoreWorkflowTest, ConfirmationAcceptsCarriageReturnLineEnding) {
    backUp(BackupKind::Weekly);

    auto result = restore(BackupKind::Weekly, false, false, "Yes\r\n");
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result->outcome, RestoreOutcome::Restored);
    EXPECT_EQ(exportClient.importCalls, 1);
}

TEST_F(RestoreWorkflowTest, ForcedRestoreSkipsPrompt) {
    backUp(BackupKind::Weekly);

    auto result = restore(BackupKind::Weekly, true, false);
    ASSERT_TRUE(result.has_value()) << result.error().describe();
    EXPECT_EQ(result->outcome, RestoreOutcome::Restored);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(exportClient.importCalls, 1);
}

TEST_F(RestoreWorkflowTest, ImportAndCredentialFailuresAreReported) {
    backUp(BackupKind::Nightly);
    const std::string bytes = readFile(retention.path(BackupKind::Nightly));

    exportClient.failImport = true;
    auto importResult = restore(BackupKind::Nightly, true, false);
    ASSERT_FALSE(importResult.has_value());
    EXPECT_EQ(importResult.error().code, BackupErrorCode::ImportFailed);

    credentials.bundle.reset();
    auto credentialResult = restore(BackupKind::Nightly, true, false);
    ASSERT_FALSE(credentialResult.has_value());
    EXPECT_EQ(credentialResult.error().code, BackupErrorCode::CredentialsUnavailable);

    EXPECT_EQ(readFile(retention.path(BackupKind::Nightly)), bytes);
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
}

#include "retention_store.hpp"
#include "artifact_validator.hpp"
#include "test_support.hpp"
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

namespace fs = std::filesystem;
using namespace testing_support;

class RetentionStoreTest : public ::testing::Test {
protected:
    fs::path artifact(const std::string& content) {
        fs::path path = dir / "temp" / ("artifact_" + std::to_string(counter++) + ".surql.gz");
        writeGzip(path, content);
        return path;
    }

    TempDir dir;
    RetentionStore store{dir / "backups", dir / "temp", "surql"};
    int counter = 0;
};

TEST_F(RetentionStoreTest, SlotPathsAreFixedPerKind) {
    EXPECT_EQ(store.path(BackupKind::Nightly), dir / "backups" / "nightly_backup.surql.gz");
    EXPECT_EQ(store.path(BackupKind::Weekly), dir / "backups" / "weekly_backup.surql.gz");
    EXPECT_FALSE(store.stat(BackupKind::Nightly).exists);
}

TEST_F(RetentionStoreTest, CommitMovesArtifactIntoSlot) {
    fs::path first = artifact("first");
    ASSERT_TRUE(store.commit(BackupKind::Nightly, first).has_value());

    EXPECT_FALSE(fs::exists(first));
    SlotInfo info = store.stat(BackupKind::Nightly);
    EXPECT_TRUE(info.exists);
    EXPECT_EQ(info.sizeBytes, fs::file_size(store.path(BackupKind::Nightly)));
    EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), "first");
}

TEST_F(RetentionStoreTest, RepeatedCommitsKeepOneFilePerKind) {
    for (const std::string content : {"one", "two", "three"}) {
        ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact(content)).has_value());
        EXPECT_EQ(entryCount(dir / "backups"), 1u);
        EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), content);
    }
    ASSERT_TRUE(store.commit(BackupKind::Weekly, artifact("weekly")).has_value());
    EXPECT_EQ(entryCount(dir / "backups"), 2u);
    EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), "three");
}

TEST_F(RetentionStoreTest, MissingArtifactLeavesSlotUntouched) {
    ASSERT_TRUE(store.commit(BackupKind::Weekly, artifact("kept")).has_value());

    auto result = store.commit(BackupKind::Weekly, dir / "temp" / "absent.surql.gz");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::CommitFailed);
    EXPECT_EQ(readGzip(store.path(BackupKind::Weekly)), "kept");
}

TEST_F(RetentionStoreTest, RollbackRestoresShadowedPredecessor) {
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact("previous")).has_value());
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact("rejected"), true).has_value());
    EXPECT_TRUE(store.canRollback(BackupKind::Nightly));
    EXPECT_EQ(entryCount(dir / "backups"), 1u);

    ASSERT_TRUE(store.rollback(BackupKind::Nightly).has_value());
    EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), "previous");
    EXPECT_FALSE(store.canRollback(BackupKind::Nightly));
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
}

TEST_F(RetentionStoreTest, RollbackWithoutPredecessorEmptiesSlot) {
    ASSERT_TRUE(store.commit(BackupKind::Weekly, artifact("rejected"), true).has_value());
    ASSERT_TRUE(store.rollback(BackupKind::Weekly).has_value());
    EXPECT_FALSE(store.stat(BackupKind::Weekly).exists);
}

TEST_F(RetentionStoreTest, RollbackRequiresShadowedCommit) {
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact("plain")).has_value());
    EXPECT_FALSE(store.canRollback(BackupKind::Nightly));
    auto result = store.rollback(BackupKind::Nightly);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, BackupErrorCode::CommitFailed);
    EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), "plain");
}

TEST_F(RetentionStoreTest, DiscardShadowDropsRollbackPoint) {
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact("previous")).has_value());
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact("current"), true).has_value());
    store.discardShadow(BackupKind::Nightly);

    EXPECT_FALSE(store.canRollback(BackupKind::Nightly));
    EXPECT_EQ(entryCount(dir / "temp"), 0u);
    EXPECT_EQ(readGzip(store.path(BackupKind::Nightly)), "current");
}

TEST_F(RetentionStoreTest, ConcurrentReaderNeverSeesPartialSlot) {
    ASSERT_TRUE(store.commit(BackupKind::Nightly, artifact(noisyText(20000, 1))).has_value());

    ArtifactValidator validator("BEGIN TRANSACTION");
    std::atomic<bool> done{false};
    std::atomic<int> badReads{0};
    std::thread reader([&] {
        while (!done.load()) {
            SlotInfo info = store.stat(BackupKind::Nightly);
            if (!info.exists || info.sizeBytes == 0 ||
                !validator.validateCompressed(store.path(BackupKind::Nightly).string())) {
                ++badReads;
            }
        }
    });

    for (unsigned i = 2; i < 30; ++i) {
        EXPECT_TRUE(store.commit(BackupKind::Nightly, artifact(noisyText(20000, i)), true).has_value());
        store.discardShadow(BackupKind::Nightly);
    }
    done = true;
    reader.join();
    EXPECT_EQ(badReads.load(), 0);
}

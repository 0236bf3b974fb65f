#include "TestSupport.hpp"
#include <algorithm>
#include "core/RetentionPruner.hpp"
#include "core/models/Job.hpp"

class RetentionPrunerTest : public ::testing::Test {
protected:
    fs::path targetDir;
    MockLogger mockLogger;

    void SetUp() override {
        targetDir = uniqueTestDir("snapshotd_prune");
        fs::remove_all(targetDir);
        for (const char* name : {"2024-01-01", "2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"}) {
            writeFile(targetDir / name / "data" / "file.txt", name);
        }
        allowAllLogging(mockLogger);
    }

    void TearDown() override {
        fs::remove_all(targetDir);
    }

    Job makeJob(BackupMethod method, std::optional<size_t> limit) {
        Job job;
        job.id = "job";
        job.sourcePath = "/nonexistent/source";
        job.targetPath = targetDir.string();
        job.period = std::chrono::seconds(1);
        job.method = method;
        job.limit = limit;
        return job;
    }

    std::vector<std::string> remaining() {
        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(targetDir)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
};

TEST_F(RetentionPrunerTest, DiffKeepsMostRecent) {
    RetentionPruner pruner(&mockLogger);
    PruneResult result = pruner.prune(makeJob(BackupMethod::DIFF, 3));

    EXPECT_EQ(result.removed, (std::vector<std::string>{"2024-01-01", "2024-01-02"}));
    EXPECT_TRUE(result.failed.empty());
    EXPECT_EQ(remaining(), (std::vector<std::string>{"2024-01-03", "2024-01-04", "2024-01-05"}));
}

TEST_F(RetentionPrunerTest, WithinLimitIsNoop) {
    RetentionPruner pruner(&mockLogger);
    EXPECT_TRUE(pruner.prune(makeJob(BackupMethod::DIFF, 5)).removed.empty());
    EXPECT_TRUE(pruner.prune(makeJob(BackupMethod::DIFF, std::nullopt)).removed.empty());
    EXPECT_EQ(remaining().size(), 5u);
}

TEST_F(RetentionPrunerTest, FullIsUnlimited) {
    RetentionPruner pruner(&mockLogger);
    EXPECT_TRUE(pruner.prune(makeJob(BackupMethod::FULL, 1)).removed.empty());
    EXPECT_EQ(remaining().size(), 5u);
}

TEST_F(RetentionPrunerTest, LastKeepsOne) {
    RetentionPruner pruner(&mockLogger);
    PruneResult result = pruner.prune(makeJob(BackupMethod::LAST, std::nullopt));
    EXPECT_EQ(result.removed.size(), 4u);
    EXPECT_EQ(remaining(), std::vector<std::string>{"2024-01-05"});
}

// 临时目录不是快照，不参与计数也不会被删除
TEST_F(RetentionPrunerTest, TemporaryDirectoriesAreIgnored) {
    fs::create_directories(targetDir / ".2024-01-06.tmp");
    RetentionPruner pruner(&mockLogger);
    PruneResult result = pruner.prune(makeJob(BackupMethod::DIFF, 4));
    EXPECT_EQ(result.removed, std::vector<std::string>{"2024-01-01"});
    EXPECT_TRUE(fs::exists(targetDir / ".2024-01-06.tmp"));
}

TEST_F(RetentionPrunerTest, ReadOnlySnapshotIsStillRemoved) {
    fs::permissions(targetDir / "2024-01-01" / "data", fs::perms::owner_read | fs::perms::owner_exec,
                    fs::perm_options::replace);
    RetentionPruner pruner(&mockLogger);
    PruneResult result = pruner.prune(makeJob(BackupMethod::DIFF, 4));
    EXPECT_EQ(result.removed, std::vector<std::string>{"2024-01-01"});
    EXPECT_FALSE(fs::exists(targetDir / "2024-01-01"));
}

TEST_F(RetentionPrunerTest, MissingTargetIsNoop) {
    fs::remove_all(targetDir);
    RetentionPruner pruner(&mockLogger);
    PruneResult result = pruner.prune(makeJob(BackupMethod::DIFF, 1));
    EXPECT_TRUE(result.removed.empty());
    EXPECT_TRUE(result.failed.empty());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

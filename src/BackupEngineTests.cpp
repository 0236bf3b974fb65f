#include "TestSupport.hpp"
#include <map>
#include "core/BackupEngine.hpp"
#include "core/SnapshotStore.hpp"
#include "core/models/Job.hpp"
#include "utils/SnapshotArchiver.hpp"

using ::testing::HasSubstr;

class BackupEngineTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path sourceDir;
    fs::path targetDir;
    MockLogger mockLogger;
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();

    void SetUp() override {
        testDir = uniqueTestDir("snapshotd_engine");
        sourceDir = testDir / "source";
        targetDir = testDir / "target" / "job";
        fs::remove_all(testDir);
        writeFile(sourceDir / "a.txt", "alpha");
        writeFile(sourceDir / "b.txt", "bravo");
        allowAllLogging(mockLogger);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    Job makeJob(BackupMethod method, std::optional<size_t> limit = std::nullopt, bool compress = false) {
        Job job;
        job.id = "job";
        job.sourcePath = sourceDir.string();
        job.targetPath = targetDir.string();
        job.period = std::chrono::seconds(1);
        job.method = method;
        job.limit = limit;
        job.compress = compress;
        return job;
    }

    // 每次运行前推进时钟一秒，保证快照名递增
    RunResult runOnce(BackupEngine& engine, const Job& job) {
        clock->advance(std::chrono::seconds(1));
        return engine.run(job);
    }

    std::vector<SnapshotInfo> snapshots() {
        std::error_code ec;
        return SnapshotStore(targetDir.string()).list(ec);
    }

    Manifest manifestOf(const SnapshotInfo& info) {
        Manifest manifest;
        std::string error;
        EXPECT_TRUE(SnapshotStore(targetDir.string()).loadManifest(info, manifest, error)) << error;
        return manifest;
    }

    // 读取目录下所有普通文件：相对路径 -> 内容
    static std::map<std::string, std::string> readTree(const fs::path& root) {
        std::map<std::string, std::string> tree;
        if (!fs::exists(root)) {
            return tree;
        }
        for (const auto& entry : fs::recursive_directory_iterator(root)) {
            if (entry.is_regular_file()) {
                tree[entry.path().lexically_relative(root).generic_string()] = readFile(entry.path());
            }
        }
        return tree;
    }
};

// full：源目录不变时第二次运行不产生新快照
TEST_F(BackupEngineTest, FullIsIdempotentWithoutChanges) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::FULL);
    EXPECT_CALL(mockLogger, info(HasSubstr("event=run_skipped"))).Times(1);

    RunResult first = runOnce(engine, job);
    EXPECT_EQ(first.status, TaskStatus::COMPLETED);
    EXPECT_EQ(first.added, 2u);

    RunResult second = runOnce(engine, job);
    EXPECT_EQ(second.status, TaskStatus::SKIPPED);
    EXPECT_TRUE(second.snapshotName.empty());
    EXPECT_EQ(snapshots().size(), 1u);
}

// full：两次运行之间修改b.txt，两个快照各自保存当时的内容
TEST_F(BackupEngineTest, FullTwoSnapshotsScenario) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::FULL);

    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    modifyFile(sourceDir / "b.txt", "bravo modified");
    RunResult second = runOnce(engine, job);
    ASSERT_EQ(second.status, TaskStatus::COMPLETED);
    EXPECT_EQ(second.modified, 1u);

    auto list = snapshots();
    ASSERT_EQ(list.size(), 2u);
    auto firstTree = readTree(SnapshotStore::dataPath(list[0].path));
    auto secondTree = readTree(SnapshotStore::dataPath(list[1].path));
    EXPECT_EQ(firstTree["a.txt"], "alpha");
    EXPECT_EQ(firstTree["b.txt"], "bravo");
    EXPECT_EQ(secondTree["a.txt"], "alpha");
    EXPECT_EQ(secondTree["b.txt"], "bravo modified");
    EXPECT_EQ(second.snapshotName, list[1].name);
}

// last：N次运行后只剩一个快照，内容为最后一次的状态
TEST_F(BackupEngineTest, LastKeepsSingleLatestSnapshot) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::LAST);

    for (int i = 0; i < 4; i++) {
        modifyFile(sourceDir / "a.txt", "alpha " + std::to_string(i));
        RunResult result = runOnce(engine, job);
        ASSERT_EQ(result.status, TaskStatus::COMPLETED);
        ASSERT_EQ(snapshots().size(), 1u);
    }

    auto list = snapshots();
    auto tree = readTree(SnapshotStore::dataPath(list[0].path));
    EXPECT_EQ(tree["a.txt"], "alpha 3");
    EXPECT_EQ(tree["b.txt"], "bravo");
}

// diff：按顺序应用每个快照的新增/修改/删除，得到源目录最终状态；
// 之后的快照不包含未变化的文件
TEST_F(BackupEngineTest, DiffChainReconstructsSource) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::DIFF);

    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    modifyFile(sourceDir / "a.txt", "alpha 2");
    writeFile(sourceDir / "dir" / "c.txt", "charlie");
    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    fs::remove(sourceDir / "b.txt");
    modifyFile(sourceDir / "dir" / "c.txt", "charlie 2");
    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    EXPECT_EQ(runOnce(engine, job).status, TaskStatus::SKIPPED);

    auto list = snapshots();
    ASSERT_EQ(list.size(), 3u);

    std::map<std::string, std::string> replay;
    for (size_t i = 0; i < list.size(); i++) {
        Manifest manifest = manifestOf(list[i]);
        auto stored = readTree(SnapshotStore::dataPath(list[i].path));
        for (const auto& path : manifest.pathsWith(ChangeTag::REMOVED)) {
            replay.erase(path);
        }
        for (const auto& item : stored) {
            const ManifestEntry* entry = manifest.find(item.first);
            ASSERT_NE(entry, nullptr);
            EXPECT_TRUE(entry->change == ChangeTag::ADDED || entry->change == ChangeTag::MODIFIED);
            replay[item.first] = item.second;
        }
        if (i > 0) {
            // 只保存变化的文件
            EXPECT_EQ(stored.size(), manifest.pathsWith(ChangeTag::ADDED).size() +
                                     manifest.pathsWith(ChangeTag::MODIFIED).size());
        }
    }
    EXPECT_EQ(replay, readTree(sourceDir));
    EXPECT_EQ(readTree(SnapshotStore::dataPath(list[2].path)),
              (std::map<std::string, std::string>{{"dir/c.txt", "charlie 2"}}));
}

// diff，limit=3：五次运行后只保留最近的三个
TEST_F(BackupEngineTest, DiffLimitKeepsMostRecent) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::DIFF, 3);

    std::vector<std::string> names;
    for (int i = 0; i < 5; i++) {
        modifyFile(sourceDir / "a.txt", "alpha " + std::to_string(i));
        RunResult result = runOnce(engine, job);
        ASSERT_EQ(result.status, TaskStatus::COMPLETED);
        names.push_back(result.snapshotName);
        EXPECT_LE(snapshots().size(), 3u);
    }

    auto list = snapshots();
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].name, names[2]);
    EXPECT_EQ(list[1].name, names[3]);
    EXPECT_EQ(list[2].name, names[4]);
}

// diff + compress：只有最新的快照不压缩
TEST_F(BackupEngineTest, DiffCompressionLeavesLatestUncompressed) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::DIFF, std::nullopt, true);

    for (int i = 0; i < 3; i++) {
        modifyFile(sourceDir / "a.txt", "alpha " + std::to_string(i));
        ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);

        auto list = snapshots();
        for (size_t j = 0; j + 1 < list.size(); j++) {
            EXPECT_TRUE(list[j].compressed) << list[j].name;
            EXPECT_FALSE(fs::exists(SnapshotStore::dataPath(list[j].path)));
        }
        EXPECT_FALSE(list.back().compressed);
        EXPECT_TRUE(fs::exists(SnapshotStore::dataPath(list.back().path)));
    }

    // 压缩后的旧快照仍可解开
    auto list = snapshots();
    SnapshotArchiver archiver;
    std::string error;
    fs::path out = testDir / "extracted";
    ASSERT_TRUE(archiver.extractArchive(SnapshotStore::archivePath(list[1].path).string(), out.string(), error))
        << error;
    EXPECT_EQ(readFile(out / "a.txt"), "alpha 1");
}

TEST_F(BackupEngineTest, FullCompressedSnapshotsStillDetectNoop) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::FULL, std::nullopt, true);

    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    EXPECT_TRUE(snapshots()[0].compressed);
    EXPECT_EQ(runOnce(engine, job).status, TaskStatus::SKIPPED);
}

TEST_F(BackupEngineTest, MissingSourceFailsRun) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::FULL);
    job.sourcePath = (testDir / "missing").string();
    EXPECT_CALL(mockLogger, error(HasSubstr("error=SourceUnreadable"))).Times(1);

    RunResult result = runOnce(engine, job);
    EXPECT_EQ(result.status, TaskStatus::FAILED);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, ErrorKind::SOURCE_UNREADABLE);
    EXPECT_TRUE(snapshots().empty());
}

// 同一时间点再次运行会与已有快照重名
TEST_F(BackupEngineTest, NameCollisionIsWriteError) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::FULL);
    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);

    modifyFile(sourceDir / "a.txt", "alpha 2");
    RunResult result = engine.run(job);
    EXPECT_EQ(result.status, TaskStatus::FAILED);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, ErrorKind::SNAPSHOT_WRITE_ERROR);
    EXPECT_EQ(snapshots().size(), 1u);

    // 下一个周期正常完成
    EXPECT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
}

TEST_F(BackupEngineTest, SkippedEntriesAreReported) {
    fs::create_symlink(sourceDir / "a.txt", sourceDir / "link");
    BackupEngine engine(&mockLogger, clock);
    EXPECT_CALL(mockLogger, warn(HasSubstr("event=file_skipped"))).Times(1);

    RunResult result = runOnce(engine, makeJob(BackupMethod::FULL));
    EXPECT_EQ(result.status, TaskStatus::COMPLETED);
    EXPECT_EQ(result.skipped, 1u);
    EXPECT_FALSE(fs::exists(SnapshotStore::dataPath(snapshots()[0].path) / "link"));
}

TEST_F(BackupEngineTest, CorruptManifestIsTreatedAsFirstRun) {
    BackupEngine engine(&mockLogger, clock);
    Job job = makeJob(BackupMethod::DIFF);
    ASSERT_EQ(runOnce(engine, job).status, TaskStatus::COMPLETED);
    writeFile(SnapshotStore::manifestPath(snapshots()[0].path), "garbage");
    EXPECT_CALL(mockLogger, warn(HasSubstr("ignoring manifest"))).Times(1);

    RunResult result = runOnce(engine, job);
    EXPECT_EQ(result.status, TaskStatus::COMPLETED);
    EXPECT_EQ(result.added, 2u);
}

TEST_F(BackupEngineTest, RemovesStaleTemporaries) {
    fs::create_directories(targetDir / ".2024-01-01_00-00-00-000000.tmp" / "data");
    fs::create_directories(targetDir / "2024-01-01_00-00-00-000001");
    BackupEngine engine(&mockLogger, clock);

    EXPECT_EQ(engine.removeStaleTemporaries(makeJob(BackupMethod::FULL)), 1u);
    EXPECT_FALSE(fs::exists(targetDir / ".2024-01-01_00-00-00-000000.tmp"));
    EXPECT_TRUE(fs::exists(targetDir / "2024-01-01_00-00-00-000001"));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

#include "TestSupport.hpp"
#include <unistd.h>
#include "core/BackupError.hpp"
#include "core/ChangeDetector.hpp"
#include "core/Filter.hpp"

class ChangeDetectorTest : public ::testing::Test {
protected:
    fs::path testDir;
    fs::path sourceDir;

    void SetUp() override {
        testDir = uniqueTestDir("snapshotd_detect");
        sourceDir = testDir / "source";
        fs::remove_all(testDir);
        writeFile(sourceDir / "a.txt", "alpha");
        writeFile(sourceDir / "b.txt", "bravo");
        writeFile(sourceDir / "sub" / "c.txt", "charlie");
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(sourceDir / "locked", fs::perms::owner_all, fs::perm_options::add, ec);
        fs::permissions(sourceDir / "secret.txt", fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(testDir);
    }
};

// 没有基线时全部为新增
TEST_F(ChangeDetectorTest, FirstRunAddsEverything) {
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult result = detector.detect(sourceDir.string(), nullptr);

    EXPECT_EQ(result.added, (std::set<std::string>{"a.txt", "b.txt", "sub/c.txt"}));
    EXPECT_TRUE(result.modified.empty());
    EXPECT_TRUE(result.removed.empty());
    EXPECT_EQ(result.directories, std::vector<std::string>{"sub"});
    EXPECT_TRUE(result.hasChanges());
    EXPECT_EQ(result.newManifest.presentCount(), 3u);
    EXPECT_EQ(result.newManifest.find("a.txt")->change, ChangeTag::ADDED);
}

TEST_F(ChangeDetectorTest, NoChangesAgainstOwnManifest) {
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);
    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);

    EXPECT_FALSE(second.hasChanges());
    EXPECT_EQ(second.unchanged.size(), 3u);
    EXPECT_EQ(second.presentFiles(), (std::vector<std::string>{"a.txt", "b.txt", "sub/c.txt"}));
}

TEST_F(ChangeDetectorTest, AddedModifiedRemoved) {
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);

    modifyFile(sourceDir / "b.txt", "bravo two");
    writeFile(sourceDir / "sub" / "d.txt", "delta");
    fs::remove(sourceDir / "a.txt");

    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);
    EXPECT_EQ(second.added, std::set<std::string>{"sub/d.txt"});
    EXPECT_EQ(second.modified, std::set<std::string>{"b.txt"});
    EXPECT_EQ(second.removed, std::set<std::string>{"a.txt"});
    EXPECT_EQ(second.unchanged, std::set<std::string>{"sub/c.txt"});

    // 新清单是完整状态，删除的路径保留为删除标记
    const ManifestEntry* marker = second.newManifest.find("a.txt");
    ASSERT_NE(marker, nullptr);
    EXPECT_EQ(marker->status, EntryStatus::DELETED);
    EXPECT_EQ(marker->change, ChangeTag::REMOVED);
    EXPECT_EQ(second.newManifest.presentCount(), 3u);

    // 删除标记不会在下一轮再次报告
    DetectionResult third = detector.detect(sourceDir.string(), &second.newManifest);
    EXPECT_FALSE(third.hasChanges());
}

TEST_F(ChangeDetectorTest, DeletedPathReappearsAsAdded) {
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);
    fs::remove(sourceDir / "a.txt");
    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);
    writeFile(sourceDir / "a.txt", "alpha again");
    DetectionResult third = detector.detect(sourceDir.string(), &second.newManifest);
    EXPECT_EQ(third.added, std::set<std::string>{"a.txt"});
}

TEST_F(ChangeDetectorTest, SymlinkIsSkipped) {
    fs::create_symlink(sourceDir / "a.txt", sourceDir / "link.txt");
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult result = detector.detect(sourceDir.string(), nullptr);

    EXPECT_EQ(result.skipped.count("link.txt"), 1u);
    EXPECT_EQ(result.added.count("link.txt"), 0u);
    EXPECT_EQ(result.added.size(), 3u);
}

TEST_F(ChangeDetectorTest, HashModeIgnoresTouch) {
    ChangeDetector detector(FingerprintMode::CONTENT_HASH);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);
    EXPECT_EQ(first.newManifest.find("a.txt")->fingerprint.contentHash.size(), 64u);

    // 只改修改时间
    auto mtime = fs::last_write_time(sourceDir / "a.txt");
    fs::last_write_time(sourceDir / "a.txt", mtime + std::chrono::seconds(10));
    // 同样长度、不同内容
    writeFile(sourceDir / "b.txt", "BRAVO");

    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);
    EXPECT_EQ(second.modified, std::set<std::string>{"b.txt"});
    EXPECT_EQ(second.unchanged.count("a.txt"), 1u);
}

TEST_F(ChangeDetectorTest, UnreadableFileIsSkippedAndCarried) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root can read everything";
    }
    writeFile(sourceDir / "secret.txt", "top secret");
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);
    ASSERT_EQ(first.added.count("secret.txt"), 1u);

    fs::permissions(sourceDir / "secret.txt", fs::perms::none, fs::perm_options::replace);
    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);

    EXPECT_EQ(second.skipped.count("secret.txt"), 1u);
    EXPECT_EQ(second.removed.count("secret.txt"), 0u);
    EXPECT_EQ(second.carried.count("secret.txt"), 1u);
    EXPECT_TRUE(second.newManifest.isPresent("secret.txt"));
    EXPECT_FALSE(second.hasChanges());
}

TEST_F(ChangeDetectorTest, UnreadableDirectoryDoesNotRemoveItsFiles) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "root can read everything";
    }
    writeFile(sourceDir / "locked" / "inner.txt", "inner");
    ChangeDetector detector(FingerprintMode::METADATA);
    DetectionResult first = detector.detect(sourceDir.string(), nullptr);

    fs::permissions(sourceDir / "locked", fs::perms::none, fs::perm_options::replace);
    DetectionResult second = detector.detect(sourceDir.string(), &first.newManifest);

    EXPECT_EQ(second.skipped.count("locked"), 1u);
    EXPECT_TRUE(second.removed.empty());
    EXPECT_EQ(second.carried.count("locked/inner.txt"), 1u);
    EXPECT_TRUE(second.newManifest.isPresent("locked/inner.txt"));
}

TEST_F(ChangeDetectorTest, NameFilterSkipsUnrepresentableNames) {
    writeFile(sourceDir / "what?.txt", "question");
    auto filter = TargetNameFilter::forFilesystemType("vfat");
    ChangeDetector detector(FingerprintMode::METADATA, filter);
    DetectionResult result = detector.detect(sourceDir.string(), nullptr);

    EXPECT_EQ(result.skipped.count("what?.txt"), 1u);
    EXPECT_EQ(result.added.count("what?.txt"), 0u);
    EXPECT_EQ(result.added.count("a.txt"), 1u);
}

TEST_F(ChangeDetectorTest, MissingSourceThrows) {
    ChangeDetector detector(FingerprintMode::METADATA);
    try {
        detector.detect((testDir / "nope").string(), nullptr);
        FAIL() << "expected BackupError";
    } catch (const BackupError& e) {
        EXPECT_EQ(e.getKind(), ErrorKind::SOURCE_UNREADABLE);
    }
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

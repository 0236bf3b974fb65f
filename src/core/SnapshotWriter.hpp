#pragma once
#include <string>
#include <utility>
#include <vector>
#include "SnapshotStore.hpp"

class ILogger;
struct Job;
struct DetectionResult;

struct WriteResult {
    SnapshotInfo snapshot;
    // last方式在新快照落盘后删除的旧快照
    std::vector<std::string> replaced;
    // diff方式本次压缩的较旧快照
    std::vector<std::string> compressedOlder;
    // 提交后清理失败的快照：名称 -> 原因
    std::vector<std::pair<std::string, std::string>> cleanupFailures;
};

// 按任务的备份方式把一次检测结果写成新快照。
// 先写入 .<name>.tmp，全部复制成功后再改名，失败时丢弃临时目录并抛出
// BackupError(SNAPSHOT_WRITE_ERROR)，已有快照不受影响。
class SnapshotWriter {
private:
    ILogger* logger;

    void copyFiles(const Job& job, const fs::path& dataDir, const std::vector<std::string>& files) const;
    void createDirectories(const Job& job, const fs::path& dataDir, const std::vector<std::string>& directories) const;
    void applyDirectoryMetadata(const Job& job, const fs::path& dataDir, const std::vector<std::string>& directories) const;
    // 把快照目录中的data/压缩为data.pkg.huff并删除data/
    bool compressSnapshotData(const fs::path& snapshotDir, std::string& errorMessage) const;

    void removePreviousSnapshots(const SnapshotStore& store, const std::string& keep, WriteResult& result) const;
    void compressOlderSnapshots(const SnapshotStore& store, const std::string& latest, WriteResult& result) const;

public:
    explicit SnapshotWriter(ILogger* logger);

    WriteResult write(const Job& job, const std::string& snapshotName,
                      const DetectionResult& detection, const std::string& createdAt) const;
};

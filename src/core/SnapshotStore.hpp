#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "models/Manifest.hpp"

namespace fs = std::filesystem;

class ILogger;

// 一个快照在磁盘上的位置
struct SnapshotInfo {
    std::string name;
    fs::path path;
    bool compressed = false;
};

// 单个任务目标目录下的快照布局：
//   <target>/<name>/manifest
//   <target>/<name>/data/ 或 <target>/<name>/data.pkg.huff
//   <target>/.<name>.tmp/   写入中的快照，不计入列表
class SnapshotStore {
private:
    fs::path root;

public:
    static constexpr const char* DATA_DIR = "data";
    static constexpr const char* ARCHIVE_FILE = "data.pkg.huff";
    static constexpr const char* TEMP_SUFFIX = ".tmp";

    explicit SnapshotStore(const std::string& targetPath);

    const fs::path& getRoot() const;

    // 按名称（即时间）升序列出快照；目标目录不存在时返回空列表
    std::vector<SnapshotInfo> list(std::error_code& ec) const;
    std::optional<SnapshotInfo> latest(std::error_code& ec) const;

    bool exists(const std::string& name) const;
    fs::path snapshotPath(const std::string& name) const;
    fs::path tempPath(const std::string& name) const;

    static fs::path dataPath(const fs::path& snapshotDir);
    static fs::path archivePath(const fs::path& snapshotDir);
    static fs::path manifestPath(const fs::path& snapshotDir);

    bool loadManifest(const SnapshotInfo& snapshot, Manifest& manifest, std::string& errorMessage) const;

    bool remove(const std::string& name, std::error_code& ec) const;

    // 删除崩溃遗留的临时快照目录，返回删除的数量
    size_t removeStaleTemporaries(ILogger* logger) const;
};

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "../Types.hpp"

// 清单条目状态
enum class EntryStatus : uint8_t {
    PRESENT = 0,
    DELETED = 1
};

// 相对于上一个快照的变化标记
enum class ChangeTag : uint8_t {
    UNCHANGED = 0,
    ADDED = 1,
    MODIFIED = 2,
    REMOVED = 3
};

struct Fingerprint {
    uint64_t size = 0;
    int64_t mtimeNs = 0;
    std::string contentHash;   // 十六进制SHA-256，METADATA模式下为空

    // 按给定模式判断内容是否相同
    bool sameContent(const Fingerprint& other, FingerprintMode mode) const;
};

struct ManifestEntry {
    Fingerprint fingerprint;
    EntryStatus status = EntryStatus::PRESENT;
    ChangeTag change = ChangeTag::UNCHANGED;
    unsigned int permissions = 0;
};

// 快照清单：相对路径 -> 指纹/状态
// 对diff方式，最新快照的清单反映源目录的完整当前状态，而不仅是增量
class Manifest {
private:
    std::string snapshotName;
    BackupMethod method;
    std::string createdAt;
    std::map<std::string, ManifestEntry> entries;

public:
    static constexpr const char* FILE_NAME = "manifest";

    Manifest();

    void setSnapshotName(const std::string& name);
    const std::string& getSnapshotName() const;
    void setMethod(BackupMethod method);
    BackupMethod getMethod() const;
    void setCreatedAt(const std::string& timestamp);
    const std::string& getCreatedAt() const;

    void put(const std::string& path, const ManifestEntry& entry);
    void erase(const std::string& path);
    // 不存在时返回nullptr
    const ManifestEntry* find(const std::string& path) const;
    // 仅当条目存在且状态为PRESENT时返回true
    bool isPresent(const std::string& path) const;
    const std::map<std::string, ManifestEntry>& getEntries() const;
    size_t size() const;
    size_t presentCount() const;
    std::vector<std::string> pathsWith(ChangeTag tag) const;

    // 二进制读写，格式见save()实现
    bool save(const std::string& filePath, std::string& errorMessage) const;
    bool load(const std::string& filePath, std::string& errorMessage);
};

std::string toString(ChangeTag tag);

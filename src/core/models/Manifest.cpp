#include "Manifest.hpp"
#include <cstring>
#include <fstream>

namespace {

const char MANIFEST_MAGIC[8] = {'S', 'N', 'A', 'P', 'M', 'F', '0', '1'};

// 防止损坏文件导致超大内存分配
const uint32_t MAX_STRING_LENGTH = 64 * 1024;

template <typename T>
void writeValue(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool readValue(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

void writeString(std::ofstream& out, const std::string& value) {
    uint32_t length = static_cast<uint32_t>(value.size());
    writeValue(out, length);
    out.write(value.data(), length);
}

bool readString(std::ifstream& in, std::string& value) {
    uint32_t length = 0;
    if (!readValue(in, length) || length > MAX_STRING_LENGTH) {
        return false;
    }
    value.resize(length);
    if (length > 0) {
        in.read(&value[0], length);
    }
    return static_cast<bool>(in);
}

} // namespace

bool Fingerprint::sameContent(const Fingerprint& other, FingerprintMode mode) const {
    if (size != other.size) {
        return false;
    }
    if (mode == FingerprintMode::CONTENT_HASH) {
        // 基线中没有哈希（例如指纹模式被切换过）时视为已修改
        return !contentHash.empty() && contentHash == other.contentHash;
    }
    return mtimeNs == other.mtimeNs;
}

std::string toString(ChangeTag tag) {
    switch (tag) {
        case ChangeTag::UNCHANGED: return "unchanged";
        case ChangeTag::ADDED: return "added";
        case ChangeTag::MODIFIED: return "modified";
        case ChangeTag::REMOVED: return "removed";
        default: return "unknown";
    }
}

Manifest::Manifest() : method(BackupMethod::FULL) {}

void Manifest::setSnapshotName(const std::string& name) {
    snapshotName = name;
}

const std::string& Manifest::getSnapshotName() const {
    return snapshotName;
}

void Manifest::setMethod(BackupMethod newMethod) {
    method = newMethod;
}

BackupMethod Manifest::getMethod() const {
    return method;
}

void Manifest::setCreatedAt(const std::string& timestamp) {
    createdAt = timestamp;
}

const std::string& Manifest::getCreatedAt() const {
    return createdAt;
}

void Manifest::put(const std::string& path, const ManifestEntry& entry) {
    entries[path] = entry;
}

void Manifest::erase(const std::string& path) {
    entries.erase(path);
}

const ManifestEntry* Manifest::find(const std::string& path) const {
    auto it = entries.find(path);
    return it == entries.end() ? nullptr : &it->second;
}

bool Manifest::isPresent(const std::string& path) const {
    const ManifestEntry* entry = find(path);
    return entry != nullptr && entry->status == EntryStatus::PRESENT;
}

const std::map<std::string, ManifestEntry>& Manifest::getEntries() const {
    return entries;
}

size_t Manifest::size() const {
    return entries.size();
}

size_t Manifest::presentCount() const {
    size_t count = 0;
    for (const auto& item : entries) {
        if (item.second.status == EntryStatus::PRESENT) {
            count++;
        }
    }
    return count;
}

std::vector<std::string> Manifest::pathsWith(ChangeTag tag) const {
    std::vector<std::string> paths;
    for (const auto& item : entries) {
        if (item.second.change == tag) {
            paths.push_back(item.first);
        }
    }
    return paths;
}

// 格式：魔数(8) | 快照名 | 方式(u8) | 创建时间 | 条目数(u32) | 条目...
// 条目：路径 | 大小(u64) | mtime(i64) | 哈希 | 状态(u8) | 变化(u8) | 权限(u32)
// 字符串为u32长度前缀，整数为主机字节序
bool Manifest::save(const std::string& filePath, std::string& errorMessage) const {
    std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
    if (!out) {
        errorMessage = "cannot create manifest " + filePath;
        return false;
    }

    out.write(MANIFEST_MAGIC, sizeof(MANIFEST_MAGIC));
    writeString(out, snapshotName);
    writeValue(out, static_cast<uint8_t>(method));
    writeString(out, createdAt);
    writeValue(out, static_cast<uint32_t>(entries.size()));

    for (const auto& item : entries) {
        const ManifestEntry& entry = item.second;
        writeString(out, item.first);
        writeValue(out, entry.fingerprint.size);
        writeValue(out, entry.fingerprint.mtimeNs);
        writeString(out, entry.fingerprint.contentHash);
        writeValue(out, static_cast<uint8_t>(entry.status));
        writeValue(out, static_cast<uint8_t>(entry.change));
        writeValue(out, static_cast<uint32_t>(entry.permissions));
    }

    out.flush();
    if (!out) {
        errorMessage = "failed writing manifest " + filePath;
        return false;
    }
    return true;
}

bool Manifest::load(const std::string& filePath, std::string& errorMessage) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        errorMessage = "cannot open manifest " + filePath;
        return false;
    }

    char magic[sizeof(MANIFEST_MAGIC)];
    in.read(magic, sizeof(magic));
    if (!in || std::memcmp(magic, MANIFEST_MAGIC, sizeof(magic)) != 0) {
        errorMessage = "not a manifest file: " + filePath;
        return false;
    }

    std::string name;
    uint8_t methodValue = 0;
    std::string created;
    uint32_t count = 0;
    if (!readString(in, name) || !readValue(in, methodValue) || !readString(in, created) ||
        !readValue(in, count) || methodValue > static_cast<uint8_t>(BackupMethod::DIFF)) {
        errorMessage = "corrupt manifest header: " + filePath;
        return false;
    }

    std::map<std::string, ManifestEntry> loaded;
    for (uint32_t i = 0; i < count; i++) {
        std::string path;
        ManifestEntry entry;
        uint8_t status = 0;
        uint8_t change = 0;
        uint32_t permissions = 0;
        if (!readString(in, path) ||
            !readValue(in, entry.fingerprint.size) ||
            !readValue(in, entry.fingerprint.mtimeNs) ||
            !readString(in, entry.fingerprint.contentHash) ||
            !readValue(in, status) || !readValue(in, change) ||
            !readValue(in, permissions) ||
            status > static_cast<uint8_t>(EntryStatus::DELETED) ||
            change > static_cast<uint8_t>(ChangeTag::REMOVED)) {
            errorMessage = "corrupt manifest entry " + std::to_string(i) + " in " + filePath;
            return false;
        }
        entry.status = static_cast<EntryStatus>(status);
        entry.change = static_cast<ChangeTag>(change);
        entry.permissions = permissions;
        loaded[path] = entry;
    }

    snapshotName = name;
    method = static_cast<BackupMethod>(methodValue);
    createdAt = created;
    entries.swap(loaded);
    return true;
}

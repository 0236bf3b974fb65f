#include "ChangeDetector.hpp"
#include "BackupError.hpp"
#include "Filter.hpp"
#include "models/File.hpp"
#include "../utils/ContentHasher.hpp"
#include "../utils/FileSystem.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// 路径是否位于某个不可读目录之下（此类路径无法判断是否被删除）
bool isUnderAny(const std::string& path, const std::vector<std::string>& directories) {
    for (const auto& dir : directories) {
        if (path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/') {
            return true;
        }
    }
    return false;
}

} // namespace

std::vector<std::string> DetectionResult::presentFiles() const {
    std::vector<std::string> files;
    files.reserve(added.size() + modified.size() + unchanged.size());
    files.insert(files.end(), added.begin(), added.end());
    files.insert(files.end(), modified.begin(), modified.end());
    files.insert(files.end(), unchanged.begin(), unchanged.end());
    std::sort(files.begin(), files.end());
    return files;
}

ChangeDetector::ChangeDetector(FingerprintMode mode, std::shared_ptr<Filter> nameFilter)
    : mode(mode), nameFilter(std::move(nameFilter)) {}

DetectionResult ChangeDetector::detect(const std::string& sourceRoot, const Manifest* baseline) const {
    std::error_code ec;
    if (!FileSystem::isReadableDirectory(sourceRoot, ec)) {
        throw BackupError(ErrorKind::SOURCE_UNREADABLE,
                          "source " + sourceRoot + " is not readable (" + ec.message() + ")");
    }

    DetectionResult result;
    fs::path root(sourceRoot);
    std::vector<std::string> unreadableDirs;

    // 本次看到但无法读取的路径，其基线条目原样保留
    auto carryBaseline = [&](const std::string& key) {
        if (baseline != nullptr && baseline->isPresent(key)) {
            ManifestEntry entry = *baseline->find(key);
            entry.change = ChangeTag::UNCHANGED;
            result.newManifest.put(key, entry);
            result.carried.insert(key);
        }
    };

    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();
        std::string dirKey = dir == root ? std::string() : dir.lexically_relative(root).generic_string();

        std::error_code iterEc;
        for (fs::directory_iterator it(dir, iterEc), end; !iterEc && it != end; it.increment(iterEc)) {
            File file;
            std::error_code fileEc;
            bool ok = file.initialize(it->path(), root, fileEc);
            const std::string key = file.getManifestKey();

            if (!ok) {
                result.skipped[key] = fileEc.message();
                carryBaseline(key);
                continue;
            }
            if (nameFilter && !nameFilter->match(file)) {
                result.skipped[key] = "name not representable on target filesystem";
                continue;
            }
            if (file.isDirectory()) {
                result.directories.push_back(key);
                pending.push_back(file.getFilePath());
                continue;
            }
            if (file.isSpecial()) {
                result.skipped[key] = file.describeType();
                continue;
            }

            ManifestEntry entry;
            entry.fingerprint.size = file.getFileSize();
            entry.fingerprint.mtimeNs = file.getLastModifiedNs();
            entry.permissions = file.getPermissions();
            bool readable = mode == FingerprintMode::CONTENT_HASH
                ? ContentHasher::sha256File(file.getFilePath().string(), entry.fingerprint.contentHash)
                : FileSystem::isReadableFile(file.getFilePath().string());
            if (!readable) {
                result.skipped[key] = "permission denied or unreadable";
                carryBaseline(key);
                continue;
            }

            const ManifestEntry* previous = baseline != nullptr ? baseline->find(key) : nullptr;
            if (previous == nullptr || previous->status != EntryStatus::PRESENT) {
                entry.change = ChangeTag::ADDED;
                result.added.insert(key);
            } else if (!previous->fingerprint.sameContent(entry.fingerprint, mode)) {
                entry.change = ChangeTag::MODIFIED;
                result.modified.insert(key);
            } else {
                entry.change = ChangeTag::UNCHANGED;
                result.unchanged.insert(key);
            }
            result.newManifest.put(key, entry);
        }

        if (iterEc) {
            // 根目录已在开头检查过，这里只会是子目录
            result.skipped[dirKey] = "cannot read directory: " + iterEc.message();
            unreadableDirs.push_back(dirKey);
        }
    }

    std::sort(result.directories.begin(), result.directories.end());

    // 基线中存在但本次未出现的路径即为删除
    if (baseline != nullptr) {
        for (const auto& item : baseline->getEntries()) {
            const std::string& key = item.first;
            if (item.second.status != EntryStatus::PRESENT || result.newManifest.find(key) != nullptr) {
                continue;
            }
            if (isUnderAny(key, unreadableDirs)) {
                carryBaseline(key);
                continue;
            }
            ManifestEntry marker = item.second;
            marker.status = EntryStatus::DELETED;
            marker.change = ChangeTag::REMOVED;
            result.removed.insert(key);
            result.newManifest.put(key, marker);
        }
    }

    return result;
}

#include "SnapshotStore.hpp"
#include "SnapshotNamer.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"

SnapshotStore::SnapshotStore(const std::string& targetPath) : root(targetPath) {}

const fs::path& SnapshotStore::getRoot() const {
    return root;
}

std::vector<SnapshotInfo> SnapshotStore::list(std::error_code& ec) const {
    std::vector<SnapshotInfo> snapshots;
    ec.clear();
    if (!FileSystem::exists(root.string())) {
        return snapshots;
    }

    // listNames已按名称排序
    for (const auto& name : FileSystem::listNames(root.string(), ec)) {
        if (!SnapshotNamer::isSnapshotName(name)) {
            continue;
        }
        fs::path path = root / name;
        std::error_code typeEc;
        if (!fs::is_directory(fs::symlink_status(path, typeEc))) {
            continue;
        }
        SnapshotInfo info;
        info.name = name;
        info.path = path;
        info.compressed = FileSystem::exists(archivePath(path).string());
        snapshots.push_back(info);
    }
    if (ec) {
        snapshots.clear();
    }
    return snapshots;
}

std::optional<SnapshotInfo> SnapshotStore::latest(std::error_code& ec) const {
    std::vector<SnapshotInfo> snapshots = list(ec);
    if (ec || snapshots.empty()) {
        return std::nullopt;
    }
    return snapshots.back();
}

bool SnapshotStore::exists(const std::string& name) const {
    return FileSystem::exists(snapshotPath(name).string());
}

fs::path SnapshotStore::snapshotPath(const std::string& name) const {
    return root / name;
}

fs::path SnapshotStore::tempPath(const std::string& name) const {
    return root / ("." + name + TEMP_SUFFIX);
}

fs::path SnapshotStore::dataPath(const fs::path& snapshotDir) {
    return snapshotDir / DATA_DIR;
}

fs::path SnapshotStore::archivePath(const fs::path& snapshotDir) {
    return snapshotDir / ARCHIVE_FILE;
}

fs::path SnapshotStore::manifestPath(const fs::path& snapshotDir) {
    return snapshotDir / Manifest::FILE_NAME;
}

bool SnapshotStore::loadManifest(const SnapshotInfo& snapshot, Manifest& manifest, std::string& errorMessage) const {
    return manifest.load(manifestPath(snapshot.path).string(), errorMessage);
}

bool SnapshotStore::remove(const std::string& name, std::error_code& ec) const {
    return FileSystem::removeTree(snapshotPath(name).string(), ec);
}

size_t SnapshotStore::removeStaleTemporaries(ILogger* logger) const {
    size_t removed = 0;
    std::error_code ec;
    if (!FileSystem::exists(root.string())) {
        return removed;
    }
    for (const auto& name : FileSystem::listNames(root.string(), ec)) {
        const std::string suffix = TEMP_SUFFIX;
        if (name.size() <= suffix.size() + 1 || name[0] != '.' ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::error_code removeEc;
        if (FileSystem::removeTree((root / name).string(), removeEc)) {
            removed++;
            logger->warn("Removed stale temporary snapshot " + (root / name).string());
        } else {
            logger->error("Cannot remove stale temporary snapshot " + (root / name).string() +
                          " (" + removeEc.message() + ")");
        }
    }
    if (ec) {
        logger->error("Cannot list " + root.string() + " (" + ec.message() + ")");
    }
    return removed;
}

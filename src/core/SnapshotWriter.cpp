#include "SnapshotWriter.hpp"
#include "BackupError.hpp"
#include "ChangeDetector.hpp"
#include "models/Job.hpp"
#include "../utils/FileSystem.hpp"
#include "../utils/ILogger.hpp"
#include "../utils/SnapshotArchiver.hpp"

SnapshotWriter::SnapshotWriter(ILogger* logger) : logger(logger) {}

WriteResult SnapshotWriter::write(const Job& job, const std::string& snapshotName,
                                  const DetectionResult& detection, const std::string& createdAt) const {
    SnapshotStore store(job.targetPath);
    std::error_code ec;

    if (!FileSystem::createDirectories(job.targetPath, ec)) {
        throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                          "cannot create target " + job.targetPath + " (" + ec.message() + ")");
    }
    if (store.exists(snapshotName)) {
        throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                          "snapshot " + snapshotName + " already exists in " + job.targetPath);
    }

    fs::path tempDir = store.tempPath(snapshotName);
    fs::path dataDir = SnapshotStore::dataPath(tempDir);
    if (!FileSystem::removeTree(tempDir.string(), ec) || !FileSystem::createDirectories(dataDir.string(), ec)) {
        throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                          "cannot prepare " + tempDir.string() + " (" + ec.message() + ")");
    }

    try {
        // 唯一的按方式分派点
        switch (job.method) {
            case BackupMethod::FULL:
            case BackupMethod::LAST: {
                createDirectories(job, dataDir, detection.directories);
                copyFiles(job, dataDir, detection.presentFiles());
                applyDirectoryMetadata(job, dataDir, detection.directories);
                break;
            }
            case BackupMethod::DIFF: {
                std::vector<std::string> changed(detection.added.begin(), detection.added.end());
                changed.insert(changed.end(), detection.modified.begin(), detection.modified.end());
                copyFiles(job, dataDir, changed);
                break;
            }
        }

        // diff的最新快照始终不压缩，下一次检测直接读取
        if (job.compress && job.method != BackupMethod::DIFF) {
            std::string errorMessage;
            if (!compressSnapshotData(tempDir, errorMessage)) {
                throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR, "compression failed: " + errorMessage);
            }
        }

        Manifest manifest = detection.newManifest;
        if (job.method != BackupMethod::DIFF) {
            // 沿用的条目没有复制进本快照，不能记为已备份，
            // 否则文件恢复可读后会被当作未变化
            for (const auto& key : detection.carried) {
                manifest.erase(key);
            }
        }
        manifest.setSnapshotName(snapshotName);
        manifest.setMethod(job.method);
        manifest.setCreatedAt(createdAt);
        std::string errorMessage;
        if (!manifest.save(SnapshotStore::manifestPath(tempDir).string(), errorMessage)) {
            throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR, errorMessage);
        }

        if (!FileSystem::renamePath(tempDir.string(), store.snapshotPath(snapshotName).string(), ec)) {
            throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                              "cannot commit snapshot " + snapshotName + " (" + ec.message() + ")");
        }
    } catch (const std::exception&) {
        std::error_code cleanupEc;
        if (!FileSystem::removeTree(tempDir.string(), cleanupEc)) {
            logger->error("Cannot discard temporary snapshot " + tempDir.string() + " (" + cleanupEc.message() + ")");
        }
        throw;
    }

    WriteResult result;
    result.snapshot.name = snapshotName;
    result.snapshot.path = store.snapshotPath(snapshotName);
    result.snapshot.compressed = job.compress && job.method != BackupMethod::DIFF;

    if (job.method == BackupMethod::LAST) {
        removePreviousSnapshots(store, snapshotName, result);
    } else if (job.method == BackupMethod::DIFF && job.compress) {
        compressOlderSnapshots(store, snapshotName, result);
    }
    return result;
}

void SnapshotWriter::createDirectories(const Job& job, const fs::path& dataDir,
                                       const std::vector<std::string>& directories) const {
    for (const auto& dir : directories) {
        std::error_code ec;
        if (!FileSystem::createDirectories((dataDir / dir).string(), ec)) {
            throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                              "job " + job.id + ": cannot create directory " + dir + " (" + ec.message() + ")");
        }
    }
}

void SnapshotWriter::copyFiles(const Job& job, const fs::path& dataDir, const std::vector<std::string>& files) const {
    fs::path source(job.sourcePath);
    for (const auto& relative : files) {
        std::error_code ec;
        if (!FileSystem::copyFile((source / relative).string(), (dataDir / relative).string(), ec)) {
            throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                              "job " + job.id + ": cannot copy " + relative + " (" + ec.message() + ")");
        }
    }
    logger->debug("Copied " + std::to_string(files.size()) + " files for job " + job.id);
}

void SnapshotWriter::applyDirectoryMetadata(const Job& job, const fs::path& dataDir,
                                            const std::vector<std::string>& directories) const {
    fs::path source(job.sourcePath);
    // 由深到浅，子项写完之后再设置只读权限和时间
    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        std::error_code ec;
        if (!FileSystem::copyDirectoryMetadata((source / *it).string(), (dataDir / *it).string(), ec)) {
            logger->debug("Cannot preserve metadata of directory " + *it + " (" + ec.message() + ")");
        }
    }
}

bool SnapshotWriter::compressSnapshotData(const fs::path& snapshotDir, std::string& errorMessage) const {
    SnapshotArchiver archiver;
    fs::path dataDir = SnapshotStore::dataPath(snapshotDir);
    if (!archiver.archiveDirectory(dataDir.string(), SnapshotStore::archivePath(snapshotDir).string(), errorMessage)) {
        return false;
    }
    std::error_code ec;
    if (!FileSystem::removeTree(dataDir.string(), ec)) {
        errorMessage = "cannot remove " + dataDir.string() + " (" + ec.message() + ")";
        return false;
    }
    return true;
}

void SnapshotWriter::removePreviousSnapshots(const SnapshotStore& store, const std::string& keep,
                                             WriteResult& result) const {
    std::error_code ec;
    std::vector<SnapshotInfo> snapshots = store.list(ec);
    if (ec) {
        result.cleanupFailures.emplace_back(keep, "cannot list snapshots (" + ec.message() + ")");
        return;
    }
    for (const auto& snapshot : snapshots) {
        if (snapshot.name == keep) {
            continue;
        }
        std::error_code removeEc;
        if (store.remove(snapshot.name, removeEc)) {
            result.replaced.push_back(snapshot.name);
        } else {
            result.cleanupFailures.emplace_back(snapshot.name, removeEc.message());
        }
    }
}

void SnapshotWriter::compressOlderSnapshots(const SnapshotStore& store, const std::string& latest,
                                            WriteResult& result) const {
    std::error_code ec;
    std::vector<SnapshotInfo> snapshots = store.list(ec);
    if (ec) {
        logger->warn("Cannot list snapshots in " + store.getRoot().string() + " (" + ec.message() + ")");
        return;
    }
    for (const auto& snapshot : snapshots) {
        if (snapshot.name == latest) {
            continue;
        }
        fs::path dataDir = SnapshotStore::dataPath(snapshot.path);
        if (!FileSystem::exists(dataDir.string())) {
            continue;
        }

        std::string errorMessage;
        bool ok;
        if (snapshot.compressed) {
            // 上次压缩后未来得及删除data/
            std::error_code removeEc;
            ok = FileSystem::removeTree(dataDir.string(), removeEc);
            errorMessage = removeEc.message();
        } else {
            ok = compressSnapshotData(snapshot.path, errorMessage);
        }

        if (ok) {
            result.compressedOlder.push_back(snapshot.name);
        } else {
            // 不影响本次已提交的快照，下次运行再试
            logger->warn("Cannot compress snapshot " + snapshot.name + ": " + errorMessage);
        }
    }
}

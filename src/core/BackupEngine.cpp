#include "BackupEngine.hpp"
#include "BackupError.hpp"
#include "ChangeDetector.hpp"
#include "Filter.hpp"
#include "SnapshotNamer.hpp"
#include "SnapshotStore.hpp"
#include "models/Job.hpp"
#include "models/Manifest.hpp"
#include "../utils/ILogger.hpp"

namespace {

// 清单中记录的创建时间，UTC
const char* const CREATED_AT_FORMAT = "Y-m-dTH:M:S.fZ";

} // namespace

BackupEngine::BackupEngine(ILogger* logger, std::shared_ptr<IClock> clock)
    : logger(logger), clock(std::move(clock)), reporter(logger), writer(logger), pruner(logger) {}

RunResult BackupEngine::run(const Job& job) {
    RunResult result;
    reporter.runStarted(job);

    try {
        Manifest baseline;
        bool hasBaseline = loadBaseline(job, baseline);

        ChangeDetector detector(job.fingerprint, TargetNameFilter::forTarget(job.targetPath));
        DetectionResult detection = detector.detect(job.sourcePath, hasBaseline ? &baseline : nullptr);

        result.added = detection.added.size();
        result.modified = detection.modified.size();
        result.removed = detection.removed.size();
        result.skipped = detection.skipped.size();
        for (const auto& entry : detection.skipped) {
            reporter.fileSkipped(job, entry.first, entry.second);
        }

        // 与最新快照相比没有变化时不产生新快照
        if (hasBaseline && !detection.hasChanges()) {
            result.status = TaskStatus::SKIPPED;
            reporter.runSkipped(job, result.skipped);
            // 上次未删掉的旧快照在这里重试
            applyRetention(job, result);
            return result;
        }

        auto now = clock->now();
        std::string snapshotName = SnapshotNamer::name(now, job.nameFormat);
        if (hasBaseline && snapshotName <= baseline.getSnapshotName()) {
            // 名字必须比已有快照大，否则按名称排序不再等于时间顺序
            throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                              "snapshot name " + snapshotName + " does not sort after latest snapshot " +
                              baseline.getSnapshotName());
        }

        WriteResult written = writer.write(job, snapshotName, detection, SnapshotNamer::name(now, CREATED_AT_FORMAT));
        result.snapshotName = written.snapshot.name;
        result.status = TaskStatus::COMPLETED;
        reporter.runCompleted(job, result.snapshotName, result.added, result.modified, result.removed, result.skipped);

        if (!written.replaced.empty()) {
            reporter.pruned(job, written.replaced);
            result.pruned.insert(result.pruned.end(), written.replaced.begin(), written.replaced.end());
        }
        for (const auto& failure : written.cleanupFailures) {
            reporter.pruneFailed(job, failure.first, failure.second);
        }
        for (const auto& name : written.compressedOlder) {
            logger->debug("Job " + job.id + ": compressed snapshot " + name);
        }

        applyRetention(job, result);
    } catch (const BackupError& e) {
        result.status = TaskStatus::FAILED;
        result.error = e.getKind();
        result.message = e.what();
        reporter.runFailed(job, e.getKind(), e.what());
    } catch (const std::exception& e) {
        // filesystem_error、bad_alloc等，按写入失败处理，已提交的快照不受影响
        result.status = TaskStatus::FAILED;
        result.error = ErrorKind::SNAPSHOT_WRITE_ERROR;
        result.message = e.what();
        reporter.runFailed(job, ErrorKind::SNAPSHOT_WRITE_ERROR, e.what());
    }
    return result;
}

bool BackupEngine::loadBaseline(const Job& job, Manifest& baseline) {
    SnapshotStore store(job.targetPath);
    std::error_code ec;
    std::optional<SnapshotInfo> latest = store.latest(ec);
    if (ec) {
        throw BackupError(ErrorKind::SNAPSHOT_WRITE_ERROR,
                          "cannot list snapshots in " + job.targetPath + " (" + ec.message() + ")");
    }
    if (!latest) {
        return false;
    }

    std::string errorMessage;
    if (!store.loadManifest(*latest, baseline, errorMessage)) {
        logger->warn("Job " + job.id + ": ignoring manifest of snapshot " + latest->name + ": " + errorMessage);
        baseline = Manifest();
        return false;
    }
    // 旧版本或手工复制的快照目录可能没有写名字
    if (baseline.getSnapshotName().empty()) {
        baseline.setSnapshotName(latest->name);
    }
    return true;
}

void BackupEngine::applyRetention(const Job& job, RunResult& result) {
    PruneResult pruneResult = pruner.prune(job);
    reporter.pruned(job, pruneResult.removed);
    result.pruned.insert(result.pruned.end(), pruneResult.removed.begin(), pruneResult.removed.end());
    for (const auto& failure : pruneResult.failed) {
        reporter.pruneFailed(job, failure.first, failure.second);
    }
}

size_t BackupEngine::removeStaleTemporaries(const Job& job) {
    return SnapshotStore(job.targetPath).removeStaleTemporaries(logger);
}

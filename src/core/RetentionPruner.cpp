#include "RetentionPruner.hpp"
#include "SnapshotStore.hpp"
#include "models/Job.hpp"
#include "../utils/ILogger.hpp"

RetentionPruner::RetentionPruner(ILogger* logger) : logger(logger) {}

PruneResult RetentionPruner::prune(const Job& job) const {
    PruneResult result;
    std::optional<size_t> limit = job.effectiveLimit();
    if (!limit) {
        return result;
    }

    SnapshotStore store(job.targetPath);
    std::error_code ec;
    std::vector<SnapshotInfo> snapshots = store.list(ec);
    if (ec) {
        result.failed.emplace_back(job.targetPath, "cannot list snapshots (" + ec.message() + ")");
        return result;
    }
    if (snapshots.size() <= *limit) {
        return result;
    }

    // 列表按名称升序，前面的最旧
    size_t excess = snapshots.size() - *limit;
    logger->debug("Job " + job.id + " keeps " + std::to_string(*limit) + " of " +
                  std::to_string(snapshots.size()) + " snapshots");
    for (size_t i = 0; i < excess; i++) {
        std::error_code removeEc;
        if (store.remove(snapshots[i].name, removeEc)) {
            result.removed.push_back(snapshots[i].name);
        } else {
            result.failed.emplace_back(snapshots[i].name, removeEc.message());
        }
    }
    return result;
}

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Clock.hpp"
#include "RunReporter.hpp"
#include "RetentionPruner.hpp"
#include "SnapshotWriter.hpp"

class ILogger;
class Manifest;
struct Job;

// 一次备份运行的结果
struct RunResult {
    TaskStatus status = TaskStatus::RUNNING;
    std::string snapshotName;
    size_t added = 0;
    size_t modified = 0;
    size_t removed = 0;
    size_t skipped = 0;
    std::vector<std::string> pruned;
    std::optional<ErrorKind> error;
    std::string message;
};

// 单个任务的一次运行：变化检测 -> 写快照 -> 清理旧快照。
// 不同任务可以在不同线程上同时调用run()，引擎本身不保存运行状态；
// 同一任务的串行由JobScheduler保证。
class BackupEngine {
private:
    ILogger* logger;
    std::shared_ptr<IClock> clock;
    RunReporter reporter;
    SnapshotWriter writer;
    RetentionPruner pruner;

    // 读取最新快照的清单作为基线，没有快照或清单损坏时返回false
    bool loadBaseline(const Job& job, Manifest& baseline);
    void applyRetention(const Job& job, RunResult& result);

public:
    BackupEngine(ILogger* logger, std::shared_ptr<IClock> clock);

    // 所有错误都转换为 status=FAILED 的结果，不向外抛出
    RunResult run(const Job& job);

    // 启动时清理崩溃遗留的临时快照
    size_t removeStaleTemporaries(const Job& job);
};

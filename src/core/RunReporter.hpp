#pragma once
#include <string>
#include <utility>
#include <vector>
#include "Types.hpp"

class ILogger;
struct Job;

// 把备份过程中的结构化事件写成 key=value 形式的日志行，
// 格式和去向由ILogger决定
class RunReporter {
private:
    ILogger* logger;

public:
    using Fields = std::vector<std::pair<std::string, std::string>>;

    explicit RunReporter(ILogger* logger);

    void runStarted(const Job& job);
    void runCompleted(const Job& job, const std::string& snapshotName,
                      size_t added, size_t modified, size_t removed, size_t skipped);
    void runSkipped(const Job& job, size_t skipped);
    void runFailed(const Job& job, ErrorKind kind, const std::string& message);
    void pruned(const Job& job, const std::vector<std::string>& removedNames);
    void pruneFailed(const Job& job, const std::string& snapshotName, const std::string& message);
    void tickDropped(const Job& job);
    void fileSkipped(const Job& job, const std::string& path, const std::string& reason);

    static std::string formatEvent(const std::string& event, const Fields& fields);
};

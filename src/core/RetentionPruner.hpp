#pragma once
#include <string>
#include <utility>
#include <vector>

class ILogger;
struct Job;

struct PruneResult {
    std::vector<std::string> removed;
    // 删除失败的快照：名称 -> 原因，下次运行重试
    std::vector<std::pair<std::string, std::string>> failed;
};

// 快照数量超过保留上限时删除最旧的快照
class RetentionPruner {
private:
    ILogger* logger;

public:
    explicit RetentionPruner(ILogger* logger);

    // 没有上限（full方式或未配置limit）时不做任何事
    PruneResult prune(const Job& job) const;
};

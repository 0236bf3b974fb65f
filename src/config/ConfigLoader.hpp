#pragma once
#include <chrono>
#include <string>
#include <vector>
#include "../core/Types.hpp"
#include "../core/models/Job.hpp"

namespace YAML {
class Node;
}

class ILogger;

// 配置文件加载后的守护进程配置
struct DaemonConfig {
    std::vector<Job> jobs;
    std::string logFile;          // 为空时输出到控制台
    std::string logLevel;         // 为空时使用默认级别
    size_t rejectedJobs = 0;      // 因配置错误被跳过的任务数
};

// 读取YAML配置：
//   format: Y-m-d_H-M-S-f
//   fingerprint: metadata | hash
//   log_file: /var/log/snapshotd.log
//   log_level: INFO
//   sources:
//     - source: /home/user/docs
//       target: /mnt/backup
//       period: 1h
//       method: diff
//       compress: true
//       limit: 7
// 单个任务有误时记录日志并跳过；文件无法读取、结构错误或没有可用任务时
// 抛出 BackupError(INVALID_CONFIG)
class ConfigLoader {
public:
    static DaemonConfig loadFromYaml(const std::string& path, ILogger* logger);
    static DaemonConfig loadFromNode(const YAML::Node& root, ILogger* logger);

    // 整数秒，或带 ms/s/m/h/d 后缀的字符串
    static std::chrono::milliseconds parsePeriod(const std::string& text);

private:
    static Job parseJob(const YAML::Node& node, const std::string& defaultFormat,
                        FingerprintMode defaultFingerprint, ILogger* logger);
};

#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include "../Types.hpp"

// 一个源目录到目标目录的备份任务，加载后不再修改
struct Job {
    std::string id;
    std::string sourcePath;
    std::string targetPath;        // 该任务的快照直接存放在此目录下
    std::chrono::milliseconds period{0};
    BackupMethod method = BackupMethod::FULL;
    bool compress = false;
    std::optional<size_t> limit;
    std::string nameFormat = "Y-m-d_H-M-S-f";
    FingerprintMode fingerprint = FingerprintMode::METADATA;

    // 检查任务描述是否合法，不合法时抛出 BackupError(INVALID_CONFIG)
    void validate() const;

    // 实际生效的保留上限：full不限，last固定为1，diff使用limit
    std::optional<size_t> effectiveLimit() const;

    std::string describe() const;

    // 由源路径生成任务标识，'/'替换为'_'
    static std::string idFromSource(const std::string& sourcePath);
};

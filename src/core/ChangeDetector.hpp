#pragma once
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include "Types.hpp"
#include "models/Manifest.hpp"

class Filter;

// 一次变化检测的结果
struct DetectionResult {
    std::set<std::string> added;
    std::set<std::string> modified;
    std::set<std::string> removed;
    std::set<std::string> unchanged;
    // 符号链接、特殊文件、无权限等条目：路径 -> 原因
    std::map<std::string, std::string> skipped;
    // 本次无法读取、沿用基线条目的路径（不在presentFiles()中）
    std::set<std::string> carried;
    // 源目录中的子目录（相对路径，父目录在前）
    std::vector<std::string> directories;
    // 源目录当前的完整状态，作为下一次运行的基线
    Manifest newManifest;

    bool hasChanges() const {
        return !added.empty() || !modified.empty() || !removed.empty();
    }

    // 当前源目录中实际可复制的全部文件
    std::vector<std::string> presentFiles() const;
};

class ChangeDetector {
private:
    FingerprintMode mode;
    std::shared_ptr<Filter> nameFilter;

public:
    explicit ChangeDetector(FingerprintMode mode, std::shared_ptr<Filter> nameFilter = nullptr);

    // 遍历源目录并与基线清单比较；baseline为nullptr表示首次运行。
    // 源目录不存在或不可读时抛出 BackupError(SOURCE_UNREADABLE)，
    // 单个条目的问题只记入skipped
    DetectionResult detect(const std::string& sourceRoot, const Manifest* baseline) const;
};

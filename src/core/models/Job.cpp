#include "Job.hpp"
#include "../BackupError.hpp"
#include "../SnapshotNamer.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

// 判断 child 是否等于 parent 或位于其下
bool isWithin(const fs::path& child, const fs::path& parent) {
    auto c = child.begin();
    for (auto p = parent.begin(); p != parent.end(); ++p, ++c) {
        if (p->empty()) {
            continue;
        }
        if (c == child.end() || *c != *p) {
            return false;
        }
    }
    return true;
}

fs::path normalizedAbsolute(const std::string& path) {
    std::error_code ec;
    fs::path absolutePath = fs::absolute(path, ec);
    if (ec) {
        absolutePath = fs::path(path);
    }
    fs::path normal = absolutePath.lexically_normal();
    // 去掉末尾的'/'，使比较逐段进行
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

} // namespace

void Job::validate() const {
    if (id.empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job id is empty");
    }
    if (sourcePath.empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job " + id + ": source path is empty");
    }
    if (targetPath.empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job " + id + ": target path is empty");
    }
    if (period.count() <= 0) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job " + id + ": period must be positive");
    }
    if (limit && *limit == 0) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job " + id + ": limit must be a positive integer");
    }

    fs::path source = normalizedAbsolute(sourcePath);
    fs::path target = normalizedAbsolute(targetPath);
    if (isWithin(target, source)) {
        throw BackupError(ErrorKind::INVALID_CONFIG,
                          "job " + id + ": target " + targetPath + " lies inside source " + sourcePath);
    }

    try {
        SnapshotNamer::validateFormat(nameFormat);
    } catch (const BackupError& e) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "job " + id + ": " + e.what());
    }
}

std::optional<size_t> Job::effectiveLimit() const {
    switch (method) {
        case BackupMethod::FULL:
            return std::nullopt;
        case BackupMethod::LAST:
            return static_cast<size_t>(1);
        case BackupMethod::DIFF:
            return limit;
    }
    return std::nullopt;
}

std::string Job::describe() const {
    std::string text = id + " [" + toString(method) + "] " + sourcePath + " -> " + targetPath +
                       " every " + std::to_string(period.count()) + "ms";
    if (compress) {
        text += ", compressed";
    }
    if (limit) {
        text += ", limit " + std::to_string(*limit);
    }
    return text;
}

std::string Job::idFromSource(const std::string& sourcePath) {
    std::string name = sourcePath;
    std::replace(name.begin(), name.end(), '/', '_');
    return name;
}

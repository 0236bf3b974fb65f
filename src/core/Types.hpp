#pragma once
#include <string>

// 单次备份运行的结果状态
enum class TaskStatus {
    RUNNING,
    COMPLETED,
    SKIPPED,
    FAILED
};

// 备份方式
enum class BackupMethod {
    FULL,
    LAST,
    DIFF
};

// 每个任务的调度状态
enum class JobState {
    IDLE,
    RUNNING
};

enum class ErrorKind {
    INVALID_CONFIG,
    SOURCE_UNREADABLE,
    SNAPSHOT_WRITE_ERROR,
    PRUNE_ERROR
};

// 变化检测使用的指纹
enum class FingerprintMode {
    METADATA,      // 大小 + 修改时间
    CONTENT_HASH   // 大小 + SHA-256
};

inline std::string toString(BackupMethod method) {
    switch (method) {
        case BackupMethod::FULL: return "full";
        case BackupMethod::LAST: return "last";
        case BackupMethod::DIFF: return "diff";
        default: return "unknown";
    }
}

inline std::string toString(JobState state) {
    switch (state) {
        case JobState::IDLE: return "IDLE";
        case JobState::RUNNING: return "RUNNING";
        default: return "UNKNOWN";
    }
}

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_CONFIG: return "InvalidConfig";
        case ErrorKind::SOURCE_UNREADABLE: return "SourceUnreadable";
        case ErrorKind::SNAPSHOT_WRITE_ERROR: return "SnapshotWriteError";
        case ErrorKind::PRUNE_ERROR: return "PruneError";
        default: return "Unknown";
    }
}

inline std::string toString(FingerprintMode mode) {
    switch (mode) {
        case FingerprintMode::METADATA: return "metadata";
        case FingerprintMode::CONTENT_HASH: return "hash";
        default: return "unknown";
    }
}

inline bool parseBackupMethod(const std::string& text, BackupMethod& method) {
    if (text == "full") {
        method = BackupMethod::FULL;
    } else if (text == "last") {
        method = BackupMethod::LAST;
    } else if (text == "diff") {
        method = BackupMethod::DIFF;
    } else {
        return false;
    }
    return true;
}

inline bool parseFingerprintMode(const std::string& text, FingerprintMode& mode) {
    if (text == "metadata") {
        mode = FingerprintMode::METADATA;
    } else if (text == "hash") {
        mode = FingerprintMode::CONTENT_HASH;
    } else {
        return false;
    }
    return true;
}

#pragma once
#include <stdexcept>
#include <string>
#include "Types.hpp"

// 带错误类别的备份异常，由BackupEngine统一转换为运行结果
class BackupError : public std::runtime_error {
private:
    ErrorKind kind;

public:
    BackupError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind(kind) {}

    ErrorKind getKind() const {
        return kind;
    }
};

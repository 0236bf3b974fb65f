#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <mutex>
#include <string>

// 输出到标准输出/标准错误的日志器，多个任务线程可同时写入
class ConsoleLogger : public ILogger {
private:
    std::atomic<LogLevel> level;
    std::mutex mutex;

public:
    explicit ConsoleLogger(LogLevel level = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel level) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel level, const std::string& message) override;
};

// 当前本地时间，格式 YYYY-mm-dd HH:MM:SS
std::string currentLogTime();

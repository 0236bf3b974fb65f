#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

// 追加写入日志文件的日志器，行格式与ConsoleLogger一致
class FileLogger : public ILogger {
private:
    std::string logPath;
    std::ofstream out;
    std::atomic<LogLevel> level;
    std::mutex mutex;

public:
    explicit FileLogger(const std::string& path, LogLevel level = LogLevel::INFO);
    ~FileLogger() override;

    // 打开（必要时创建父目录）日志文件
    bool open(std::string& errorMessage);
    bool isOpen() const;
    const std::string& getPath() const;

    void info(const std::string& message) override;
    void error(const std::string& message) override;
    void warn(const std::string& message) override;
    void debug(const std::string& message) override;
    void setLogLevel(LogLevel level) override;
    LogLevel getLogLevel() const override;
    void log(LogLevel level, const std::string& message) override;
};

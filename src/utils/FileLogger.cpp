#include "FileLogger.hpp"
#include "ConsoleLogger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

FileLogger::FileLogger(const std::string& path, LogLevel level)
    : logPath(path), level(level) {}

FileLogger::~FileLogger() {
    std::lock_guard<std::mutex> lock(mutex);
    if (out.is_open()) {
        out.flush();
    }
}

bool FileLogger::open(std::string& errorMessage) {
    std::lock_guard<std::mutex> lock(mutex);
    fs::path parent = fs::path(logPath).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            errorMessage = "cannot create log directory " + parent.string() + " (" + ec.message() + ")";
            return false;
        }
    }
    out.open(logPath, std::ios::out | std::ios::app);
    if (!out) {
        errorMessage = "cannot open log file " + logPath;
        return false;
    }
    return true;
}

bool FileLogger::isOpen() const {
    return out.is_open();
}

const std::string& FileLogger::getPath() const {
    return logPath;
}

void FileLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void FileLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void FileLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void FileLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void FileLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel FileLogger::getLogLevel() const {
    return level;
}

void FileLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (!out.is_open()) {
        return;
    }
    // 每行立即刷新，进程被杀时不丢日志
    out << "[" << currentLogTime() << "] [" << toString(messageLevel) << "] " << message << std::endl;
}

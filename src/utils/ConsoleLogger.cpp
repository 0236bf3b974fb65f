// src/utils/ConsoleLogger.cpp
#include "ConsoleLogger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string currentLogTime() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

bool parseLogLevel(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") {
        level = LogLevel::DEBUG;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARN" || upper == "WARNING") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR_LEVEL;
    } else {
        return false;
    }
    return true;
}

ConsoleLogger::ConsoleLogger(LogLevel level) : level(level) {}

void ConsoleLogger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void ConsoleLogger::error(const std::string& message) {
    log(LogLevel::ERROR_LEVEL, message);
}

void ConsoleLogger::warn(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void ConsoleLogger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void ConsoleLogger::setLogLevel(LogLevel newLevel) {
    level = newLevel;
}

LogLevel ConsoleLogger::getLogLevel() const {
    return level;
}

void ConsoleLogger::log(LogLevel messageLevel, const std::string& message) {
    if (messageLevel < level.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex);
    std::ostream& out = messageLevel == LogLevel::ERROR_LEVEL ? std::cerr : std::cout;
    out << "[" << currentLogTime() << "] [" << toString(messageLevel) << "] " << message << std::endl;
}

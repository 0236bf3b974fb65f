#pragma once
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include "core/Clock.hpp"
#include "utils/ILogger.hpp"

namespace fs = std::filesystem;

// 模拟ILogger接口
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, setLogLevel, (LogLevel level), (override));
    MOCK_METHOD(LogLevel, getLogLevel, (), (const, override));
    MOCK_METHOD(void, log, (LogLevel level, const std::string& message), (override));
};

// 允许所有日志调用，需要检查某类日志的测试再单独加期望
inline void allowAllLogging(MockLogger& logger) {
    using ::testing::_;
    EXPECT_CALL(logger, info(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, error(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, warn(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, debug(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, log(_, _)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, setLogLevel(_)).Times(::testing::AnyNumber());
    EXPECT_CALL(logger, getLogLevel()).WillRepeatedly(::testing::Return(LogLevel::DEBUG));
}

// 手动推进的时钟
class ManualClock : public IClock {
private:
    mutable std::mutex mutex;
    std::chrono::system_clock::time_point current;

public:
    explicit ManualClock(std::chrono::system_clock::time_point start =
                             std::chrono::system_clock::time_point(std::chrono::hours(24 * 365 * 50)))
        : current(start) {}

    std::chrono::system_clock::time_point now() const override {
        std::lock_guard<std::mutex> lock(mutex);
        return current;
    }

    void advance(std::chrono::system_clock::duration delta) {
        std::lock_guard<std::mutex> lock(mutex);
        current += delta;
    }

    void set(std::chrono::system_clock::time_point value) {
        std::lock_guard<std::mutex> lock(mutex);
        current = value;
    }
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

// 修改内容并把修改时间推后，避免时间戳精度导致的漏检
inline void modifyFile(const fs::path& path, const std::string& content) {
    auto before = fs::last_write_time(path);
    writeFile(path, content);
    fs::last_write_time(path, before + std::chrono::seconds(2));
}

// 每个测试使用独立的临时目录
inline fs::path uniqueTestDir(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = prefix;
    if (info != nullptr) {
        name += std::string("_") + info->test_suite_name() + "_" + info->name();
    }
    return fs::temp_directory_path() / name;
}

#include "SnapshotNamer.hpp"
#include "BackupError.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>

namespace {

std::string padded(long value, int width) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%0*ld", width, value);
    return buffer;
}

} // namespace

std::string SnapshotNamer::name(std::chrono::system_clock::time_point timestamp, const std::string& format) {
    using namespace std::chrono;

    auto seconds = time_point_cast<std::chrono::seconds>(timestamp);
    // 时间点早于整秒时向下取整，保证微秒为非负
    if (seconds > timestamp) {
        seconds -= std::chrono::seconds(1);
    }
    long micros = static_cast<long>(duration_cast<microseconds>(timestamp - seconds).count());

    std::time_t raw = system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&raw, &tm);

    std::string result;
    for (char token : format) {
        switch (token) {
            case 'Y': result += padded(tm.tm_year + 1900L, 4); break;
            case 'y': result += padded((tm.tm_year + 1900L) % 100, 2); break;
            case 'm': result += padded(tm.tm_mon + 1L, 2); break;
            case 'd': result += padded(tm.tm_mday, 2); break;
            case 'H': result += padded(tm.tm_hour, 2); break;
            case 'M': result += padded(tm.tm_min, 2); break;
            case 'S': result += padded(tm.tm_sec, 2); break;
            case 'f': result += padded(micros, 6); break;
            default: result += token; break;
        }
    }

    if (result.empty()) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "snapshot name format yields an empty name");
    }
    if (result.find('/') != std::string::npos || result.find('\\') != std::string::npos) {
        throw BackupError(ErrorKind::INVALID_CONFIG,
                          "snapshot name '" + result + "' contains a path separator");
    }
    if (result.find('\0') != std::string::npos) {
        throw BackupError(ErrorKind::INVALID_CONFIG, "snapshot name contains a NUL character");
    }
    if (!isSnapshotName(result)) {
        throw BackupError(ErrorKind::INVALID_CONFIG,
                          "snapshot name '" + result + "' must not start with '.'");
    }
    return result;
}

void SnapshotNamer::validateFormat(const std::string& format) {
    // 任意时间点生成一次即可发现空名和分隔符问题
    name(std::chrono::system_clock::time_point(), format);

    // 字段须从年到微秒各出现一次且按高位到低位排列，否则字典序与时间顺序不一致
    std::string fields;
    for (char token : format) {
        if (std::strchr("YymdHMSf", token) != nullptr) {
            fields += token;
        }
    }
    if (fields != "YmdHMSf" && fields != "ymdHMSf") {
        throw BackupError(ErrorKind::INVALID_CONFIG,
                          "snapshot name format '" + format +
                          "' must contain Y (or y), m, d, H, M, S, f exactly once and in that order");
    }
}

bool SnapshotNamer::isSnapshotName(const std::string& entryName) {
    return !entryName.empty() && entryName[0] != '.';
}

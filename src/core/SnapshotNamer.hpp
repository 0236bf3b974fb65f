#pragma once
#include <chrono>
#include <string>

// 根据时间戳和格式串生成快照名
// 格式串中的字母 Y y m d H M S f 分别替换为 四位年/两位年/月/日/时/分/秒/微秒，
// 其他字符原样保留。时间使用UTC，字段定宽补零，按从高位到低位排列时
// 字典序即时间顺序。
class SnapshotNamer {
public:
    // 生成的名字为空、含路径分隔符或以'.'开头时抛出 BackupError(INVALID_CONFIG)
    static std::string name(std::chrono::system_clock::time_point timestamp, const std::string& format);

    // 另外要求字段完整且按年、月、日、时、分、秒、微秒的顺序出现
    static void validateFormat(const std::string& format);

    // 目录项是否可能是快照（以'.'开头的是临时目录）
    static bool isSnapshotName(const std::string& entryName);
};

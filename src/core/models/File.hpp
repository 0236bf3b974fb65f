#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

// 源目录树中一个条目的快照信息（不解析符号链接）
class File {
private:
    // 1. 文件类型
    fs::file_type fileType;
    
    // 2. 文件路径：绝对路径以及相对于源根目录的路径
    fs::path filePath;
    fs::path relativePath;
    
    // 3. 文件元数据
    uint64_t fileSize;
    int64_t lastModifiedNs;   // 修改时间，纳秒
    unsigned int permissions; // POSIX权限位
    
    // 4. 符号链接目标
    fs::path symlinkTarget;

public:
    File();
    File(const fs::path& path, const fs::path& root);

    // 读取元数据，失败时返回false并设置ec（例如权限不足或文件已消失）
    bool initialize(const fs::path& path, const fs::path& root, std::error_code& ec);
    
    // 基本属性访问
    const fs::path& getFilePath() const;
    const fs::path& getRelativePath() const;
    // 统一使用'/'分隔的相对路径，用作清单键
    std::string getManifestKey() const;
    uint64_t getFileSize() const;
    fs::file_type getFileType() const;
    int64_t getLastModifiedNs() const;
    unsigned int getPermissions() const;
    const fs::path& getSymlinkTarget() const;
    
    // 文件类型判断
    bool isDirectory() const;
    bool isRegularFile() const;
    bool isSymbolicLink() const;
    // 符号链接、FIFO、设备、套接字等
    bool isSpecial() const;

    std::string describeType() const;
    std::string toString() const;

    bool operator==(const File& other) const;
    bool operator!=(const File& other) const;
};

// file_time_type 与纳秒计数互相转换
int64_t toNanoseconds(fs::file_time_type time);
fs::file_time_type fromNanoseconds(int64_t nanoseconds);

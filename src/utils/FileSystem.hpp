#pragma once
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

class FileSystem {
public:
    // 检查文件或目录是否存在（不解析符号链接）
    static bool exists(const std::string& path);

    // 是否为可读取的目录
    static bool isReadableDirectory(const std::string& path, std::error_code& ec);

    // 普通文件能否打开读取
    static bool isReadableFile(const std::string& path);

    // 创建目录（包括父目录），已存在时视为成功
    static bool createDirectories(const std::string& path, std::error_code& ec);

    // 复制普通文件并保留权限和修改时间，自动创建父目录
    static bool copyFile(const std::string& source, const std::string& destination, std::error_code& ec);

    // 将目录的权限和修改时间复制到目标目录
    static bool copyDirectoryMetadata(const std::string& source, const std::string& destination, std::error_code& ec);

    // 递归删除文件或目录，路径不存在时视为成功
    static bool removeTree(const std::string& path, std::error_code& ec);

    // 列出目录下的直接子项名称（按名称排序）
    static std::vector<std::string> listNames(const std::string& directory, std::error_code& ec);

    // 原子重命名（同一文件系统内）
    static bool renamePath(const std::string& from, const std::string& to, std::error_code& ec);
};

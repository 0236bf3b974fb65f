#pragma once
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// 包内条目元数据
struct PackageEntry {
    uint8_t entryType;         // 0: 普通文件, 1: 目录
    std::string path;          // 相对路径，'/'分隔
    uint32_t permissions;      // 文件权限
    int64_t lastModifiedNs;    // 最后修改时间（纳秒）
    uint64_t fileSize;         // 文件大小，目录为0

    PackageEntry() : entryType(0), permissions(0), lastModifiedNs(0), fileSize(0) {}
};

// 把快照的data目录打成一个包文件，再用Huffman压缩为单个归档
// 包格式：魔数"SNAPPKG1"，随后顺序写入 条目头 + 文件内容，以类型0xFF结束
class SnapshotArchiver {
public:
    static constexpr const char* ARCHIVE_SUFFIX = ".pkg.huff";

    // 归档目录，成功后 archivePath 指向完整的归档文件（先写临时文件再改名）
    bool archiveDirectory(const std::string& directory, const std::string& archivePath, std::string& errorMessage);

    // 解开归档到 outputDir，恢复权限和修改时间
    bool extractArchive(const std::string& archivePath, const std::string& outputDir, std::string& errorMessage);

    // 读取归档中的条目列表（不写出文件内容）
    bool listEntries(const std::string& archivePath, std::vector<PackageEntry>& entries, std::string& errorMessage);

private:
    bool packageDirectory(const std::string& directory, const std::string& packagePath, std::string& errorMessage);
    bool unpackPackage(const std::string& packagePath, const std::string& outputDir,
                       std::vector<PackageEntry>* listing, std::string& errorMessage);
    std::string scratchPath(const std::string& hint) const;
};

#pragma once
#include <memory>
#include <string>
#include "models/File.hpp"

class Filter {
public:
    virtual ~Filter() = default;
    // 返回false表示该文件不能备份，变化检测会将其计入skipped
    virtual bool match(const File& file) const = 0;

    virtual std::string getFilterDescription() const = 0;
};

// 目标文件系统不允许的文件名字符（FAT/NTFS等）
class TargetNameFilter : public Filter {
private:
    std::string filesystemType;
    std::string forbiddenChars;

public:
    TargetNameFilter(const std::string& filesystemType, const std::string& forbiddenChars);
    ~TargetNameFilter() = default;

    // 根据文件系统类型（/proc/mounts中的名称）构造
    static std::shared_ptr<TargetNameFilter> forFilesystemType(const std::string& filesystemType);

    // 查找目标路径所在挂载点的文件系统类型，mountsFile默认为/proc/mounts
    static std::string detectFilesystemType(const std::string& targetPath,
                                            const std::string& mountsFile = "/proc/mounts");

    static std::shared_ptr<TargetNameFilter> forTarget(const std::string& targetPath);

    // 路径中每一段名字都合法时返回true
    bool isPathAllowed(const std::string& relativePath) const;
    bool isNameAllowed(const std::string& name) const;

    const std::string& getFilesystemType() const {
        return this->filesystemType;
    }

    bool match(const File& file) const override;

    std::string getFilterDescription() const override;
};

#include "Filter.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char* WINDOWS_FORBIDDEN = "\"*:<>?\\|";

// /proc/mounts 中的空格等字符以八进制转义，例如 \040
std::string unescapeMountField(const std::string& field) {
    std::string result;
    for (size_t i = 0; i < field.size(); i++) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            const std::string digits = field.substr(i + 1, 3);
            if (digits.find_first_not_of("01234567") == std::string::npos) {
                result += static_cast<char>(std::stoi(digits, nullptr, 8));
                i += 3;
                continue;
            }
        }
        result += field[i];
    }
    return result;
}

bool isUnderMountPoint(const std::string& path, const std::string& mountPoint) {
    if (mountPoint == "/") {
        return !path.empty() && path[0] == '/';
    }
    return path == mountPoint ||
           (path.size() > mountPoint.size() && path.compare(0, mountPoint.size(), mountPoint) == 0 &&
            path[mountPoint.size()] == '/');
}

} // namespace

TargetNameFilter::TargetNameFilter(const std::string& filesystemType, const std::string& forbiddenChars)
    : filesystemType(filesystemType), forbiddenChars(forbiddenChars) {}

std::shared_ptr<TargetNameFilter> TargetNameFilter::forFilesystemType(const std::string& type) {
    static const std::set<std::string> windowsLike = {
        "vfat", "msdos", "exfat", "ntfs", "ntfs3", "fuseblk"
    };
    if (windowsLike.count(type) > 0) {
        return std::make_shared<TargetNameFilter>(type, WINDOWS_FORBIDDEN);
    }
    // POSIX文件系统只禁止'/'，而'/'本身就是分隔符
    return std::make_shared<TargetNameFilter>(type.empty() ? "unknown" : type, "");
}

std::string TargetNameFilter::detectFilesystemType(const std::string& targetPath, const std::string& mountsFile) {
    std::ifstream mounts(mountsFile);
    if (!mounts) {
        return std::string();
    }

    // 目标目录可能还不存在，weakly_canonical只解析已存在的前缀
    std::error_code ec;
    fs::path absolutePath = fs::absolute(targetPath, ec).lexically_normal();
    fs::path resolved = fs::weakly_canonical(absolutePath, ec);
    std::string path = ec ? absolutePath.string() : resolved.string();
    if (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    std::string line;
    std::string bestMount;
    std::string bestType;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device;
        std::string mountPoint;
        std::string type;
        if (!(fields >> device >> mountPoint >> type)) {
            continue;
        }
        mountPoint = unescapeMountField(mountPoint);
        // 取最长匹配的挂载点，后出现的同名挂载覆盖先前的
        if (isUnderMountPoint(path, mountPoint) && mountPoint.size() >= bestMount.size()) {
            bestMount = mountPoint;
            bestType = type;
        }
    }
    return bestType;
}

std::shared_ptr<TargetNameFilter> TargetNameFilter::forTarget(const std::string& targetPath) {
    return forFilesystemType(detectFilesystemType(targetPath));
}

bool TargetNameFilter::isNameAllowed(const std::string& name) const {
    if (forbiddenChars.empty()) {
        return true;
    }
    for (char c : name) {
        if (static_cast<unsigned char>(c) < 0x20 || forbiddenChars.find(c) != std::string::npos) {
            return false;
        }
    }
    return true;
}

bool TargetNameFilter::isPathAllowed(const std::string& relativePath) const {
    for (const auto& part : fs::path(relativePath)) {
        if (!isNameAllowed(part.string())) {
            return false;
        }
    }
    return true;
}

bool TargetNameFilter::match(const File& file) const {
    return isPathAllowed(file.getRelativePath().string());
}

std::string TargetNameFilter::getFilterDescription() const {
    if (forbiddenChars.empty()) {
        return "Target Name Filter: " + filesystemType + " (no restrictions)";
    }
    return "Target Name Filter: " + filesystemType + " forbids \"" + forbiddenChars + "\" and control characters";
}

#include "File.hpp"
#include <chrono>
#include <sstream>

int64_t toNanoseconds(fs::file_time_type time) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

fs::file_time_type fromNanoseconds(int64_t nanoseconds) {
    return fs::file_time_type(std::chrono::duration_cast<fs::file_time_type::duration>(
        std::chrono::nanoseconds(nanoseconds)));
}

File::File()
    : fileType(fs::file_type::none), fileSize(0), lastModifiedNs(0), permissions(0) {}

File::File(const fs::path& path, const fs::path& root) : File() {
    std::error_code ec;
    initialize(path, root, ec);
}

bool File::initialize(const fs::path& path, const fs::path& root, std::error_code& ec) {
    this->filePath = path;
    this->relativePath = path.lexically_relative(root);
    this->fileSize = 0;
    this->lastModifiedNs = 0;
    this->permissions = 0;
    this->symlinkTarget.clear();

    // 使用symlink_status获取文件状态，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
        this->fileType = fs::file_type::none;
        return false;
    }
    this->fileType = status.type();
    this->permissions = static_cast<unsigned int>(status.permissions()) & 07777u;

    if (fs::is_regular_file(status)) {
        this->fileSize = fs::file_size(path, ec);
        if (ec) {
            return false;
        }
        auto fileTime = fs::last_write_time(path, ec);
        if (ec) {
            return false;
        }
        this->lastModifiedNs = toNanoseconds(fileTime);
    } else if (fs::is_directory(status)) {
        auto fileTime = fs::last_write_time(path, ec);
        if (ec) {
            return false;
        }
        this->lastModifiedNs = toNanoseconds(fileTime);
    } else if (fs::is_symlink(status)) {
        // 只记录链接本身，不跟随，避免循环链接
        this->symlinkTarget = fs::read_symlink(path, ec);
        if (ec) {
            return false;
        }
    }
    return true;
}

const fs::path& File::getFilePath() const {
    return this->filePath;
}

const fs::path& File::getRelativePath() const {
    return this->relativePath;
}

std::string File::getManifestKey() const {
    return this->relativePath.generic_string();
}

uint64_t File::getFileSize() const {
    return this->fileSize;
}

fs::file_type File::getFileType() const {
    return this->fileType;
}

int64_t File::getLastModifiedNs() const {
    return this->lastModifiedNs;
}

unsigned int File::getPermissions() const {
    return this->permissions;
}

const fs::path& File::getSymlinkTarget() const {
    return this->symlinkTarget;
}

bool File::isDirectory() const {
    return fileType == fs::file_type::directory;
}

bool File::isRegularFile() const {
    return fileType == fs::file_type::regular;
}

bool File::isSymbolicLink() const {
    return fileType == fs::file_type::symlink;
}

bool File::isSpecial() const {
    return !isDirectory() && !isRegularFile();
}

std::string File::describeType() const {
    switch (fileType) {
        case fs::file_type::regular: return "regular file";
        case fs::file_type::directory: return "directory";
        case fs::file_type::symlink: return "symbolic link";
        case fs::file_type::block: return "block device";
        case fs::file_type::character: return "character device";
        case fs::file_type::fifo: return "fifo";
        case fs::file_type::socket: return "socket";
        default: return "unknown";
    }
}

std::string File::toString() const {
    std::stringstream ss;
    ss << "File: " << this->relativePath.generic_string()
       << " (" << describeType() << ", " << this->fileSize << " bytes)";
    if (isSymbolicLink()) {
        ss << " -> " << this->symlinkTarget.string();
    }
    return ss.str();
}

bool File::operator==(const File& other) const {
    return this->filePath == other.filePath;
}

bool File::operator!=(const File& other) const {
    return !(*this == other);
}

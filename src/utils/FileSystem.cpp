#include "FileSystem.hpp"
#include <algorithm>
#include <fstream>

bool FileSystem::exists(const std::string& path) {
    std::error_code ec;
    // 使用symlink_status检查文件是否存在，不解析符号链接
    fs::file_status status = fs::symlink_status(path, ec);
    return !ec && status.type() != fs::file_type::not_found;
}

bool FileSystem::isReadableDirectory(const std::string& path, std::error_code& ec) {
    ec.clear();
    if (!fs::is_directory(path, ec)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        return false;
    }
    // 真正打开一次，权限不足时在这里暴露
    fs::directory_iterator it(path, ec);
    return !ec;
}

bool FileSystem::isReadableFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return static_cast<bool>(in);
}

bool FileSystem::createDirectories(const std::string& path, std::error_code& ec) {
    ec.clear();
    fs::file_status status = fs::status(path, ec);
    if (!ec && fs::is_directory(status)) {
        return true;
    }
    ec.clear();
    fs::create_directories(path, ec);
    return !ec;
}

bool FileSystem::copyFile(const std::string& source, const std::string& destination, std::error_code& ec) {
    ec.clear();
    fs::path destPath(destination);
    if (!destPath.parent_path().empty()) {
        if (!createDirectories(destPath.parent_path().string(), ec)) {
            return false;
        }
    }

    fs::file_status status = fs::symlink_status(source, ec);
    if (ec) {
        return false;
    }
    if (!fs::is_regular_file(status)) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    if (!fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec)) {
        return false;
    }

    // 保留权限和修改时间，目标文件系统不支持时忽略
    std::error_code metaEc;
    fs::permissions(destination, status.permissions(), fs::perm_options::replace, metaEc);
    auto modified = fs::last_write_time(source, metaEc);
    if (!metaEc) {
        fs::last_write_time(destination, modified, metaEc);
    }
    return true;
}

bool FileSystem::copyDirectoryMetadata(const std::string& source, const std::string& destination, std::error_code& ec) {
    ec.clear();
    fs::file_status status = fs::status(source, ec);
    if (ec) {
        return false;
    }
    fs::permissions(destination, status.permissions(), fs::perm_options::replace, ec);
    if (ec) {
        return false;
    }
    auto modified = fs::last_write_time(source, ec);
    if (ec) {
        return false;
    }
    fs::last_write_time(destination, modified, ec);
    return !ec;
}

bool FileSystem::removeTree(const std::string& path, std::error_code& ec) {
    ec.clear();
    fs::remove_all(path, ec);
    if (!ec) {
        return true;
    }

    // 快照保留了源目录的只读权限，先恢复属主写权限再删除一次
    std::error_code walkEc;
    if (fs::is_directory(fs::symlink_status(path, walkEc))) {
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add, walkEc);
        for (fs::recursive_directory_iterator it(path, walkEc), end; !walkEc && it != end; it.increment(walkEc)) {
            std::error_code entryEc;
            if (it->is_directory(entryEc) && !it->is_symlink(entryEc)) {
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, entryEc);
            }
        }
    }
    ec.clear();
    fs::remove_all(path, ec);
    return !ec;
}

std::vector<std::string> FileSystem::listNames(const std::string& directory, std::error_code& ec) {
    std::vector<std::string> names;
    ec.clear();
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool FileSystem::renamePath(const std::string& from, const std::string& to, std::error_code& ec) {
    ec.clear();
    fs::rename(from, to, ec);
    return !ec;
}

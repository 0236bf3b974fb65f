#include "SnapshotArchiver.hpp"
#include "HuffmanCompressor.hpp"
#include "FileSystem.hpp"
#include "../core/models/File.hpp"
#include <algorithm>
#include <atomic>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char PACKAGE_MAGIC[8] = {'S', 'N', 'A', 'P', 'P', 'K', 'G', '1'};
const uint8_t TYPE_FILE = 0;
const uint8_t TYPE_DIRECTORY = 1;
const uint8_t TYPE_END = 0xFF;
const uint32_t MAX_PATH_LENGTH = 64 * 1024;

std::atomic<unsigned long> scratchCounter{0};

template <typename T>
void writeValue(std::ofstream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template <typename T>
bool readValue(std::ifstream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    return static_cast<bool>(in);
}

// 包路径必须是相对路径且不能跳出输出目录
bool isSafeRelativePath(const std::string& path) {
    if (path.empty() || path[0] == '/') {
        return false;
    }
    for (const auto& part : fs::path(path)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

// 写入条目头
void writeEntryHeader(std::ofstream& out, const PackageEntry& entry) {
    writeValue(out, entry.entryType);
    uint32_t pathLength = static_cast<uint32_t>(entry.path.size());
    writeValue(out, pathLength);
    out.write(entry.path.data(), pathLength);
    writeValue(out, entry.permissions);
    writeValue(out, entry.lastModifiedNs);
    writeValue(out, entry.fileSize);
}

} // namespace

std::string SnapshotArchiver::scratchPath(const std::string& hint) const {
    fs::path dir = fs::temp_directory_path();
    return (dir / ("snapshotd-" + std::to_string(::getpid()) + "-" +
                   std::to_string(scratchCounter++) + "-" + hint)).string();
}

bool SnapshotArchiver::packageDirectory(const std::string& directory, const std::string& packagePath,
                                        std::string& errorMessage) {
    std::ofstream outFile(packagePath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        errorMessage = "cannot create package file " + packagePath;
        return false;
    }
    outFile.write(PACKAGE_MAGIC, sizeof(PACKAGE_MAGIC));

    // 收集条目并排序，父目录总在子项之前
    std::vector<File> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        files.emplace_back(it->path(), fs::path(directory));
    }
    if (ec) {
        errorMessage = "cannot walk " + directory + " (" + ec.message() + ")";
        return false;
    }
    std::sort(files.begin(), files.end(), [](const File& a, const File& b) {
        return a.getManifestKey() < b.getManifestKey();
    });

    std::vector<char> buffer(64 * 1024);
    for (const auto& file : files) {
        PackageEntry entry;
        entry.path = file.getManifestKey();
        entry.permissions = file.getPermissions();
        entry.lastModifiedNs = file.getLastModifiedNs();

        if (file.isDirectory()) {
            entry.entryType = TYPE_DIRECTORY;
            writeEntryHeader(outFile, entry);
        } else if (file.isRegularFile()) {
            entry.entryType = TYPE_FILE;
            entry.fileSize = file.getFileSize();
            std::ifstream inFile(file.getFilePath(), std::ios::binary);
            if (!inFile) {
                errorMessage = "cannot read " + file.getFilePath().string();
                return false;
            }
            writeEntryHeader(outFile, entry);

            // 按头部记录的大小写入内容，文件中途变化时视为失败
            uint64_t remaining = entry.fileSize;
            while (remaining > 0) {
                std::streamsize chunk = static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining));
                inFile.read(buffer.data(), chunk);
                if (inFile.gcount() != chunk) {
                    errorMessage = "file changed while archiving: " + file.getFilePath().string();
                    return false;
                }
                outFile.write(buffer.data(), chunk);
                remaining -= static_cast<uint64_t>(chunk);
            }
        } else {
            errorMessage = "unsupported " + file.describeType() + " in snapshot: " + entry.path;
            return false;
        }
    }

    writeValue(outFile, TYPE_END);
    outFile.flush();
    if (!outFile) {
        errorMessage = "failed writing package " + packagePath;
        return false;
    }
    return true;
}

bool SnapshotArchiver::archiveDirectory(const std::string& directory, const std::string& archivePath,
                                        std::string& errorMessage) {
    std::string packagePath = scratchPath("package.pkg");
    std::string partialPath = archivePath + ".part";
    std::error_code ec;

    bool ok = packageDirectory(directory, packagePath, errorMessage);
    if (ok) {
        HuffmanCompressor compressor;
        ok = compressor.compressFile(packagePath, partialPath);
        if (!ok) {
            errorMessage = compressor.getLastError();
        }
    }
    fs::remove(packagePath, ec);

    if (ok && !FileSystem::renamePath(partialPath, archivePath, ec)) {
        errorMessage = "cannot rename " + partialPath + " (" + ec.message() + ")";
        ok = false;
    }
    if (!ok) {
        fs::remove(partialPath, ec);
    }
    return ok;
}

bool SnapshotArchiver::unpackPackage(const std::string& packagePath, const std::string& outputDir,
                                     std::vector<PackageEntry>* listing, std::string& errorMessage) {
    std::ifstream inFile(packagePath, std::ios::binary);
    if (!inFile) {
        errorMessage = "cannot open package " + packagePath;
        return false;
    }
    char magic[sizeof(PACKAGE_MAGIC)];
    inFile.read(magic, sizeof(magic));
    if (!inFile || std::memcmp(magic, PACKAGE_MAGIC, sizeof(magic)) != 0) {
        errorMessage = "not a snapshot package: " + packagePath;
        return false;
    }

    std::error_code ec;
    if (listing == nullptr && !FileSystem::createDirectories(outputDir, ec)) {
        errorMessage = "cannot create " + outputDir + " (" + ec.message() + ")";
        return false;
    }

    std::vector<PackageEntry> directories;
    std::vector<char> buffer(64 * 1024);
    while (true) {
        PackageEntry entry;
        if (!readValue(inFile, entry.entryType)) {
            errorMessage = "truncated package " + packagePath;
            return false;
        }
        if (entry.entryType == TYPE_END) {
            break;
        }
        uint32_t pathLength = 0;
        if (!readValue(inFile, pathLength) || pathLength > MAX_PATH_LENGTH) {
            errorMessage = "corrupt entry in package " + packagePath;
            return false;
        }
        entry.path.resize(pathLength);
        if (pathLength > 0) {
            inFile.read(&entry.path[0], pathLength);
        }
        if (!inFile || !readValue(inFile, entry.permissions) || !readValue(inFile, entry.lastModifiedNs) ||
            !readValue(inFile, entry.fileSize) || !isSafeRelativePath(entry.path) ||
            (entry.entryType != TYPE_FILE && entry.entryType != TYPE_DIRECTORY)) {
            errorMessage = "corrupt entry in package " + packagePath;
            return false;
        }

        if (listing != nullptr) {
            listing->push_back(entry);
            inFile.seekg(static_cast<std::streamoff>(entry.fileSize), std::ios::cur);
            continue;
        }

        fs::path outputPath = fs::path(outputDir) / entry.path;
        if (entry.entryType == TYPE_DIRECTORY) {
            if (!FileSystem::createDirectories(outputPath.string(), ec)) {
                errorMessage = "cannot create directory " + outputPath.string() + " (" + ec.message() + ")";
                return false;
            }
            // 目录的权限和时间在最后设置，避免只读目录阻止写入子项
            directories.push_back(entry);
            continue;
        }

        if (!FileSystem::createDirectories(outputPath.parent_path().string(), ec)) {
            errorMessage = "cannot create directory " + outputPath.parent_path().string();
            return false;
        }
        std::ofstream outFile(outputPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            errorMessage = "cannot create output file " + outputPath.string();
            return false;
        }
        uint64_t remaining = entry.fileSize;
        while (remaining > 0) {
            std::streamsize chunk = static_cast<std::streamsize>(std::min<uint64_t>(buffer.size(), remaining));
            inFile.read(buffer.data(), chunk);
            if (inFile.gcount() != chunk) {
                errorMessage = "truncated data for " + entry.path;
                return false;
            }
            outFile.write(buffer.data(), chunk);
            remaining -= static_cast<uint64_t>(chunk);
        }
        outFile.close();
        if (!outFile) {
            errorMessage = "failed writing " + outputPath.string();
            return false;
        }

        std::error_code metaEc;
        fs::permissions(outputPath, fs::perms(entry.permissions), fs::perm_options::replace, metaEc);
        fs::last_write_time(outputPath, fromNanoseconds(entry.lastModifiedNs), metaEc);
    }

    // 由深到浅恢复目录元数据
    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        fs::path outputPath = fs::path(outputDir) / it->path;
        std::error_code metaEc;
        fs::permissions(outputPath, fs::perms(it->permissions), fs::perm_options::replace, metaEc);
        fs::last_write_time(outputPath, fromNanoseconds(it->lastModifiedNs), metaEc);
    }
    return true;
}

bool SnapshotArchiver::extractArchive(const std::string& archivePath, const std::string& outputDir,
                                      std::string& errorMessage) {
    std::string packagePath = scratchPath("extract.pkg");
    HuffmanCompressor compressor;
    bool ok = compressor.decompressFile(archivePath, packagePath);
    if (!ok) {
        errorMessage = compressor.getLastError();
    } else {
        ok = unpackPackage(packagePath, outputDir, nullptr, errorMessage);
    }
    std::error_code ec;
    fs::remove(packagePath, ec);
    return ok;
}

bool SnapshotArchiver::listEntries(const std::string& archivePath, std::vector<PackageEntry>& entries,
                                   std::string& errorMessage) {
    std::string packagePath = scratchPath("list.pkg");
    HuffmanCompressor compressor;
    bool ok = compressor.decompressFile(archivePath, packagePath);
    if (!ok) {
        errorMessage = compressor.getLastError();
    } else {
        entries.clear();
        ok = unpackPackage(packagePath, std::string(), &entries, errorMessage);
    }
    std::error_code ec;
    fs::remove(packagePath, ec);
    return ok;
}

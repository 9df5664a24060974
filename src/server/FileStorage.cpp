#include "server/FileStorage.hpp"
#include "core/ToolkitError.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <sys/types.h>

namespace fs = std::filesystem;

namespace toolkit {

FileStorage::FileStorage(const std::string& basePath)
    : basePath_(basePath) {}

std::uintmax_t FileStorage::saveFile(const std::string& filename,
                                     const std::vector<uint8_t>& content) const {
    std::string fullSystemPath = getFullPath(filename);

    std::ofstream outFile(fullSystemPath, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        std::string error = "Failed to create file: " + fullSystemPath + " (" + strerror(errno) + ")";
        std::cerr << error << std::endl;
        throw ToolkitError(ErrorKind::Io, error);
    }

    outFile.write(reinterpret_cast<const char*>(content.data()),
                  static_cast<std::streamsize>(content.size()));
    outFile.close();
    if (!outFile) {
        std::string error = "Failed to write file: " + fullSystemPath;
        std::cerr << error << std::endl;
        throw ToolkitError(ErrorKind::Io, error);
    }

    std::cout << "File saved: " << fullSystemPath << " (" << content.size() << " bytes)" << std::endl;
    return content.size();
}

std::string FileStorage::getFullPath(const std::string& filename) const {
    return (fs::path(basePath_) / filename).string();
}

void FileStorage::ensureStorageDirectory() const {
    createDirIfNotExist(basePath_);
}

void FileStorage::createDirIfNotExist(const std::string& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (fs::exists(st)) {
        if (!fs::is_directory(st)) {
            throw ToolkitError(ErrorKind::Io, "Path exists but is not a directory: " + path);
        }
        return;
    }

    // Create each missing segment from the outermost existing ancestor down.
    // The process umask applies to the 0755 mode, as with mkdir(1).
    fs::path current;
    for (const auto& segment : fs::path(path)) {
        current /= segment;
        if (fs::is_directory(current, ec)) continue;

        if (::mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
            throw ToolkitError(ErrorKind::Io,
                               "Failed to create directory " + current.string() + ": " + strerror(errno));
        }
        if (!fs::is_directory(current, ec)) {
            throw ToolkitError(ErrorKind::Io,
                               "Failed to create directory " + current.string() + ": not a directory");
        }
    }

    std::cout << "Created directory: " << path << std::endl;
}

} // namespace toolkit

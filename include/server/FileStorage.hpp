#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace toolkit {

class FileStorage {
public:
    explicit FileStorage(const std::string& basePath);

    // Writes content to basePath/filename, replacing any existing file.
    // Returns the number of bytes written.
    std::uintmax_t saveFile(const std::string& filename, const std::vector<uint8_t>& content) const;

    // Gets the full path for a stored file
    std::string getFullPath(const std::string& filename) const;

    // Ensures the storage directory exists
    void ensureStorageDirectory() const;

    /**
     * Create path and every missing parent with mode 0755.
     * No-op when path is already a directory.
     * @throws ToolkitError (Io) when creation fails or path exists as a non-directory
     */
    static void createDirIfNotExist(const std::string& path);

private:
    std::string basePath_;
};

} // namespace toolkit

#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Filesystem attributes of a single file, read without touching its content
 */
struct FileMetadata
{
    std::string file_path;
    std::string file_name;
    std::time_t modification_time; // Last modification time
    std::time_t creation_time;     // Status change time where birth time is unavailable
    uint64_t file_size;            // File size in bytes

    std::string toString() const;
};

/**
 * @brief File utilities shared by validation, caching and the CLI
 */
class FileUtils
{
public:
    /**
     * @brief Get file metadata (no file content reading)
     * @param file_path Path to the file
     * @return Optional FileMetadata if the path is an accessible regular file
     */
    static std::optional<FileMetadata> getFileMetadata(const std::string &file_path);

    /**
     * @brief True if the current process may open the file for reading
     */
    static bool isReadableFile(const std::string &file_path);

    /**
     * @brief True if `path` resolves to a location inside `root`
     */
    static bool isWithinDirectory(const std::string &path, const std::string &root);

    /**
     * @brief Copy a file or directory into `target_dir`, keeping `file_name`
     * @return Destination path, or std::nullopt on failure (logged)
     */
    static std::optional<std::string> copyInto(const std::string &source, const std::string &target_dir,
                                               const std::string &file_name);

    /**
     * @brief Human readable size, e.g. "12.4 MB"
     */
    static std::string formatBytes(uint64_t size_bytes);
};

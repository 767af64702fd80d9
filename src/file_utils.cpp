#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

std::string FileMetadata::toString() const
{
    std::stringstream ss;
    ss << "FileMetadata{"
       << "path='" << file_path << "', "
       << "mod_time=" << modification_time << ", "
       << "create_time=" << creation_time << ", "
       << "size=" << file_size << "}";
    return ss.str();
}

std::optional<FileMetadata> FileUtils::getFileMetadata(const std::string &file_path)
{
    struct stat st;
    if (stat(file_path.c_str(), &st) != 0 || !S_ISREG(st.st_mode))
    {
        return std::nullopt;
    }

    FileMetadata metadata;
    metadata.file_path = file_path;
    metadata.file_name = fs::path(file_path).filename().string();
    metadata.modification_time = st.st_mtime;
#ifdef __APPLE__
    metadata.creation_time = st.st_birthtime;
#else
    metadata.creation_time = st.st_ctime;
#endif
    metadata.file_size = static_cast<uint64_t>(st.st_size);
    return metadata;
}

bool FileUtils::isReadableFile(const std::string &file_path)
{
    return access(file_path.c_str(), R_OK) == 0;
}

bool FileUtils::isWithinDirectory(const std::string &path, const std::string &root)
{
    std::error_code ec;
    fs::path canonical_root = fs::weakly_canonical(root, ec);
    if (ec)
    {
        return false;
    }
    fs::path canonical_path = fs::weakly_canonical(path, ec);
    if (ec)
    {
        return false;
    }

    fs::path relative = canonical_path.lexically_relative(canonical_root);
    if (relative.empty())
    {
        return false;
    }
    return *relative.begin() != "..";
}

std::optional<std::string> FileUtils::copyInto(const std::string &source, const std::string &target_dir,
                                               const std::string &file_name)
{
    try
    {
        fs::create_directories(target_dir);
        fs::path destination = fs::path(target_dir) / file_name;
        if (fs::is_directory(source))
        {
            fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        }
        else
        {
            fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
        }
        return destination.string();
    }
    catch (const fs::filesystem_error &e)
    {
        Logger::error("Failed to copy " + source + " into " + target_dir + ": " + e.what());
        return std::nullopt;
    }
}

std::string FileUtils::formatBytes(uint64_t size_bytes)
{
    const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size_double = static_cast<double>(size_bytes);

    while (size_double >= 1024.0 && unit_index < 4)
    {
        size_double /= 1024.0;
        unit_index++;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << size_double << " " << units[unit_index];
    return ss.str();
}

#include "core/format_descriptor.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace
{
    struct FormatEntry
    {
        const char *extension;
        MediaCategory category;
    };

    const FormatEntry kFormatTable[] = {
        // Images
        {"jpg", MediaCategory::Image},
        {"jpeg", MediaCategory::Image},
        {"png", MediaCategory::Image},
        {"bmp", MediaCategory::Image},
        {"gif", MediaCategory::Image},
        {"tiff", MediaCategory::Image},
        {"tif", MediaCategory::Image},
        {"webp", MediaCategory::Image},
        {"heic", MediaCategory::Image},
        {"jp2", MediaCategory::Image},
        // Audio
        {"mp3", MediaCategory::Audio},
        {"wav", MediaCategory::Audio},
        {"m4a", MediaCategory::Audio},
        {"aac", MediaCategory::Audio},
        {"flac", MediaCategory::Audio},
        {"ogg", MediaCategory::Audio},
        {"aiff", MediaCategory::Audio},
        // Video
        {"mp4", MediaCategory::Video},
        {"mov", MediaCategory::Video},
        {"m4v", MediaCategory::Video},
        {"avi", MediaCategory::Video},
        {"mkv", MediaCategory::Video},
        {"webm", MediaCategory::Video},
        // Documents
        {"pdf", MediaCategory::Document},
    };

    std::string normalizeExtension(const std::string &extension)
    {
        std::string ext = extension;
        if (!ext.empty() && ext.front() == '.')
        {
            ext.erase(0, 1);
        }
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext;
    }
}

std::string categoryName(MediaCategory category)
{
    switch (category)
    {
    case MediaCategory::Image:
        return "image";
    case MediaCategory::Audio:
        return "audio";
    case MediaCategory::Video:
        return "video";
    case MediaCategory::Document:
        return "document";
    case MediaCategory::Audiovisual:
        return "audiovisual";
    }
    return "unknown";
}

FormatDescriptor::FormatDescriptor(std::string identifier, MediaCategory category)
    : identifier_(normalizeExtension(identifier)), category_(category)
{
}

std::optional<FormatDescriptor> FormatDescriptor::fromExtension(const std::string &extension)
{
    const std::string ext = normalizeExtension(extension);
    for (const auto &entry : kFormatTable)
    {
        if (ext == entry.extension)
        {
            return FormatDescriptor(entry.extension, entry.category);
        }
    }
    return std::nullopt;
}

std::optional<FormatDescriptor> FormatDescriptor::forPath(const std::string &path)
{
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext.empty())
    {
        return std::nullopt;
    }
    return fromExtension(ext);
}

std::vector<FormatDescriptor> FormatDescriptor::formatsFor(MediaCategory category)
{
    std::vector<FormatDescriptor> formats;
    for (const auto &entry : kFormatTable)
    {
        if (entry.category == category)
        {
            formats.emplace_back(entry.extension, entry.category);
        }
    }
    return formats;
}

bool FormatDescriptor::conformsTo(MediaCategory category) const
{
    if (category == MediaCategory::Audiovisual)
    {
        return category_ == MediaCategory::Video;
    }
    return category_ == category;
}

std::string FormatDescriptor::toString() const
{
    return identifier_ + " (" + categoryName(category_) + ")";
}

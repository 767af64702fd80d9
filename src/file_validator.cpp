#include "core/file_validator.hpp"
#include "core/conversion_error.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"

uint64_t SizeLimits::limitFor(MediaCategory category) const
{
    switch (category)
    {
    case MediaCategory::Image:
        return image;
    case MediaCategory::Audio:
        return audio;
    case MediaCategory::Video:
    case MediaCategory::Audiovisual:
        return video;
    case MediaCategory::Document:
        return document;
    }
    return 0;
}

SizeLimits SizeLimits::fromSettings(const ConversionSettings &settings)
{
    SizeLimits limits;
    limits.image = settings.image_size_limit;
    limits.audio = settings.audio_size_limit;
    limits.video = settings.video_size_limit;
    limits.document = settings.document_size_limit;
    return limits;
}

FileValidator::FileValidator(SizeLimits limits) : limits_(limits) {}

ConversionMetadata FileValidator::validate(const std::string &path) const
{
    auto file = FileUtils::getFileMetadata(path);
    if (!file)
    {
        Logger::warn("Rejected input (missing or not a regular file): " + path);
        throw ConversionError::invalidInputType(path);
    }
    if (!FileUtils::isReadableFile(path))
    {
        Logger::warn("Rejected input (not readable): " + path);
        throw ConversionError::invalidInputType(path);
    }
    if (file->file_size == 0)
    {
        Logger::warn("Rejected input (empty file): " + path);
        throw ConversionError::invalidInputType(path);
    }

    auto format = FormatDescriptor::forPath(path);
    if (!format)
    {
        Logger::warn("Rejected input (unknown format): " + path);
        throw ConversionError::invalidInputType(path);
    }

    uint64_t limit = limits_.limitFor(format->category());
    if (limit > 0 && file->file_size > limit)
    {
        Logger::warn("Rejected input (" + FileUtils::formatBytes(file->file_size) + " exceeds the " +
                     categoryName(format->category()) + " limit of " + FileUtils::formatBytes(limit) + "): " + path);
        throw ConversionError::invalidInputType(path);
    }

    return ConversionMetadata{file->file_name, *format, file->file_size, file->creation_time,
                              file->modification_time};
}

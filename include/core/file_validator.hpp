#pragma once

#include "core/conversion_settings.hpp"
#include "core/processing_result.hpp"
#include <cstdint>
#include <string>

struct SizeLimits
{
    uint64_t image = 100ULL * 1024 * 1024;
    uint64_t audio = 500ULL * 1024 * 1024;
    uint64_t video = 1000ULL * 1024 * 1024;
    uint64_t document = 200ULL * 1024 * 1024;

    uint64_t limitFor(MediaCategory category) const;

    static SizeLimits fromSettings(const ConversionSettings &settings);
};

/**
 * @brief Pre-flight checks on an input path before any resource is touched
 */
class FileValidator
{
public:
    explicit FileValidator(SizeLimits limits = SizeLimits());

    /**
     * @brief The path must be an existing, readable, non-empty regular file with a
     * known extension and within its category's size limit.
     * @return Immutable metadata snapshot of the source
     * @throws ConversionError (InvalidInputType)
     */
    ConversionMetadata validate(const std::string &path) const;

    const SizeLimits &limits() const { return limits_; }

private:
    SizeLimits limits_;
};

#pragma once

#include "core/format_descriptor.hpp"
#include <cstdint>
#include <ctime>
#include <optional>
#include <utility>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Source file attributes, read once when a task starts and never modified
 */
struct ConversionMetadata
{
    std::string original_filename;
    FormatDescriptor original_format;
    uint64_t file_size = 0;
    std::time_t creation_time = 0;
    std::time_t modification_time = 0;

    nlohmann::json toJson() const
    {
        return nlohmann::json{
            {"original_filename", original_filename},
            {"original_format", original_format.identifier()},
            {"file_size", file_size},
            {"creation_time", static_cast<int64_t>(creation_time)},
            {"modification_time", static_cast<int64_t>(modification_time)}};
    }
};

/**
 * @brief Outcome of a successful conversion.
 *
 * output_path lives in the cache directory; the caller copies it out.
 * For multi-page document rasterization it names a directory.
 */
struct ProcessingResult
{
    std::string output_path;
    std::string original_filename;
    std::string suggested_filename;
    FormatDescriptor output_format;
    std::optional<nlohmann::json> metadata;

    ProcessingResult(std::string output, std::string original, std::string suggested, FormatDescriptor format)
        : output_path(std::move(output)), original_filename(std::move(original)),
          suggested_filename(std::move(suggested)), output_format(std::move(format)) {}
};

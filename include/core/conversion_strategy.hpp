#pragma once

#include "core/format_descriptor.hpp"
#include <string>

/**
 * @brief Algorithmic path between two format categories
 */
enum class ConversionStrategy
{
    Direct,       // same-category re-encode
    CreateVideo,  // still image to motion
    Visualize,    // audio rendered as waveform image or video
    ExtractFrame, // video or document to still image
    ExtractAudio, // video to its audio track
    Combine       // image wrapped as a document page
};

std::string strategyName(ConversionStrategy strategy);

/**
 * @brief Pure mapping from (input category, output category) to a strategy.
 *
 * @throws ConversionError (IncompatibleFormats) for every pair without a table entry
 */
ConversionStrategy resolveStrategy(const FormatDescriptor &from, const FormatDescriptor &to);

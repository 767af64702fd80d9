#pragma once

#include "core/converters/audio_converter.hpp"
#include "core/converters/document_converter.hpp"
#include "core/converters/image_converter.hpp"
#include "core/converters/video_converter.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

using Converter = std::variant<ImageConverter, AudioConverter, VideoConverter, DocumentConverter>;

// Variant dispatch helpers
ProcessingResult runConverter(const Converter &converter, const ConversionRequest &request);
std::string converterName(const Converter &converter);

/**
 * @brief Image and video conversions may be retried once at reduced quality
 */
bool supportsQualityFallback(const Converter &converter);

/**
 * @brief Picks the converter variant for a format pair and caches one instance per variant
 */
class ConverterFactory
{
public:
    explicit ConverterFactory(ConverterContext context);

    /**
     * @throws ConversionError (UnsupportedConversion) when no variant accepts the pair
     */
    std::shared_ptr<const Converter> select(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @brief Logical OR of every variant's canConvert
     */
    static bool canConvert(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @brief Index into Converter of the variant that handles the pair, if any
     */
    static std::optional<size_t> variantIndexFor(const FormatDescriptor &from, const FormatDescriptor &to);

    const ConverterContext &context() const { return context_; }

private:
    Converter create(size_t index) const;

    ConverterContext context_;
    std::mutex mutex_;
    std::map<size_t, std::shared_ptr<const Converter>> instances_;
};

#pragma once

#include "core/conversion_strategy.hpp"
#include "core/converters/conversion_request.hpp"

class ProgressReporter;

/**
 * @brief Still image re-encoding and image-to-video rendering
 */
class ImageConverter
{
public:
    explicit ImageConverter(ConverterContext context);

    static const char *name() { return "image"; }

    static bool canConvert(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @throws ConversionError (IncompatibleFormats or UnsupportedConversion)
     */
    ConversionStrategy validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const;

    ProcessingResult convert(const ConversionRequest &request) const;

private:
    ProcessingResult convertDirect(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult createVideo(const ConversionRequest &request, ProgressReporter &progress) const;

    ConverterContext context_;
};

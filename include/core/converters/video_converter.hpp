#pragma once

#include "core/conversion_strategy.hpp"
#include "core/converters/conversion_request.hpp"

class ProgressReporter;

/**
 * @brief Video re-encoding, frame and GIF extraction, audio track extraction
 */
class VideoConverter
{
public:
    explicit VideoConverter(ConverterContext context);

    static const char *name() { return "video"; }

    static bool canConvert(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @throws ConversionError (IncompatibleFormats or UnsupportedConversion)
     */
    ConversionStrategy validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const;

    ProcessingResult convert(const ConversionRequest &request) const;

    /**
     * @brief Re-encode options for the Direct strategy, including the reduced-quality variant
     */
    static EncodeOptions directEncodeOptions(const ConversionSettings &settings, bool reduced_quality);

private:
    ProcessingResult convertDirect(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult extractFrame(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult extractAnimation(const ConversionRequest &request, ProgressReporter &progress,
                                      double start_seconds) const;
    ProcessingResult extractAudio(const ConversionRequest &request, ProgressReporter &progress) const;

    ConverterContext context_;
};

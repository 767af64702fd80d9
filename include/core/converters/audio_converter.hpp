#pragma once

#include "core/conversion_strategy.hpp"
#include "core/converters/conversion_request.hpp"
#include <vector>

class ProgressReporter;

/**
 * @brief Audio re-encoding and waveform visualisation (image or video)
 */
class AudioConverter
{
public:
    static constexpr double kVisualizationFps = 30.0;
    static constexpr int kMaxVisualizationFrames = 1800;
    static constexpr double kEnvelopePointsPerSecond = 200.0;
    static constexpr size_t kMaxEnvelopePoints = 1000000;
    static constexpr double kWindowSeconds = 2.0;

    explicit AudioConverter(ConverterContext context);

    static const char *name() { return "audio"; }

    static bool canConvert(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @throws ConversionError (IncompatibleFormats or UnsupportedConversion)
     */
    ConversionStrategy validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const;

    ProcessingResult convert(const ConversionRequest &request) const;

    /**
     * @brief min(duration * 30, 1800), at least one frame
     */
    static int visualizationFrameCount(double duration_seconds);

    /**
     * @brief One envelope window per frame, centred on the frame's time and zero-padded at the clip edges
     */
    static std::vector<std::vector<float>> buildWaveformWindows(const std::vector<float> &envelope,
                                                                double duration_seconds, int frame_count,
                                                                size_t window_points);

private:
    ProcessingResult convertDirect(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult visualizeAsVideo(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult visualizeAsImage(const ConversionRequest &request, ProgressReporter &progress) const;

    ConverterContext context_;
};

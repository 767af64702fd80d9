#include "core/converters/audio_converter.hpp"
#include "core/converters/converter_support.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

AudioConverter::AudioConverter(ConverterContext context) : context_(std::move(context)) {}

bool AudioConverter::canConvert(const FormatDescriptor &from, const FormatDescriptor &to)
{
    if (from.category() != MediaCategory::Audio)
    {
        return false;
    }
    return to.category() == MediaCategory::Audio || to.category() == MediaCategory::Video ||
           ConverterSupport::isWritableImage(to);
}

ConversionStrategy AudioConverter::validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const
{
    ConversionStrategy strategy = resolveStrategy(from, to);
    if (!canConvert(from, to))
    {
        throw ConversionError::unsupportedConversion(from.toString(), to.toString());
    }
    return strategy;
}

ProcessingResult AudioConverter::convert(const ConversionRequest &request) const
{
    ConversionStrategy strategy = validateConversion(request.metadata.original_format, request.target);
    ConverterSupport::throwIfCancelled(*request.token);

    ProgressReporter progress(request.progress);
    switch (strategy)
    {
    case ConversionStrategy::Direct:
        return convertDirect(request, progress);
    case ConversionStrategy::Visualize:
        if (request.target.category() == MediaCategory::Video)
        {
            return visualizeAsVideo(request, progress);
        }
        return visualizeAsImage(request, progress);
    default:
        throw ConversionError::unsupportedConversion(request.metadata.original_format.toString(),
                                                     request.target.toString());
    }
}

int AudioConverter::visualizationFrameCount(double duration_seconds)
{
    if (duration_seconds <= 0.0)
    {
        return 1;
    }
    // The epsilon keeps exact products such as 10 s * 30 from rounding down
    double frames = std::floor(duration_seconds * kVisualizationFps + 1e-6);
    return std::clamp(static_cast<int>(std::min(frames, static_cast<double>(kMaxVisualizationFrames))), 1,
                      kMaxVisualizationFrames);
}

std::vector<std::vector<float>> AudioConverter::buildWaveformWindows(const std::vector<float> &envelope,
                                                                     double duration_seconds, int frame_count,
                                                                     size_t window_points)
{
    std::vector<std::vector<float>> windows;
    if (frame_count <= 0 || window_points == 0)
    {
        return windows;
    }
    windows.reserve(static_cast<size_t>(frame_count));

    const double points = static_cast<double>(envelope.size());
    const long long half = static_cast<long long>(window_points / 2);
    for (int frame = 0; frame < frame_count; ++frame)
    {
        double time = duration_seconds > 0.0 ? (frame + 0.5) * duration_seconds / frame_count : 0.0;
        long long center = duration_seconds > 0.0 ? static_cast<long long>(time / duration_seconds * points) : 0;

        std::vector<float> window(window_points, 0.0f);
        for (size_t i = 0; i < window_points; ++i)
        {
            long long index = center - half + static_cast<long long>(i);
            if (index >= 0 && index < static_cast<long long>(envelope.size()))
            {
                window[i] = envelope[static_cast<size_t>(index)];
            }
        }
        windows.push_back(std::move(window));
    }
    return windows;
}

ProcessingResult AudioConverter::convertDirect(const ConversionRequest &request, ProgressReporter &progress) const
{
    const auto &settings = context_.settings;
    EncodeOptions options;
    options.audio_only = true;
    options.preserve_metadata = settings.preserve_metadata;
    options.volume = settings.audio_volume;
    options.tempo = settings.audio_tempo;
    if (settings.audio_bitrate_kbps > 0)
    {
        options.audio_bitrate_kbps = settings.audio_bitrate_kbps;
    }

    std::string output = request.artifacts->allocate(request.target.extension());
    auto result = context_.backend->reencode(request.input_path, output, request.target, options,
                                             progress.band(0.0, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ConversionFailed, "audio re-encode",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Direct,
                                        {{"volume", options.volume}, {"tempo", options.tempo}});
}

ProcessingResult AudioConverter::visualizeAsVideo(const ConversionRequest &request, ProgressReporter &progress) const
{
    const auto &settings = context_.settings;
    const CancellationToken &token = *request.token;

    auto info = context_.backend->probe(request.input_path);
    ConverterSupport::requireSuccess(info, ConversionError::Kind::InvalidInput, "read audio", token);
    if (info.duration_seconds <= 0.0)
    {
        throw ConversionError::invalidInput("audio has no measurable duration: " + request.input_path);
    }
    const double duration = info.duration_seconds;
    const int frame_count = visualizationFrameCount(duration);

    size_t points = static_cast<size_t>(std::lround(duration * kEnvelopePointsPerSecond));
    points = std::clamp(points, static_cast<size_t>(frame_count), kMaxEnvelopePoints);
    auto envelope = context_.backend->sampleAudio(request.input_path, TimeRange{}, points, token);
    ConverterSupport::requireSuccess(envelope, ConversionError::Kind::ConversionFailed, "sample audio", token);
    progress.report(0.2);

    size_t window_points = std::max<size_t>(
        1, static_cast<size_t>(std::lround(kWindowSeconds * envelope.samples.size() / duration)));
    FrameSequence frames;
    frames.waveform_frames = buildWaveformWindows(envelope.samples, duration, frame_count, window_points);
    frames.frame_count = frame_count;
    // Capped clips spread the frames over the whole duration
    frames.frame_rate = frame_count / duration;
    frames.width = settings.video_width;
    frames.height = settings.video_height;
    frames.audio_source = request.input_path;
    if (settings.video_bitrate_kbps > 0)
    {
        frames.video_bitrate_kbps = settings.video_bitrate_kbps;
    }
    ConverterSupport::throwIfCancelled(token);
    progress.report(0.3);

    std::string output = request.artifacts->allocate(request.target.extension());
    Logger::info("Visualizing " + request.input_path + " as " + std::to_string(frame_count) + " frames");
    auto result = context_.backend->renderFrames(frames, duration, output, progress.band(0.3, 1.0), token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "render visualization", token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Visualize,
                                        {{"frame_count", frame_count},
                                         {"duration", duration},
                                         {"audiovisual", request.target.conformsTo(MediaCategory::Audiovisual)}});
}

ProcessingResult AudioConverter::visualizeAsImage(const ConversionRequest &request, ProgressReporter &progress) const
{
    const auto &settings = context_.settings;
    const CancellationToken &token = *request.token;

    auto envelope = context_.backend->sampleAudio(request.input_path, TimeRange{},
                                                  static_cast<size_t>(std::max(1, settings.video_width)), token);
    ConverterSupport::requireSuccess(envelope, ConversionError::Kind::ConversionFailed, "sample audio", token);
    progress.report(0.5);
    ConverterSupport::throwIfCancelled(token);

    std::string output = request.artifacts->allocate(request.target.extension());
    auto result = context_.backend->renderWaveformImage(
        envelope.samples, settings.video_width, settings.video_height, output,
        ConverterSupport::effectiveImageQuality(settings, request.reduced_quality));
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "render waveform", token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Visualize,
                                        {{"width", settings.video_width}, {"height", settings.video_height}});
}

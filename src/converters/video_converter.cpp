#include "core/converters/video_converter.hpp"
#include "core/converters/converter_support.hpp"
#include "logging/logger.hpp"
#include <algorithm>

VideoConverter::VideoConverter(ConverterContext context) : context_(std::move(context)) {}

bool VideoConverter::canConvert(const FormatDescriptor &from, const FormatDescriptor &to)
{
    if (from.category() != MediaCategory::Video)
    {
        return false;
    }
    return to.category() == MediaCategory::Video || to.category() == MediaCategory::Audio ||
           ConverterSupport::isWritableImage(to);
}

ConversionStrategy VideoConverter::validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const
{
    ConversionStrategy strategy = resolveStrategy(from, to);
    if (!canConvert(from, to))
    {
        throw ConversionError::unsupportedConversion(from.toString(), to.toString());
    }
    return strategy;
}

ProcessingResult VideoConverter::convert(const ConversionRequest &request) const
{
    ConversionStrategy strategy = validateConversion(request.metadata.original_format, request.target);
    ConverterSupport::throwIfCancelled(*request.token);

    ProgressReporter progress(request.progress);
    switch (strategy)
    {
    case ConversionStrategy::Direct:
        return convertDirect(request, progress);
    case ConversionStrategy::ExtractFrame:
        return extractFrame(request, progress);
    case ConversionStrategy::ExtractAudio:
        return extractAudio(request, progress);
    default:
        throw ConversionError::unsupportedConversion(request.metadata.original_format.toString(),
                                                     request.target.toString());
    }
}

EncodeOptions VideoConverter::directEncodeOptions(const ConversionSettings &settings, bool reduced_quality)
{
    EncodeOptions options;
    options.preserve_metadata = settings.preserve_metadata;
    options.reduced_quality = reduced_quality;
    if (settings.video_bitrate_kbps > 0)
    {
        options.video_bitrate_kbps = reduced_quality ? std::max(1, settings.video_bitrate_kbps / 2)
                                                     : settings.video_bitrate_kbps;
    }
    if (settings.audio_bitrate_kbps > 0)
    {
        options.audio_bitrate_kbps = settings.audio_bitrate_kbps;
    }
    if (settings.frame_rate > 0)
    {
        options.frame_rate = settings.frame_rate;
    }
    if (settings.resize_image)
    {
        options.target_width = settings.target_width;
        options.target_height = settings.target_height;
    }
    options.maintain_aspect_ratio = settings.maintain_aspect_ratio;
    if (reduced_quality)
    {
        options.preset = "veryfast";
    }
    return options;
}

ProcessingResult VideoConverter::convertDirect(const ConversionRequest &request, ProgressReporter &progress) const
{
    EncodeOptions options = directEncodeOptions(context_.settings, request.reduced_quality);
    std::string output = request.artifacts->allocate(request.target.extension());

    auto result = context_.backend->reencode(request.input_path, output, request.target, options,
                                             progress.band(0.0, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ConversionFailed, "video re-encode",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    nlohmann::json details = {{"preset", options.preset.empty() ? "default" : options.preset}};
    if (options.video_bitrate_kbps)
    {
        details["video_bitrate_kbps"] = *options.video_bitrate_kbps;
    }
    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Direct, details);
}

ProcessingResult VideoConverter::extractFrame(const ConversionRequest &request, ProgressReporter &progress) const
{
    auto info = context_.backend->probe(request.input_path);
    ConverterSupport::requireSuccess(info, ConversionError::Kind::InvalidInput, "read video", *request.token);

    const double frame_time = info.duration_seconds > 0.0 ? info.duration_seconds / 3.0 : 0.0;
    progress.report(0.1);

    if (request.target.identifier() == "gif")
    {
        return extractAnimation(request, progress, frame_time);
    }

    std::string output = request.artifacts->allocate(request.target.extension());
    auto result = context_.backend->extractFrame(
        request.input_path, frame_time, output,
        ConverterSupport::effectiveImageQuality(context_.settings, request.reduced_quality), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "extract frame", *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::ExtractFrame,
                                        {{"frame_time", frame_time}, {"duration", info.duration_seconds}});
}

ProcessingResult VideoConverter::extractAnimation(const ConversionRequest &request, ProgressReporter &progress,
                                                  double start_seconds) const
{
    const auto &settings = context_.settings;
    EncodeOptions options;
    options.start_seconds = start_seconds;
    options.animation_frame_count = std::max(1, settings.animation_frame_count);
    options.animation_frame_duration = settings.animation_frame_duration > 0.0 ? settings.animation_frame_duration : 0.1;
    options.reduced_quality = request.reduced_quality;
    if (settings.resize_image)
    {
        options.target_width = settings.target_width;
    }

    std::string output = request.artifacts->allocate(request.target.extension());
    Logger::debug("Extracting " + std::to_string(options.animation_frame_count) + "-frame animation from " +
                  request.input_path);
    auto result = context_.backend->reencode(request.input_path, output, request.target, options,
                                             progress.band(0.1, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "extract animation",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::ExtractFrame,
                                        {{"frame_time", start_seconds},
                                         {"frame_count", options.animation_frame_count},
                                         {"frame_duration", options.animation_frame_duration}});
}

ProcessingResult VideoConverter::extractAudio(const ConversionRequest &request, ProgressReporter &progress) const
{
    const auto &settings = context_.settings;
    EncodeOptions options;
    options.audio_only = true;
    options.preserve_metadata = settings.preserve_metadata;
    options.reduced_quality = request.reduced_quality;
    if (settings.audio_bitrate_kbps > 0)
    {
        options.audio_bitrate_kbps = settings.audio_bitrate_kbps;
    }

    std::string output = request.artifacts->allocate(request.target.extension());
    auto result = context_.backend->reencode(request.input_path, output, request.target, options,
                                             progress.band(0.0, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ConversionFailed, "extract audio",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::ExtractAudio);
}

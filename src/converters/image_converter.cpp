#include "core/converters/image_converter.hpp"
#include "core/converters/converter_support.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

ImageConverter::ImageConverter(ConverterContext context) : context_(std::move(context)) {}

bool ImageConverter::canConvert(const FormatDescriptor &from, const FormatDescriptor &to)
{
    if (from.category() != MediaCategory::Image)
    {
        return false;
    }
    return ConverterSupport::isWritableImage(to) || to.category() == MediaCategory::Video;
}

ConversionStrategy ImageConverter::validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const
{
    ConversionStrategy strategy = resolveStrategy(from, to);
    if (!canConvert(from, to))
    {
        throw ConversionError::unsupportedConversion(from.toString(), to.toString());
    }
    return strategy;
}

ProcessingResult ImageConverter::convert(const ConversionRequest &request) const
{
    ConversionStrategy strategy = validateConversion(request.metadata.original_format, request.target);
    ConverterSupport::throwIfCancelled(*request.token);

    ProgressReporter progress(request.progress);
    switch (strategy)
    {
    case ConversionStrategy::Direct:
        return convertDirect(request, progress);
    case ConversionStrategy::CreateVideo:
        return createVideo(request, progress);
    default:
        throw ConversionError::unsupportedConversion(request.metadata.original_format.toString(),
                                                     request.target.toString());
    }
}

ProcessingResult ImageConverter::convertDirect(const ConversionRequest &request, ProgressReporter &progress) const
{
    std::string output = request.artifacts->allocate(request.target.extension());
    EncodeOptions options = ConverterSupport::imageEncodeOptions(context_.settings, request.reduced_quality);

    Logger::debug("Re-encoding image " + request.input_path + " at quality " + std::to_string(options.quality));
    auto result = context_.backend->reencode(request.input_path, output, request.target, options,
                                             progress.band(0.0, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ConversionFailed, "image re-encode",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Direct, {{"quality", options.quality}});
}

ProcessingResult ImageConverter::createVideo(const ConversionRequest &request, ProgressReporter &progress) const
{
    const auto &settings = context_.settings;
    auto info = context_.backend->probe(request.input_path);
    ConverterSupport::requireSuccess(info, ConversionError::Kind::InvalidInput, "read image", *request.token);

    const double duration = settings.video_duration_seconds > 0.0 ? settings.video_duration_seconds : 3.0;
    FrameSequence frames;
    frames.still_images = {request.input_path};
    frames.frame_rate = settings.frame_rate;
    frames.frame_count = std::max(1, static_cast<int>(std::lround(settings.frame_rate * duration)));
    frames.width = info.width > 0 ? info.width : settings.video_width;
    frames.height = info.height > 0 ? info.height : settings.video_height;
    if (settings.video_bitrate_kbps > 0)
    {
        frames.video_bitrate_kbps =
            request.reduced_quality ? std::max(1, settings.video_bitrate_kbps / 2) : settings.video_bitrate_kbps;
    }

    std::string output = request.artifacts->allocate(request.target.extension());
    Logger::info("Rendering " + std::to_string(frames.frame_count) + " frames from " + request.input_path);
    auto result = context_.backend->renderFrames(frames, duration, output, progress.band(0.0, 1.0), *request.token);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "render video", *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::CreateVideo,
                                        {{"frame_count", frames.frame_count},
                                         {"frame_rate", frames.frame_rate},
                                         {"duration", duration}});
}

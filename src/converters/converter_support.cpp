#include "core/converters/converter_support.hpp"
#include "core/file_utils.hpp"
#include <algorithm>
#include <stdexcept>

ProgressReporter::ProgressReporter(ProgressCallback sink) : sink_(std::move(sink)) {}

void ProgressReporter::report(double value)
{
    double clamped = std::clamp(value, 0.0, 1.0);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reported_ && clamped <= last_)
        {
            return;
        }
        last_ = clamped;
        reported_ = true;
    }
    if (sink_)
    {
        sink_(clamped);
    }
}

ProgressCallback ProgressReporter::band(double begin, double end)
{
    return [this, begin, end](double value)
    {
        report(begin + (end - begin) * std::clamp(value, 0.0, 1.0));
    };
}

double ProgressReporter::last() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return last_;
}

bool ConverterSupport::isWritableImage(const FormatDescriptor &format)
{
    return format.category() == MediaCategory::Image && format.identifier() != "heic";
}

bool ConverterSupport::isWritableDocument(const FormatDescriptor &format)
{
    return format.category() == MediaCategory::Document && format.identifier() == "pdf";
}

void ConverterSupport::throwIfCancelled(const CancellationToken &token)
{
    if (token.isCancelled())
    {
        throw ConversionError::cancelled();
    }
}

void ConverterSupport::requireSuccess(const BackendResult &result, ConversionError::Kind kind,
                                      const std::string &step, const CancellationToken &token)
{
    if (result.success)
    {
        return;
    }
    throwIfCancelled(token);

    std::string reason = step + ": " + (result.reason.empty() ? "unknown backend error" : result.reason);
    switch (kind)
    {
    case ConversionError::Kind::InvalidInput:
        throw ConversionError::invalidInput(reason);
    case ConversionError::Kind::ConversionFailed:
        throw ConversionError::conversionFailed(reason);
    case ConversionError::Kind::ExportFailed:
        throw ConversionError::exportFailed(reason);
    case ConversionError::Kind::Cancelled:
        throw ConversionError::cancelled();
    // Raised by validation, admission and the coordinator, never by a backend step
    case ConversionError::Kind::InvalidInputType:
    case ConversionError::Kind::IncompatibleFormats:
    case ConversionError::Kind::InsufficientMemory:
    case ConversionError::Kind::Timeout:
    case ConversionError::Kind::FileAccessDenied:
    case ConversionError::Kind::SandboxViolation:
    case ConversionError::Kind::UnsupportedConversion:
        break;
    }
    throw std::logic_error(step + ": " + ConversionError::kindName(kind) + " is not a backend failure kind");
}

void ConverterSupport::requireOutput(const std::string &path)
{
    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        throw ConversionError::exportFailed("backend produced no output at " + path);
    }
}

std::string ConverterSupport::suggestedFilename(const ConversionMetadata &metadata, const FormatDescriptor &target)
{
    std::string stem = fs::path(metadata.original_filename).stem().string();
    if (stem.empty())
    {
        stem = "converted";
    }
    return stem + "." + target.extension();
}

std::string ConverterSupport::suggestedDirectoryName(const ConversionMetadata &metadata)
{
    std::string stem = fs::path(metadata.original_filename).stem().string();
    return (stem.empty() ? "converted" : stem) + "_pages";
}

double ConverterSupport::effectiveImageQuality(const ConversionSettings &settings, bool reduced_quality)
{
    double quality = std::clamp(settings.image_quality, 0.0, 1.0);
    return reduced_quality ? std::min(quality, 0.7) : quality;
}

EncodeOptions ConverterSupport::imageEncodeOptions(const ConversionSettings &settings, bool reduced_quality)
{
    EncodeOptions options;
    options.quality = effectiveImageQuality(settings, reduced_quality);
    options.preserve_metadata = settings.preserve_metadata;
    options.reduced_quality = reduced_quality;
    if (settings.resize_image)
    {
        options.target_width = settings.target_width;
        options.target_height = settings.target_height;
    }
    options.maintain_aspect_ratio = settings.maintain_aspect_ratio;
    options.enhance = settings.enhance_image;
    options.adjust_colors = settings.adjust_colors;
    options.saturation = settings.saturation;
    options.brightness = settings.brightness;
    options.contrast = settings.contrast;
    return options;
}

ProcessingResult ConverterSupport::makeResult(const ConversionRequest &request, const std::string &output_path,
                                              const std::string &suggested_filename, ConversionStrategy strategy,
                                              const nlohmann::json &details)
{
    ProcessingResult result(output_path, request.metadata.original_filename, suggested_filename, request.target);

    nlohmann::json metadata = request.metadata.toJson();
    metadata["strategy"] = strategyName(strategy);
    metadata["output_format"] = request.target.identifier();
    metadata["reduced_quality"] = request.reduced_quality;
    for (auto it = details.begin(); it != details.end(); ++it)
    {
        metadata[it.key()] = it.value();
    }
    result.metadata = metadata;
    return result;
}

#include "core/conversion_strategy.hpp"
#include "core/conversion_error.hpp"

std::string strategyName(ConversionStrategy strategy)
{
    switch (strategy)
    {
    case ConversionStrategy::Direct:
        return "direct";
    case ConversionStrategy::CreateVideo:
        return "createVideo";
    case ConversionStrategy::Visualize:
        return "visualize";
    case ConversionStrategy::ExtractFrame:
        return "extractFrame";
    case ConversionStrategy::ExtractAudio:
        return "extractAudio";
    case ConversionStrategy::Combine:
        return "combine";
    }
    return "unknown";
}

ConversionStrategy resolveStrategy(const FormatDescriptor &from, const FormatDescriptor &to)
{
    const MediaCategory in = from.category();
    const MediaCategory out = to.category();

    switch (in)
    {
    case MediaCategory::Image:
        switch (out)
        {
        case MediaCategory::Image:
            return ConversionStrategy::Direct;
        case MediaCategory::Video:
            return ConversionStrategy::CreateVideo;
        case MediaCategory::Document:
            return ConversionStrategy::Combine;
        case MediaCategory::Audio:
        case MediaCategory::Audiovisual:
            break;
        }
        break;

    case MediaCategory::Audio:
        switch (out)
        {
        case MediaCategory::Audio:
            return ConversionStrategy::Direct;
        case MediaCategory::Image:
        case MediaCategory::Video:
            return ConversionStrategy::Visualize;
        case MediaCategory::Document:
        case MediaCategory::Audiovisual:
            break;
        }
        break;

    case MediaCategory::Video:
        switch (out)
        {
        case MediaCategory::Video:
            return ConversionStrategy::Direct;
        case MediaCategory::Image:
            return ConversionStrategy::ExtractFrame;
        case MediaCategory::Audio:
            return ConversionStrategy::ExtractAudio;
        case MediaCategory::Document:
        case MediaCategory::Audiovisual:
            break;
        }
        break;

    case MediaCategory::Document:
        switch (out)
        {
        case MediaCategory::Image:
            return ConversionStrategy::ExtractFrame;
        case MediaCategory::Audio:
        case MediaCategory::Video:
        case MediaCategory::Document:
        case MediaCategory::Audiovisual:
            break;
        }
        break;

    case MediaCategory::Audiovisual:
        break;
    }

    throw ConversionError::incompatibleFormats(from.toString(), to.toString());
}

#include "core/converters/converter_factory.hpp"
#include "core/conversion_error.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

ProcessingResult runConverter(const Converter &converter, const ConversionRequest &request)
{
    return std::visit([&request](const auto &variant)
                      { return variant.convert(request); },
                      converter);
}

std::string converterName(const Converter &converter)
{
    return std::visit([](const auto &variant)
                      { return std::string(variant.name()); },
                      converter);
}

bool supportsQualityFallback(const Converter &converter)
{
    return std::holds_alternative<ImageConverter>(converter) || std::holds_alternative<VideoConverter>(converter);
}

ConverterFactory::ConverterFactory(ConverterContext context) : context_(std::move(context)) {}

std::optional<size_t> ConverterFactory::variantIndexFor(const FormatDescriptor &from, const FormatDescriptor &to)
{
    // Order matters only for image sources: image->pdf belongs to the document converter
    if (ImageConverter::canConvert(from, to))
    {
        return 0;
    }
    if (AudioConverter::canConvert(from, to))
    {
        return 1;
    }
    if (VideoConverter::canConvert(from, to))
    {
        return 2;
    }
    if (DocumentConverter::canConvert(from, to))
    {
        return 3;
    }
    return std::nullopt;
}

bool ConverterFactory::canConvert(const FormatDescriptor &from, const FormatDescriptor &to)
{
    return ImageConverter::canConvert(from, to) || AudioConverter::canConvert(from, to) ||
           VideoConverter::canConvert(from, to) || DocumentConverter::canConvert(from, to);
}

std::shared_ptr<const Converter> ConverterFactory::select(const FormatDescriptor &from, const FormatDescriptor &to)
{
    auto index = variantIndexFor(from, to);
    if (!index)
    {
        throw ConversionError::unsupportedConversion(from.toString(), to.toString());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(*index);
    if (it != instances_.end())
    {
        return it->second;
    }

    auto converter = std::make_shared<const Converter>(create(*index));
    instances_.emplace(*index, converter);
    Logger::debug("Created " + converterName(*converter) + " converter");
    return converter;
}

Converter ConverterFactory::create(size_t index) const
{
    switch (index)
    {
    case 0:
        return Converter(std::in_place_type<ImageConverter>, context_);
    case 1:
        return Converter(std::in_place_type<AudioConverter>, context_);
    case 2:
        return Converter(std::in_place_type<VideoConverter>, context_);
    case 3:
        return Converter(std::in_place_type<DocumentConverter>, context_);
    }
    throw std::out_of_range("converter index " + std::to_string(index));
}

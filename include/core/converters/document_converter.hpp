#pragma once

#include "core/conversion_strategy.hpp"
#include "core/converters/conversion_request.hpp"

class ProgressReporter;

/**
 * @brief PDF page rasterisation and single-image PDF composition.
 *
 * A one-page document becomes one image file. Longer documents become a
 * directory of page_001.<ext>, page_002.<ext>, ... in page order.
 */
class DocumentConverter
{
public:
    explicit DocumentConverter(ConverterContext context);

    static const char *name() { return "document"; }

    static bool canConvert(const FormatDescriptor &from, const FormatDescriptor &to);

    /**
     * @throws ConversionError (IncompatibleFormats or UnsupportedConversion)
     */
    ConversionStrategy validateConversion(const FormatDescriptor &from, const FormatDescriptor &to) const;

    ProcessingResult convert(const ConversionRequest &request) const;

    static std::string pageFileName(int page_number, const FormatDescriptor &format);

private:
    ProcessingResult extractPages(const ConversionRequest &request, ProgressReporter &progress) const;
    ProcessingResult combine(const ConversionRequest &request, ProgressReporter &progress) const;

    ConverterContext context_;
};

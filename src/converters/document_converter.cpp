#include "core/converters/document_converter.hpp"
#include "core/converters/converter_support.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <cstdio>

DocumentConverter::DocumentConverter(ConverterContext context) : context_(std::move(context)) {}

bool DocumentConverter::canConvert(const FormatDescriptor &from, const FormatDescriptor &to)
{
    if (from.category() == MediaCategory::Document)
    {
        return ConverterSupport::isWritableImage(to);
    }
    if (from.category() == MediaCategory::Image)
    {
        return ConverterSupport::isWritableDocument(to);
    }
    return false;
}

ConversionStrategy DocumentConverter::validateConversion(const FormatDescriptor &from,
                                                         const FormatDescriptor &to) const
{
    ConversionStrategy strategy = resolveStrategy(from, to);
    if (!canConvert(from, to))
    {
        throw ConversionError::unsupportedConversion(from.toString(), to.toString());
    }
    return strategy;
}

ProcessingResult DocumentConverter::convert(const ConversionRequest &request) const
{
    ConversionStrategy strategy = validateConversion(request.metadata.original_format, request.target);
    ConverterSupport::throwIfCancelled(*request.token);

    ProgressReporter progress(request.progress);
    switch (strategy)
    {
    case ConversionStrategy::ExtractFrame:
        return extractPages(request, progress);
    case ConversionStrategy::Combine:
        return combine(request, progress);
    default:
        throw ConversionError::unsupportedConversion(request.metadata.original_format.toString(),
                                                     request.target.toString());
    }
}

std::string DocumentConverter::pageFileName(int page_number, const FormatDescriptor &format)
{
    char name[32];
    std::snprintf(name, sizeof(name), "page_%03d", page_number);
    return std::string(name) + "." + format.extension();
}

ProcessingResult DocumentConverter::extractPages(const ConversionRequest &request, ProgressReporter &progress) const
{
    const CancellationToken &token = *request.token;
    auto info = context_.backend->probe(request.input_path);
    ConverterSupport::requireSuccess(info, ConversionError::Kind::InvalidInput, "open document", token);
    if (info.page_count <= 0)
    {
        throw ConversionError::invalidInput("document has no pages: " + request.input_path);
    }

    RasterOptions options;
    options.dpi = 0; // backend default (backend.pdf_dpi)
    options.quality = ConverterSupport::effectiveImageQuality(context_.settings, request.reduced_quality);

    const int page_count = info.page_count;
    if (page_count == 1)
    {
        std::string output = request.artifacts->allocate(request.target.extension());
        auto result = context_.backend->rasterize(request.input_path, PageRange{0, 0}, {output}, options, token);
        ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "rasterize page 1", token);
        ConverterSupport::requireOutput(output);
        progress.report(1.0);

        return ConverterSupport::makeResult(request, output,
                                            ConverterSupport::suggestedFilename(request.metadata, request.target),
                                            ConversionStrategy::ExtractFrame, {{"page_count", 1}});
    }

    std::string directory = request.artifacts->allocateDirectory();
    Logger::info("Rasterizing " + std::to_string(page_count) + " pages of " + request.input_path);

    nlohmann::json pages = nlohmann::json::array();
    for (int page = 0; page < page_count; ++page)
    {
        ConverterSupport::throwIfCancelled(token);
        std::string name = pageFileName(page + 1, request.target);
        std::string output = (fs::path(directory) / name).string();

        auto result = context_.backend->rasterize(request.input_path, PageRange{page, page}, {output}, options, token);
        ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed,
                                         "rasterize page " + std::to_string(page + 1), token);
        ConverterSupport::requireOutput(output);
        pages.push_back(name);

        progress.report(static_cast<double>(page + 1) / page_count);
    }

    return ConverterSupport::makeResult(request, directory, ConverterSupport::suggestedDirectoryName(request.metadata),
                                        ConversionStrategy::ExtractFrame,
                                        {{"page_count", page_count}, {"pages", pages}});
}

ProcessingResult DocumentConverter::combine(const ConversionRequest &request, ProgressReporter &progress) const
{
    std::string output = request.artifacts->allocate(request.target.extension());
    auto result = context_.backend->composeDocument({request.input_path}, output);
    ConverterSupport::requireSuccess(result, ConversionError::Kind::ExportFailed, "compose document",
                                     *request.token);
    ConverterSupport::requireOutput(output);
    progress.report(1.0);

    return ConverterSupport::makeResult(request, output,
                                        ConverterSupport::suggestedFilename(request.metadata, request.target),
                                        ConversionStrategy::Combine, {{"page_count", 1}});
}

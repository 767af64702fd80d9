#pragma once

#include "core/conversion_error.hpp"
#include "core/conversion_strategy.hpp"
#include "core/converters/conversion_request.hpp"
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Monotonic, clamped progress for one convert() call.
 *
 * Values outside [0, 1] are clamped and values below the last reported one are
 * dropped, so sinks only ever see a non-decreasing sequence.
 */
class ProgressReporter
{
public:
    explicit ProgressReporter(ProgressCallback sink);

    void report(double value);

    /**
     * @brief Callback mapping a sub-step's [0, 1] into [begin, end] of this reporter
     */
    ProgressCallback band(double begin, double end);

    double last() const;

private:
    ProgressCallback sink_;
    mutable std::mutex mutex_;
    double last_ = 0.0;
    bool reported_ = false;
};

/**
 * @brief Helpers shared by the converter variants
 */
class ConverterSupport
{
public:
    static bool isWritableImage(const FormatDescriptor &format);
    static bool isWritableDocument(const FormatDescriptor &format);

    static void throwIfCancelled(const CancellationToken &token);

    /**
     * @brief Turn a backend failure into a typed error.
     * A failure after the token fired is reported as Cancelled.
     * @param kind InvalidInput, ConversionFailed, ExportFailed or Cancelled
     * @throws std::logic_error for any other kind
     */
    static void requireSuccess(const BackendResult &result, ConversionError::Kind kind, const std::string &step,
                               const CancellationToken &token);

    /**
     * @throws ConversionError (ExportFailed) if the backend reported success without output
     */
    static void requireOutput(const std::string &path);

    static std::string suggestedFilename(const ConversionMetadata &metadata, const FormatDescriptor &target);
    static std::string suggestedDirectoryName(const ConversionMetadata &metadata);

    static double effectiveImageQuality(const ConversionSettings &settings, bool reduced_quality);

    /**
     * @brief Image EncodeOptions from the settings snapshot
     */
    static EncodeOptions imageEncodeOptions(const ConversionSettings &settings, bool reduced_quality);

    /**
     * @brief Result with source metadata, strategy and converter-specific details merged into one JSON object
     */
    static ProcessingResult makeResult(const ConversionRequest &request, const std::string &output_path,
                                       const std::string &suggested_filename, ConversionStrategy strategy,
                                       const nlohmann::json &details = nlohmann::json::object());
};

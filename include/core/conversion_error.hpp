#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Typed failure raised anywhere in the conversion pipeline.
 *
 * Propagation policy:
 * - InvalidInput*, InsufficientMemory, IncompatibleFormats, UnsupportedConversion,
 *   FileAccessDenied, SandboxViolation and Cancelled are never retried.
 * - Timeout, ConversionFailed and ExportFailed are retried up to the attempt limit,
 *   then surfaced with the attempt count appended.
 */
class ConversionError : public std::runtime_error
{
public:
    enum class Kind
    {
        InvalidInput,
        InvalidInputType,
        IncompatibleFormats,
        InsufficientMemory,
        ConversionFailed,
        ExportFailed,
        Timeout,
        FileAccessDenied,
        SandboxViolation,
        UnsupportedConversion,
        Cancelled
    };

    ConversionError(Kind kind, const std::string &message);

    // Factories carrying the structured payload of each kind
    static ConversionError invalidInput(const std::string &reason);
    static ConversionError invalidInputType(const std::string &path);
    static ConversionError incompatibleFormats(const std::string &from, const std::string &to);
    static ConversionError insufficientMemory(uint64_t required_bytes, uint64_t available_bytes);
    static ConversionError conversionFailed(const std::string &reason);
    static ConversionError exportFailed(const std::string &reason);
    static ConversionError timeout(std::chrono::milliseconds duration);
    static ConversionError fileAccessDenied(const std::string &path);
    static ConversionError sandboxViolation(const std::string &path);
    static ConversionError unsupportedConversion(const std::string &from, const std::string &to);
    static ConversionError cancelled();

    Kind kind() const { return kind_; }
    bool isRetryable() const;

    /**
     * @brief Copy of this error annotated with the number of attempts made
     */
    ConversionError withAttempts(int attempts) const;

    int attempts() const { return attempts_; }
    uint64_t requiredBytes() const { return required_bytes_; }
    uint64_t availableBytes() const { return available_bytes_; }
    std::chrono::milliseconds timeoutDuration() const { return timeout_; }

    static std::string kindName(Kind kind);

private:
    Kind kind_;
    int attempts_ = 0;
    uint64_t required_bytes_ = 0;
    uint64_t available_bytes_ = 0;
    std::chrono::milliseconds timeout_{0};
};

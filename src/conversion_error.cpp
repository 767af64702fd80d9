#include "core/conversion_error.hpp"

namespace
{
    std::string formatMegabytes(uint64_t bytes)
    {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
}

ConversionError::ConversionError(Kind kind, const std::string &message)
    : std::runtime_error(message), kind_(kind)
{
}

ConversionError ConversionError::invalidInput(const std::string &reason)
{
    return ConversionError(Kind::InvalidInput, "Invalid input: " + reason);
}

ConversionError ConversionError::invalidInputType(const std::string &path)
{
    return ConversionError(Kind::InvalidInputType, "Unreadable, empty or unrecognized input: " + path);
}

ConversionError ConversionError::incompatibleFormats(const std::string &from, const std::string &to)
{
    return ConversionError(Kind::IncompatibleFormats, "Cannot convert " + from + " to " + to);
}

ConversionError ConversionError::insufficientMemory(uint64_t required_bytes, uint64_t available_bytes)
{
    ConversionError error(Kind::InsufficientMemory,
                          "Insufficient memory: " + formatMegabytes(required_bytes) + " required, " +
                              formatMegabytes(available_bytes) + " available");
    error.required_bytes_ = required_bytes;
    error.available_bytes_ = available_bytes;
    return error;
}

ConversionError ConversionError::conversionFailed(const std::string &reason)
{
    return ConversionError(Kind::ConversionFailed, "Conversion failed: " + reason);
}

ConversionError ConversionError::exportFailed(const std::string &reason)
{
    return ConversionError(Kind::ExportFailed, "Export failed: " + reason);
}

ConversionError ConversionError::timeout(std::chrono::milliseconds duration)
{
    ConversionError error(Kind::Timeout,
                          "Conversion timed out after " + std::to_string(duration.count()) + " ms");
    error.timeout_ = duration;
    return error;
}

ConversionError ConversionError::fileAccessDenied(const std::string &path)
{
    return ConversionError(Kind::FileAccessDenied, "Access denied: " + path);
}

ConversionError ConversionError::sandboxViolation(const std::string &path)
{
    return ConversionError(Kind::SandboxViolation, "Write outside of the cache directory refused: " + path);
}

ConversionError ConversionError::unsupportedConversion(const std::string &from, const std::string &to)
{
    return ConversionError(Kind::UnsupportedConversion, "No converter available for " + from + " to " + to);
}

ConversionError ConversionError::cancelled()
{
    return ConversionError(Kind::Cancelled, "Conversion cancelled");
}

bool ConversionError::isRetryable() const
{
    switch (kind_)
    {
    case Kind::Timeout:
    case Kind::ConversionFailed:
    case Kind::ExportFailed:
        return true;
    case Kind::InvalidInput:
    case Kind::InvalidInputType:
    case Kind::IncompatibleFormats:
    case Kind::InsufficientMemory:
    case Kind::FileAccessDenied:
    case Kind::SandboxViolation:
    case Kind::UnsupportedConversion:
    case Kind::Cancelled:
        return false;
    }
    return false;
}

ConversionError ConversionError::withAttempts(int attempts) const
{
    ConversionError annotated(kind_, std::string(what()) + " (after " + std::to_string(attempts) +
                                         (attempts == 1 ? " attempt)" : " attempts)"));
    annotated.attempts_ = attempts;
    annotated.required_bytes_ = required_bytes_;
    annotated.available_bytes_ = available_bytes_;
    annotated.timeout_ = timeout_;
    return annotated;
}

std::string ConversionError::kindName(Kind kind)
{
    switch (kind)
    {
    case Kind::InvalidInput:
        return "InvalidInput";
    case Kind::InvalidInputType:
        return "InvalidInputType";
    case Kind::IncompatibleFormats:
        return "IncompatibleFormats";
    case Kind::InsufficientMemory:
        return "InsufficientMemory";
    case Kind::ConversionFailed:
        return "ConversionFailed";
    case Kind::ExportFailed:
        return "ExportFailed";
    case Kind::Timeout:
        return "Timeout";
    case Kind::FileAccessDenied:
        return "FileAccessDenied";
    case Kind::SandboxViolation:
        return "SandboxViolation";
    case Kind::UnsupportedConversion:
        return "UnsupportedConversion";
    case Kind::Cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

#pragma once

#include "core/cancellation_token.hpp"
#include "core/conversion_error.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <string>

struct RetryPolicy
{
    int max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds max_backoff{30000};
};

class ErrorRecovery
{
public:
    /**
     * @brief Blocks for the given delay unless the token is cancelled first.
     * @return false if the sleep was interrupted by cancellation
     */
    using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken &)>;

    static bool cancellableSleep(std::chrono::milliseconds delay, const CancellationToken &token)
    {
        return !token.waitFor(delay);
    }

    /**
     * @brief Delay before retry `retry_number` (1-based): min(base * 2^(n-1), cap)
     */
    static std::chrono::milliseconds backoffDelay(int retry_number, std::chrono::milliseconds base,
                                                  std::chrono::milliseconds cap)
    {
        if (retry_number < 1)
        {
            return std::chrono::milliseconds(0);
        }
        std::chrono::milliseconds delay = base;
        for (int i = 1; i < retry_number; ++i)
        {
            if (delay >= cap)
            {
                break;
            }
            delay *= 2;
        }
        return std::min(delay, cap);
    }

    /**
     * @brief Map any exception escaping a conversion attempt onto the error taxonomy
     */
    static ConversionError classify(const std::exception &e)
    {
        if (auto conversion_error = dynamic_cast<const ConversionError *>(&e))
        {
            return *conversion_error;
        }
        if (auto fs_error = dynamic_cast<const std::filesystem::filesystem_error *>(&e))
        {
            int code = fs_error->code().value();
            if (code == EACCES || code == EPERM)
            {
                return ConversionError::fileAccessDenied(fs_error->path1().string());
            }
        }
        return ConversionError::conversionFailed(e.what());
    }

    /**
     * @brief Run `func(attempt)` up to policy.max_attempts times.
     *
     * Non-retryable errors propagate on first occurrence. Retryable ones are
     * retried after backoffDelay(); the last one is rethrown annotated with the
     * attempt count.
     */
    template <typename Func>
    static auto retryWithBackoff(Func func, const RetryPolicy &policy, const std::string &operation_name,
                                 const CancellationToken &token, const Sleeper &sleeper)
        -> decltype(func(1))
    {
        const int max_attempts = std::max(1, policy.max_attempts);
        for (int attempt = 1;; ++attempt)
        {
            if (token.isCancelled())
            {
                throw ConversionError::cancelled();
            }

            ConversionError failure = ConversionError::conversionFailed("no attempt made");
            try
            {
                return func(attempt);
            }
            catch (const std::exception &e)
            {
                failure = classify(e);
            }

            if (!failure.isRetryable())
            {
                throw failure;
            }

            if (attempt >= max_attempts)
            {
                Logger::error("Operation '" + operation_name + "' failed after " + std::to_string(max_attempts) +
                              " attempts: " + failure.what());
                throw failure.withAttempts(max_attempts);
            }

            auto delay = backoffDelay(attempt, policy.backoff_base, policy.max_backoff);
            Logger::warn("Operation '" + operation_name + "' failed, retrying in " +
                         std::to_string(delay.count()) + "ms (attempt " + std::to_string(attempt) + "/" +
                         std::to_string(max_attempts) + "): " + failure.what());

            if (!sleeper(delay, token))
            {
                throw ConversionError::cancelled();
            }
        }
    }

    /**
     * @brief Race `func(attempt_token)` against a timer.
     *
     * Both sides run as futures. Whichever finishes first cancels the other:
     * the attempt cancels the timer when it returns, the timer cancels the
     * attempt token when it expires. The losing attempt is always joined before
     * this returns, so no work outlives the call. `func` must observe its token
     * for a timeout to take effect promptly.
     *
     * @throws ConversionError (Timeout) when the timer wins
     */
    template <typename Func>
    static auto callWithTimeout(Func func, std::chrono::milliseconds timeout, const std::string &operation_name,
                                const std::shared_ptr<CancellationToken> &parent)
        -> decltype(func(std::shared_ptr<CancellationToken>()))
    {
        auto attempt_token = CancellationToken::childOf(parent);
        auto timer_token = CancellationToken::create();

        auto attempt = std::async(std::launch::async, [func, attempt_token, timer_token]() mutable
                                  {
            struct StopTimer
            {
                std::shared_ptr<CancellationToken> timer;
                ~StopTimer() { timer->cancel(); }
            } stop_timer{timer_token};
            return func(attempt_token); });

        auto timer = std::async(std::launch::async, [timeout, attempt_token, timer_token]()
                                {
            bool expired = !timer_token->waitFor(timeout);
            if (expired)
            {
                attempt_token->cancel();
            }
            return expired; });

        if (timer.get())
        {
            Logger::error("Operation '" + operation_name + "' timed out after " +
                          std::to_string(timeout.count()) + "ms");
            attempt.wait();
            try
            {
                attempt.get();
            }
            catch (const std::exception &e)
            {
                Logger::debug("Timed out operation '" + operation_name + "' unwound with: " + e.what());
            }
            throw ConversionError::timeout(timeout);
        }

        return attempt.get();
    }

    /**
     * @brief Run the primary operation; on a retryable failure, run the fallback once.
     *
     * If the fallback also fails retryably the primary error is rethrown. A
     * non-retryable fallback error (Cancelled included) is rethrown as is.
     */
    template <typename Func, typename FallbackFunc>
    static auto callWithFallback(Func primary_func, FallbackFunc fallback_func, const std::string &operation_name)
        -> decltype(primary_func())
    {
        try
        {
            return primary_func();
        }
        catch (const ConversionError &e)
        {
            if (!e.isRetryable())
            {
                throw;
            }
            Logger::warn("Primary operation '" + operation_name + "' failed, using fallback: " + e.what());

            ConversionError fallback_error = ConversionError::conversionFailed("no fallback attempt made");
            try
            {
                return fallback_func();
            }
            catch (const std::exception &fallback_e)
            {
                fallback_error = classify(fallback_e);
            }

            if (!fallback_error.isRetryable())
            {
                Logger::warn("Fallback for '" + operation_name + "' stopped: " + fallback_error.what());
                throw fallback_error;
            }
            Logger::error("Both primary and fallback operations failed for '" + operation_name +
                          "': " + fallback_error.what());
            throw e;
        }
    }
};

#pragma once

#include "core/cache_manager.hpp"
#include "core/config_observer.hpp"
#include "core/converters/converter_factory.hpp"
#include "core/error_recovery.hpp"
#include "core/file_validator.hpp"
#include "core/progress_tracker.hpp"
#include "core/resource_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

class PocoConfigAdapter;

struct CoordinatorOptions
{
    RetryPolicy retry;
    std::chrono::milliseconds media_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds document_timeout{std::chrono::seconds(180)};
    size_t max_concurrent = 1;
    bool quality_fallback = true;

    static CoordinatorOptions fromConfig(const PocoConfigAdapter &config);
};

/**
 * @brief Per-file outcome of convertBatch()
 */
struct BatchOutcome
{
    std::string input_path;
    std::optional<ProcessingResult> result;
    std::optional<ConversionError> error;

    bool succeeded() const { return result.has_value(); }
};

/**
 * @brief Runs conversion requests end to end.
 *
 * Pipeline per request: validate, select a converter, admit through the
 * ResourcePool, then retry the conversion with backoff, each attempt racing a
 * timeout, with one reduced-quality fallback for image and video. Artifacts of
 * the task are deleted on every exit path except the promoted output.
 *
 * Error Handling Policy:
 * - Every failure is logged with the task id and reaches the caller as a ConversionError.
 * - Non-ConversionError exceptions are classified before they leave the coordinator.
 *
 * Requests are queued FIFO and drained by `max_concurrent` worker threads.
 */
class ConversionCoordinator : public ConfigObserver, public ProgressObserver
{
public:
    ConversionCoordinator(std::shared_ptr<ConverterFactory> factory, std::shared_ptr<ResourcePool> pool,
                          std::shared_ptr<CacheManager> cache, CoordinatorOptions options,
                          ErrorRecovery::Sleeper sleeper = ErrorRecovery::cancellableSleep);
    ~ConversionCoordinator() override;

    ConversionCoordinator(const ConversionCoordinator &) = delete;
    ConversionCoordinator &operator=(const ConversionCoordinator &) = delete;

    /**
     * @brief Queue a request. The future holds the result or a ConversionError.
     * @param token Optional caller token; cancelling it cancels this request
     */
    std::future<ProcessingResult> submit(const std::string &input_path, const FormatDescriptor &target,
                                         std::shared_ptr<CancellationToken> token = nullptr);

    /**
     * @brief submit() and wait
     * @throws ConversionError
     */
    ProcessingResult convert(const std::string &input_path, const FormatDescriptor &target,
                             std::shared_ptr<CancellationToken> token = nullptr);

    /**
     * @brief Submit every path, then collect per-file outcomes in input order
     */
    std::vector<BatchOutcome> convertBatch(const std::vector<std::string> &input_paths,
                                           const FormatDescriptor &target,
                                           std::shared_ptr<CancellationToken> token = nullptr);

    /**
     * @brief Cancel queued and running requests
     */
    void cancelAll();

    /**
     * @brief Stop accepting work, fail queued requests with Cancelled and join the workers
     */
    void shutdown();

    size_t pendingCount() const;
    std::optional<ProgressUpdate> lastUpdate() const;
    CoordinatorOptions options() const;

    void subscribe(ProgressObserver *observer);
    void unsubscribe(ProgressObserver *observer);

    void onConfigUpdate(const ConfigUpdateEvent &event) override;
    void onProgress(const ProgressUpdate &update) override;

    static bool isDocumentConversion(const FormatDescriptor &from, const FormatDescriptor &to);

private:
    struct PendingRequest
    {
        PendingRequest(std::string path, FormatDescriptor format, std::shared_ptr<CancellationToken> request_token)
            : input_path(std::move(path)), target(std::move(format)), token(std::move(request_token))
        {
        }

        uint64_t id = 0;
        std::string input_path;
        FormatDescriptor target;
        std::shared_ptr<CancellationToken> token;
        std::promise<ProcessingResult> promise;
    };

    void workerLoop();
    ProcessingResult process(const PendingRequest &request);
    ProcessingResult runPipeline(const PendingRequest &request, const std::string &task_id,
                                 ProgressTracker &tracker);
    static void verifyOutput(const std::string &path);
    std::string nextTaskId();
    void forget(uint64_t request_id);

    std::shared_ptr<ConverterFactory> factory_;
    std::shared_ptr<ResourcePool> pool_;
    std::shared_ptr<CacheManager> cache_;
    ErrorRecovery::Sleeper sleeper_;
    FileValidator validator_;

    mutable std::mutex options_mutex_;
    CoordinatorOptions options_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::unique_ptr<PendingRequest>> queue_;
    std::map<uint64_t, std::shared_ptr<CancellationToken>> live_tokens_;
    bool stopping_ = false;
    uint64_t next_request_id_ = 0;
    std::vector<std::thread> workers_;

    std::atomic<uint64_t> task_counter_{0};
    std::mutex id_mutex_;
    std::mt19937 id_rng_;

    mutable std::mutex observers_mutex_;
    std::vector<ProgressObserver *> observers_;
    std::optional<ProgressUpdate> last_update_;
};

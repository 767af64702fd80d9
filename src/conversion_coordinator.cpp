#include "core/conversion_coordinator.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

CoordinatorOptions CoordinatorOptions::fromConfig(const PocoConfigAdapter &config)
{
    CoordinatorOptions options;
    options.retry.max_attempts = std::max(1, config.getMaxAttempts());
    options.retry.backoff_base = std::chrono::milliseconds(std::max(0, config.getBackoffBaseMs()));
    options.retry.max_backoff = std::chrono::milliseconds(std::max(0, config.getMaxBackoffMs()));
    options.media_timeout = std::chrono::seconds(std::max(1, config.getMediaTimeoutSeconds()));
    options.document_timeout = std::chrono::seconds(std::max(1, config.getDocumentTimeoutSeconds()));
    options.max_concurrent = static_cast<size_t>(std::max(1, config.getMaxConcurrentConversions()));
    options.quality_fallback = config.getQualityFallbackEnabled();
    return options;
}

ConversionCoordinator::ConversionCoordinator(std::shared_ptr<ConverterFactory> factory,
                                             std::shared_ptr<ResourcePool> pool,
                                             std::shared_ptr<CacheManager> cache, CoordinatorOptions options,
                                             ErrorRecovery::Sleeper sleeper)
    : factory_(std::move(factory)), pool_(std::move(pool)), cache_(std::move(cache)),
      sleeper_(sleeper ? std::move(sleeper) : ErrorRecovery::Sleeper(ErrorRecovery::cancellableSleep)),
      validator_(SizeLimits::fromSettings(factory_->context().settings)), options_(std::move(options)),
      id_rng_(std::random_device{}())
{
    const size_t worker_count = std::max<size_t>(1, options_.max_concurrent);
    for (size_t i = 0; i < worker_count; ++i)
    {
        workers_.emplace_back(&ConversionCoordinator::workerLoop, this);
    }

    // Subscribe to configuration changes
    PocoConfigAdapter::getInstance().subscribe(this);

    Logger::info("Conversion coordinator started with " + std::to_string(worker_count) + " worker(s), " +
                 std::to_string(options_.retry.max_attempts) + " attempts per request");
}

ConversionCoordinator::~ConversionCoordinator()
{
    PocoConfigAdapter::getInstance().unsubscribe(this);
    shutdown();
    Logger::debug("ConversionCoordinator destructor called");
}

std::future<ProcessingResult> ConversionCoordinator::submit(const std::string &input_path,
                                                            const FormatDescriptor &target,
                                                            std::shared_ptr<CancellationToken> token)
{
    auto request = std::make_unique<PendingRequest>(input_path, target, CancellationToken::childOf(token));
    auto future = request->promise.get_future();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_)
        {
            Logger::warn("Rejected request for " + input_path + ": coordinator is shut down");
            request->promise.set_exception(std::make_exception_ptr(ConversionError::cancelled()));
            return future;
        }
        request->id = ++next_request_id_;
        live_tokens_[request->id] = request->token;
        queue_.push_back(std::move(request));
    }
    queue_cv_.notify_one();
    return future;
}

ProcessingResult ConversionCoordinator::convert(const std::string &input_path, const FormatDescriptor &target,
                                                std::shared_ptr<CancellationToken> token)
{
    return submit(input_path, target, std::move(token)).get();
}

std::vector<BatchOutcome> ConversionCoordinator::convertBatch(const std::vector<std::string> &input_paths,
                                                              const FormatDescriptor &target,
                                                              std::shared_ptr<CancellationToken> token)
{
    std::vector<std::future<ProcessingResult>> futures;
    futures.reserve(input_paths.size());
    for (const auto &path : input_paths)
    {
        futures.push_back(submit(path, target, token));
    }

    std::vector<BatchOutcome> outcomes;
    outcomes.reserve(input_paths.size());
    size_t failures = 0;
    for (size_t i = 0; i < futures.size(); ++i)
    {
        BatchOutcome outcome;
        outcome.input_path = input_paths[i];
        try
        {
            outcome.result = futures[i].get();
        }
        catch (const ConversionError &e)
        {
            outcome.error = e;
            ++failures;
        }
        outcomes.push_back(std::move(outcome));
    }

    Logger::info("Batch finished: " + std::to_string(input_paths.size() - failures) + " succeeded, " +
                 std::to_string(failures) + " failed");
    return outcomes;
}

void ConversionCoordinator::cancelAll()
{
    std::vector<std::shared_ptr<CancellationToken>> tokens;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        for (const auto &entry : live_tokens_)
        {
            tokens.push_back(entry.second);
        }
    }
    Logger::info("Cancelling " + std::to_string(tokens.size()) + " conversion request(s)");
    for (auto &token : tokens)
    {
        token->cancel();
    }
}

void ConversionCoordinator::shutdown()
{
    std::deque<std::unique_ptr<PendingRequest>> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_ && workers_.empty())
        {
            return;
        }
        stopping_ = true;
        abandoned.swap(queue_);
        for (const auto &request : abandoned)
        {
            live_tokens_.erase(request->id);
        }
    }
    queue_cv_.notify_all();

    for (auto &request : abandoned)
    {
        request->token->cancel();
        request->promise.set_exception(std::make_exception_ptr(ConversionError::cancelled()));
    }
    if (!abandoned.empty())
    {
        Logger::info("Shutdown failed " + std::to_string(abandoned.size()) + " queued request(s)");
    }

    for (auto &worker : workers_)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    workers_.clear();
}

size_t ConversionCoordinator::pendingCount() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

std::optional<ProgressUpdate> ConversionCoordinator::lastUpdate() const
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return last_update_;
}

CoordinatorOptions ConversionCoordinator::options() const
{
    std::lock_guard<std::mutex> lock(options_mutex_);
    return options_;
}

void ConversionCoordinator::subscribe(ProgressObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
    }
}

void ConversionCoordinator::unsubscribe(ProgressObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ConversionCoordinator::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("conversion"))
    {
        return;
    }

    CoordinatorOptions updated = CoordinatorOptions::fromConfig(PocoConfigAdapter::getInstance());
    std::lock_guard<std::mutex> lock(options_mutex_);
    if (updated.max_concurrent != options_.max_concurrent)
    {
        Logger::warn("conversion.max_concurrent changed to " + std::to_string(updated.max_concurrent) +
                     "; takes effect when the coordinator is recreated");
    }
    updated.max_concurrent = options_.max_concurrent;
    options_ = updated;
    Logger::info("Conversion options reloaded (" + event.update_id + "): " +
                 std::to_string(options_.retry.max_attempts) + " attempts, media timeout " +
                 std::to_string(options_.media_timeout.count()) + "ms, document timeout " +
                 std::to_string(options_.document_timeout.count()) + "ms");
}

void ConversionCoordinator::onProgress(const ProgressUpdate &update)
{
    std::vector<ProgressObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        last_update_ = update;
        observers = observers_;
    }
    for (auto observer : observers)
    {
        try
        {
            observer->onProgress(update);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in progress observer: " + std::string(e.what()));
        }
    }
}

bool ConversionCoordinator::isDocumentConversion(const FormatDescriptor &from, const FormatDescriptor &to)
{
    return from.category() == MediaCategory::Document || to.category() == MediaCategory::Document;
}

void ConversionCoordinator::workerLoop()
{
    for (;;)
    {
        std::unique_ptr<PendingRequest> request;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return stopping_ || !queue_.empty(); });
            if (queue_.empty())
            {
                return;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
        }

        try
        {
            request->promise.set_value(process(*request));
        }
        catch (const std::exception &e)
        {
            request->promise.set_exception(std::make_exception_ptr(ErrorRecovery::classify(e)));
        }
        forget(request->id);
    }
}

void ConversionCoordinator::forget(uint64_t request_id)
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    live_tokens_.erase(request_id);
}

ProcessingResult ConversionCoordinator::process(const PendingRequest &request)
{
    const std::string task_id = nextTaskId();
    ProgressTracker tracker;
    tracker.subscribe(this);
    tracker.begin(task_id);

    try
    {
        return runPipeline(request, task_id, tracker);
    }
    catch (const ConversionError &e)
    {
        Logger::error("Task " + task_id + " (" + request.input_path + ") failed [" +
                      ConversionError::kindName(e.kind()) + "]: " + e.what());
        tracker.fail(e.what());
        throw;
    }
    catch (const std::exception &e)
    {
        ConversionError error = ErrorRecovery::classify(e);
        Logger::error("Task " + task_id + " (" + request.input_path + ") failed [" +
                      ConversionError::kindName(error.kind()) + "]: " + error.what());
        tracker.fail(error.what());
        throw error;
    }
}

ProcessingResult ConversionCoordinator::runPipeline(const PendingRequest &request, const std::string &task_id,
                                                    ProgressTracker &tracker)
{
    const CoordinatorOptions options = this->options();
    const CancellationToken &token = *request.token;
    if (token.isCancelled())
    {
        throw ConversionError::cancelled();
    }

    // Analyzing: validate, select, admit
    tracker.transition(Stage::Analyzing, "validating " + request.input_path);
    ConversionMetadata metadata = validator_.validate(request.input_path);
    const FormatDescriptor &source = metadata.original_format;

    ConversionStrategy strategy = resolveStrategy(source, request.target);
    auto converter = factory_->select(source, request.target);
    Logger::info("Task " + task_id + ": " + source.toString() + " -> " + request.target.toString() + " via " +
                 strategyName(strategy) + " (" + converterName(*converter) + " converter)");
    tracker.report(0.05, strategyName(strategy));

    ScopedTask scoped_task(*pool_, task_id, source.category());
    auto decision = pool_->checkResourceAvailability(task_id, source, request.target);
    if (!decision.admitted)
    {
        throw ConversionError::insufficientMemory(decision.required_bytes, decision.available_bytes);
    }
    tracker.report(0.1, "admitted");

    // Deletes every unpromoted artifact on every exit path
    auto artifacts = std::make_shared<TaskArtifacts>(cache_, pool_);
    struct ReleaseArtifacts
    {
        std::shared_ptr<TaskArtifacts> artifacts;
        ~ReleaseArtifacts() { artifacts->release(); }
    } release_artifacts{artifacts};

    // Converting
    tracker.transition(Stage::Converting, strategyName(strategy));
    const auto timeout = isDocumentConversion(source, request.target) ? options.document_timeout
                                                                      : options.media_timeout;
    ProgressCallback converter_progress = [&tracker](double value)
    { tracker.report(0.1 + 0.75 * value); };

    int attempts_made = 0;
    bool used_fallback = false;
    auto attempt_with = [&](bool reduced_quality)
    {
        return [&, reduced_quality](int attempt)
        {
            attempts_made = attempt;
            artifacts->discardUnpromoted();
            Logger::info("Task " + task_id + ": attempt " + std::to_string(attempt) + "/" +
                         std::to_string(options.retry.max_attempts) + (reduced_quality ? " (reduced quality)" : ""));
            return ErrorRecovery::callWithTimeout(
                [&, reduced_quality](std::shared_ptr<CancellationToken> attempt_token)
                {
                    ConversionRequest conversion{request.input_path, request.target, metadata, converter_progress,
                                                 attempt_token, artifacts, reduced_quality};
                    return runConverter(*converter, conversion);
                },
                timeout, task_id, request.token);
        };
    };

    auto primary = [&]
    {
        return ErrorRecovery::retryWithBackoff(attempt_with(false), options.retry, task_id, token, sleeper_);
    };

    ProcessingResult result = (options.quality_fallback && supportsQualityFallback(*converter))
                                  ? ErrorRecovery::callWithFallback(
                                        primary,
                                        [&]
                                        {
                                            used_fallback = true;
                                            return attempt_with(true)(options.retry.max_attempts + 1);
                                        },
                                        task_id)
                                  : primary();

    // Optimizing: the output must be usable before it is handed over
    tracker.transition(Stage::Optimizing, "verifying output");
    verifyOutput(result.output_path);
    tracker.report(0.95);

    // Finalizing
    tracker.transition(Stage::Finalizing, "finalizing");
    artifacts->promote(result.output_path);
    if (result.metadata)
    {
        (*result.metadata)["task_id"] = task_id;
        (*result.metadata)["attempts"] = attempts_made;
        (*result.metadata)["quality_fallback"] = used_fallback;
    }

    tracker.transition(Stage::Completed, result.output_path);
    Logger::info("Task " + task_id + " completed after " + std::to_string(attempts_made) + " attempt(s): " +
                 result.output_path);
    return result;
}

void ConversionCoordinator::verifyOutput(const std::string &path)
{
    std::error_code ec;
    if (fs::is_directory(path, ec))
    {
        if (fs::is_empty(path, ec) || ec)
        {
            throw ConversionError::exportFailed("output directory is empty: " + path);
        }
        return;
    }
    if (!fs::is_regular_file(path, ec) || !FileUtils::isReadableFile(path))
    {
        throw ConversionError::exportFailed("output missing or unreadable: " + path);
    }
}

std::string ConversionCoordinator::nextTaskId()
{
    uint64_t counter = ++task_counter_;
    uint32_t suffix;
    {
        std::lock_guard<std::mutex> lock(id_mutex_);
        suffix = static_cast<uint32_t>(id_rng_());
    }
    std::ostringstream ss;
    ss << "task-" << counter << "-" << std::hex << std::setw(8) << std::setfill('0') << suffix;
    return ss.str();
}

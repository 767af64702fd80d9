#include "test_base.hpp"
#include "core/conversion_coordinator.hpp"
#include <atomic>
#include <mutex>
#include <thread>

namespace
{
    class RecordingObserver : public ProgressObserver
    {
    public:
        void onProgress(const ProgressUpdate &update) override
        {
            std::lock_guard<std::mutex> lock(mutex);
            updates.push_back(update);
        }

        std::vector<ProgressUpdate> snapshot()
        {
            std::lock_guard<std::mutex> lock(mutex);
            return updates;
        }

        std::mutex mutex;
        std::vector<ProgressUpdate> updates;
    };

    // Detaches itself from the coordinator on the first update it sees
    class OneShotObserver : public ProgressObserver
    {
    public:
        void onProgress(const ProgressUpdate &) override
        {
            ++calls;
            coordinator->unsubscribe(this);
        }

        ConversionCoordinator *coordinator = nullptr;
        std::atomic<int> calls{0};
    };

    FormatDescriptor format(const std::string &ext)
    {
        return *FormatDescriptor::fromExtension(ext);
    }
}

class ConversionCoordinatorTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        options_.retry.max_attempts = 3;
        options_.retry.backoff_base = std::chrono::milliseconds(1000);
        options_.retry.max_backoff = std::chrono::milliseconds(30000);
        options_.media_timeout = std::chrono::seconds(30);
        options_.document_timeout = std::chrono::seconds(30);
        options_.max_concurrent = 1;
        options_.quality_fallback = true;
    }

    void TearDown() override
    {
        if (coordinator_)
        {
            coordinator_->unsubscribe(&observer_);
            coordinator_.reset();
        }
        TestBase::TearDown();
    }

    ConversionCoordinator &coordinator()
    {
        if (!coordinator_)
        {
            auto factory = std::make_shared<ConverterFactory>(makeContext());
            coordinator_ = std::make_unique<ConversionCoordinator>(
                factory, pool_, cache_, options_,
                [this](std::chrono::milliseconds delay, const CancellationToken &token)
                {
                    std::lock_guard<std::mutex> lock(delays_mutex_);
                    delays_.push_back(delay);
                    return !token.isCancelled();
                });
            coordinator_->subscribe(&observer_);
        }
        return *coordinator_;
    }

    ConversionError::Kind failureKind(const std::string &input, const std::string &target_ext)
    {
        try
        {
            coordinator().convert(input, format(target_ext));
        }
        catch (const ConversionError &e)
        {
            last_error_ = e.what();
            return e.kind();
        }
        ADD_FAILURE() << "conversion of " << input << " to " << target_ext << " did not fail";
        return ConversionError::Kind::ConversionFailed;
    }

    bool waitForBackendStart(int calls = 1, std::chrono::milliseconds limit = std::chrono::seconds(5))
    {
        auto deadline = std::chrono::steady_clock::now() + limit;
        while (backend_->startedCount() < calls)
        {
            if (std::chrono::steady_clock::now() > deadline)
            {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    std::vector<std::chrono::milliseconds> delays()
    {
        std::lock_guard<std::mutex> lock(delays_mutex_);
        return delays_;
    }

    CoordinatorOptions options_;
    RecordingObserver observer_;
    std::unique_ptr<ConversionCoordinator> coordinator_;
    std::string last_error_;

private:
    std::mutex delays_mutex_;
    std::vector<std::chrono::milliseconds> delays_;
};

TEST_F(ConversionCoordinatorTest, SuccessfulConversionWalksEveryStage)
{
    auto result = coordinator().convert(createDummyFile("photo.png"), format("jpg"));

    EXPECT_TRUE(fs::exists(result.output_path));
    EXPECT_TRUE(cache_->contains(result.output_path));
    ASSERT_TRUE(result.metadata.has_value());
    EXPECT_EQ((*result.metadata)["attempts"], 1);
    EXPECT_EQ((*result.metadata)["quality_fallback"], false);
    EXPECT_TRUE((*result.metadata).contains("task_id"));

    EXPECT_EQ(pool_->activeTaskCount(), 0u);
    EXPECT_EQ(pool_->totalTasksStarted(), 1u);
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_FALSE(pool_->isFileActive(result.output_path));

    auto updates = observer_.snapshot();
    ASSERT_FALSE(updates.empty());
    std::vector<Stage> stages;
    double previous = 0.0;
    for (const auto &update : updates)
    {
        EXPECT_GE(update.progress, previous);
        previous = update.progress;
        if (stages.empty() || stages.back() != update.stage)
        {
            stages.push_back(update.stage);
        }
    }
    std::vector<Stage> expected = {Stage::Idle, Stage::Analyzing, Stage::Converting, Stage::Optimizing,
                                   Stage::Finalizing, Stage::Completed};
    EXPECT_EQ(stages, expected);
    EXPECT_DOUBLE_EQ(updates.back().progress, 1.0);

    auto last = coordinator().lastUpdate();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->stage, Stage::Completed);
}

TEST_F(ConversionCoordinatorTest, ObserversMayUnsubscribeFromTheirCallback)
{
    OneShotObserver one_shot;
    one_shot.coordinator = &coordinator();
    coordinator().subscribe(&one_shot);

    auto result = coordinator().convert(createDummyFile("photo.png"), format("jpg"));
    EXPECT_TRUE(fs::exists(result.output_path));
    EXPECT_EQ(one_shot.calls.load(), 1);

    // The remaining observer still sees the whole run
    auto updates = observer_.snapshot();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().stage, Stage::Completed);
}

TEST_F(ConversionCoordinatorTest, IncompatibleFormatsAreRejectedBeforeAdmission)
{
    EXPECT_EQ(failureKind(createDummyFile("manual.pdf"), "mp3"), ConversionError::Kind::IncompatibleFormats);
    EXPECT_EQ(pool_->totalTasksStarted(), 0u);
    EXPECT_TRUE(backend_->calls().empty());

    auto updates = observer_.snapshot();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().stage, Stage::Failed);
}

TEST_F(ConversionCoordinatorTest, DocumentToDocumentIsIncompatible)
{
    EXPECT_EQ(failureKind(createDummyFile("manual.pdf"), "pdf"), ConversionError::Kind::IncompatibleFormats);
    EXPECT_EQ(pool_->totalTasksStarted(), 0u);
    EXPECT_TRUE(backend_->calls().empty());
}

TEST_F(ConversionCoordinatorTest, InvalidInputsFailValidation)
{
    EXPECT_EQ(failureKind(getTestFilesDir() + "/missing.png", "jpg"), ConversionError::Kind::InvalidInputType);
    EXPECT_EQ(failureKind(createDummyFile("empty.png", ""), "jpg"), ConversionError::Kind::InvalidInputType);
    EXPECT_EQ(failureKind(createDummyFile("notes.txt"), "jpg"), ConversionError::Kind::InvalidInputType);
    EXPECT_EQ(failureKind(getTestFilesDir(), "jpg"), ConversionError::Kind::InvalidInputType);
    EXPECT_EQ(pool_->totalTasksStarted(), 0u);
}

TEST_F(ConversionCoordinatorTest, InsufficientMemoryEndsTheTaskExactlyOnce)
{
    setAvailableMemory(100 * ResourcePool::kMiB);
    EXPECT_EQ(failureKind(createDummyFile("clip.mov"), "mp4"), ConversionError::Kind::InsufficientMemory);

    EXPECT_EQ(pool_->totalTasksStarted(), 1u);
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_EQ(pool_->activeTaskCount(), 0u);
    EXPECT_EQ(backend_->callCount("reencode"), 0);
}

TEST_F(ConversionCoordinatorTest, TransientFailuresAreRetriedWithBackoff)
{
    backend_->fail_next = 2;
    auto result = coordinator().convert(createDummyFile("track.wav"), format("mp3"));

    EXPECT_EQ((*result.metadata)["attempts"], 3);
    EXPECT_EQ(backend_->callCount("reencode"), 3);
    auto recorded = delays();
    ASSERT_EQ(recorded.size(), 2u);
    EXPECT_EQ(recorded[0], std::chrono::milliseconds(1000));
    EXPECT_EQ(recorded[1], std::chrono::milliseconds(2000));
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    // Outputs of the failed attempts are gone, only the delivered file remains
    EXPECT_EQ(cacheEntryCount(), 1u);
}

TEST_F(ConversionCoordinatorTest, ReducedQualityFallbackRunsAfterRetriesAreExhausted)
{
    options_.retry.max_attempts = 2;
    backend_->fail_unless_reduced = true;
    auto result = coordinator().convert(createDummyFile("photo.png"), format("webp"));

    EXPECT_EQ((*result.metadata)["quality_fallback"], true);
    EXPECT_EQ((*result.metadata)["reduced_quality"], true);
    EXPECT_EQ((*result.metadata)["attempts"], 3);

    auto calls = backend_->calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_FALSE(calls[0].reduced_quality);
    EXPECT_FALSE(calls[1].reduced_quality);
    EXPECT_TRUE(calls[2].reduced_quality);
}

TEST_F(ConversionCoordinatorTest, FailedFallbackSurfacesThePrimaryError)
{
    options_.retry.max_attempts = 2;
    backend_->fail_next = 3;
    EXPECT_EQ(failureKind(createDummyFile("photo.png"), "jpg"), ConversionError::Kind::ConversionFailed);
    EXPECT_NE(last_error_.find("after 2 attempts"), std::string::npos) << last_error_;

    auto calls = backend_->calls();
    ASSERT_EQ(backend_->callCount("reencode"), 3);
    EXPECT_FALSE(calls[calls.size() - 2].reduced_quality);
    EXPECT_TRUE(calls.back().reduced_quality);
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_EQ(cacheEntryCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, CancellingTheFallbackSurfacesCancelled)
{
    options_.retry.max_attempts = 2;
    backend_->fail_next = 2;
    backend_->reduced_delay = std::chrono::seconds(30);
    auto future = coordinator().submit(createDummyFile("photo.png"), format("jpg"));
    ASSERT_TRUE(waitForBackendStart(3));

    auto start = std::chrono::steady_clock::now();
    coordinator().cancelAll();
    try
    {
        future.get();
        FAIL() << "expected Cancelled";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Cancelled) << e.what();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(backend_->calls().back().reduced_quality);
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_EQ(cacheEntryCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, AudioHasNoQualityFallback)
{
    options_.retry.max_attempts = 2;
    backend_->fail_unless_reduced = true;
    EXPECT_EQ(failureKind(createDummyFile("track.wav"), "mp3"), ConversionError::Kind::ConversionFailed);
    EXPECT_EQ(backend_->callCount("reencode"), 2);
}

TEST_F(ConversionCoordinatorTest, ExhaustedRetriesLeaveNoArtifactsBehind)
{
    options_.retry.max_attempts = 2;
    backend_->fail_next = 100;
    EXPECT_EQ(failureKind(createDummyFile("photo.png"), "jpg"), ConversionError::Kind::ConversionFailed);
    EXPECT_NE(last_error_.find("after 2 attempts"), std::string::npos) << last_error_;

    EXPECT_EQ(cacheEntryCount(), 0u);
    EXPECT_TRUE(pool_->activeFiles().empty());
    EXPECT_EQ(pool_->totalTasksStarted(), 1u);
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
}

TEST_F(ConversionCoordinatorTest, SlowAttemptsTimeOut)
{
    options_.retry.max_attempts = 1;
    options_.quality_fallback = false;
    options_.media_timeout = std::chrono::milliseconds(100);
    backend_->delay = std::chrono::seconds(30);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(failureKind(createDummyFile("clip.mov"), "mp4"), ConversionError::Kind::Timeout);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_EQ(cacheEntryCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, DocumentsUseTheDocumentTimeout)
{
    EXPECT_TRUE(ConversionCoordinator::isDocumentConversion(format("pdf"), format("png")));
    EXPECT_TRUE(ConversionCoordinator::isDocumentConversion(format("png"), format("pdf")));
    EXPECT_FALSE(ConversionCoordinator::isDocumentConversion(format("png"), format("mp4")));

    options_.retry.max_attempts = 1;
    options_.media_timeout = std::chrono::seconds(30);
    options_.document_timeout = std::chrono::milliseconds(100);
    backend_->delay = std::chrono::seconds(30);
    EXPECT_EQ(failureKind(createDummyFile("report.pdf"), "png"), ConversionError::Kind::Timeout);
}

TEST_F(ConversionCoordinatorTest, CancelAllStopsARunningConversion)
{
    backend_->delay = std::chrono::seconds(30);
    auto future = coordinator().submit(createDummyFile("song.mp3"), format("wav"));
    ASSERT_TRUE(waitForBackendStart());

    auto start = std::chrono::steady_clock::now();
    coordinator().cancelAll();
    try
    {
        future.get();
        FAIL() << "expected Cancelled";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Cancelled);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_EQ(pool_->totalTasksEnded(), 1u);
    EXPECT_EQ(cacheEntryCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, CallerTokenCancelsItsRequest)
{
    auto token = CancellationToken::create();
    token->cancel();
    try
    {
        coordinator().convert(createDummyFile("song.mp3"), format("wav"), token);
        FAIL() << "expected Cancelled";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Cancelled);
    }
    EXPECT_TRUE(backend_->calls().empty());
}

TEST_F(ConversionCoordinatorTest, ThreePageDocumentFinishesWithADirectory)
{
    backend_->probe_result.page_count = 3;
    auto result = coordinator().convert(createDummyFile("report.pdf"), format("png"));

    ASSERT_TRUE(fs::is_directory(result.output_path));
    size_t pages = 0;
    for (const auto &entry : fs::directory_iterator(result.output_path))
    {
        EXPECT_EQ(entry.path().extension(), ".png");
        ++pages;
    }
    EXPECT_EQ(pages, 3u);
    EXPECT_EQ(result.suggested_filename, "report_pages");

    auto updates = observer_.snapshot();
    ASSERT_FALSE(updates.empty());
    EXPECT_EQ(updates.back().stage, Stage::Completed);
    EXPECT_DOUBLE_EQ(updates.back().progress, 1.0);
}

TEST_F(ConversionCoordinatorTest, MissingPageOutputsFailExport)
{
    options_.retry.max_attempts = 1;
    backend_->probe_result.page_count = 2;
    backend_->skip_output = true;
    EXPECT_EQ(failureKind(createDummyFile("report.pdf"), "png"), ConversionError::Kind::ExportFailed);
    EXPECT_EQ(cacheEntryCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, BatchReportsEveryFileInOrder)
{
    std::vector<std::string> inputs = {createDummyFile("a.wav"), getTestFilesDir() + "/missing.wav",
                                       createDummyFile("c.flac")};
    auto outcomes = coordinator().convertBatch(inputs, format("mp3"));

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].succeeded());
    EXPECT_FALSE(outcomes[1].succeeded());
    ASSERT_TRUE(outcomes[1].error.has_value());
    EXPECT_EQ(outcomes[1].error->kind(), ConversionError::Kind::InvalidInputType);
    EXPECT_TRUE(outcomes[2].succeeded());
    EXPECT_EQ(outcomes[2].input_path, inputs[2]);
    EXPECT_EQ(pool_->totalTasksStarted(), 2u);
    EXPECT_EQ(pool_->totalTasksEnded(), 2u);
}

TEST_F(ConversionCoordinatorTest, ConcurrentWorkersDrainTheQueue)
{
    options_.max_concurrent = 3;
    std::vector<std::string> inputs;
    for (int i = 0; i < 9; ++i)
    {
        inputs.push_back(createDummyFile("img" + std::to_string(i) + ".png"));
    }
    auto outcomes = coordinator().convertBatch(inputs, format("jpg"));

    for (const auto &outcome : outcomes)
    {
        EXPECT_TRUE(outcome.succeeded()) << outcome.input_path;
    }
    EXPECT_EQ(pool_->totalTasksStarted(), 9u);
    EXPECT_EQ(pool_->totalTasksEnded(), 9u);
    EXPECT_EQ(pool_->activeTaskCount(), 0u);
    EXPECT_EQ(coordinator().pendingCount(), 0u);
}

TEST_F(ConversionCoordinatorTest, SubmitAfterShutdownIsCancelled)
{
    coordinator().shutdown();
    auto future = coordinator().submit(createDummyFile("photo.png"), format("jpg"));
    try
    {
        future.get();
        FAIL() << "expected Cancelled";
    }
    catch (const ConversionError &e)
    {
        EXPECT_EQ(e.kind(), ConversionError::Kind::Cancelled);
    }
}

TEST_F(ConversionCoordinatorTest, ConfigUpdatesReloadRetryOptions)
{
    coordinator();
    PocoConfigAdapter::getInstance().update(
        nlohmann::json{{"conversion", {{"max_attempts", 5}, {"max_concurrent", 4}}}}, "test");

    auto options = coordinator().options();
    EXPECT_EQ(options.retry.max_attempts, 5);
    EXPECT_EQ(options.max_concurrent, 1u);

    PocoConfigAdapter::getInstance().resetToDefaults();
}

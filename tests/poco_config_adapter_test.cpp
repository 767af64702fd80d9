#include <gtest/gtest.h>
#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "core/logger_observer.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <filesystem>

namespace
{
    class MockObserver : public ConfigObserver
    {
    public:
        void onConfigUpdate(const ConfigUpdateEvent &event) override
        {
            last_event_ = event;
            event_count_++;
        }

        ConfigUpdateEvent last_event_;
        int event_count_ = 0;
    };
}

class PocoConfigAdapterTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        test_config_path_ = (std::filesystem::temp_directory_path() / "mediaconv_test_config.json").string();
        createTestConfig();

        auto &config = PocoConfigAdapter::getInstance();
        config.resetToDefaults();
        ASSERT_TRUE(config.loadConfig(test_config_path_));
    }

    void TearDown() override
    {
        if (std::filesystem::exists(test_config_path_))
        {
            std::filesystem::remove(test_config_path_);
        }
        PocoConfigAdapter::getInstance().resetToDefaults();
        Logger::init("WARN");
    }

    void createTestConfig()
    {
        std::ofstream config_file(test_config_path_);
        config_file << R"({
            "log_level": "DEBUG",
            "cache": {
                "retention_hours": 6
            },
            "conversion": {
                "max_attempts": 4,
                "backoff_base_ms": 250,
                "max_concurrent": 2
            },
            "image": {
                "quality": 0.8,
                "resize": true,
                "target_width": 800
            },
            "video": {
                "frame_rate": 24,
                "bitrate_kbps": 2500
            },
            "limits": {
                "image_mb": 5
            }
        })";
        config_file.close();
    }

    std::string test_config_path_;
};

TEST_F(PocoConfigAdapterTest, SingletonPattern)
{
    auto &instance1 = PocoConfigAdapter::getInstance();
    auto &instance2 = PocoConfigAdapter::getInstance();

    EXPECT_EQ(&instance1, &instance2);
}

TEST_F(PocoConfigAdapterTest, FileValuesOverlayDefaults)
{
    auto &config = PocoConfigAdapter::getInstance();

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getCacheRetentionHours(), 6);
    EXPECT_EQ(config.getMaxAttempts(), 4);
    EXPECT_EQ(config.getBackoffBaseMs(), 250);
    EXPECT_EQ(config.getMaxConcurrentConversions(), 2);
    EXPECT_DOUBLE_EQ(config.getImageQuality(), 0.8);
    EXPECT_TRUE(config.getResizeImage());
    EXPECT_EQ(config.getImageTargetWidth(), 800);
    EXPECT_EQ(config.getFrameRate(), 24);
    EXPECT_EQ(config.getVideoBitrateKbps(), 2500);
    EXPECT_EQ(config.getImageSizeLimit(), 5ULL * 1024 * 1024);

    // Keys absent from the file keep their defaults
    EXPECT_EQ(config.getImageTargetHeight(), 1080);
    EXPECT_EQ(config.getMaxBackoffMs(), 30000);
    EXPECT_EQ(config.getMediaTimeoutSeconds(), 300);
    EXPECT_EQ(config.getDocumentTimeoutSeconds(), 180);
    EXPECT_TRUE(config.getQualityFallbackEnabled());
}

TEST_F(PocoConfigAdapterTest, DefaultValues)
{
    auto &config = PocoConfigAdapter::getInstance();
    config.resetToDefaults();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getCacheRetentionHours(), 24);
    EXPECT_EQ(config.getMaxAttempts(), 3);
    EXPECT_EQ(config.getBackoffBaseMs(), 1000);
    EXPECT_EQ(config.getMaxConcurrentConversions(), 1);
    EXPECT_DOUBLE_EQ(config.getImageQuality(), 0.95);
    EXPECT_TRUE(config.getPreserveMetadata());
    EXPECT_FALSE(config.getResizeImage());
    EXPECT_EQ(config.getFrameRate(), 30);
    EXPECT_DOUBLE_EQ(config.getVideoDurationSeconds(), 3.0);
    EXPECT_EQ(config.getVideoWidth(), 1280);
    EXPECT_EQ(config.getVideoHeight(), 720);
    EXPECT_DOUBLE_EQ(config.getAudioVolume(), 1.0);
    EXPECT_DOUBLE_EQ(config.getAudioTempo(), 1.0);
    EXPECT_EQ(config.getAnimationFrameCount(), 10);
    EXPECT_DOUBLE_EQ(config.getAnimationFrameDuration(), 0.1);
    EXPECT_EQ(config.getFFmpegPath(), "ffmpeg");
    EXPECT_EQ(config.getPdfDpi(), 150);
}

TEST_F(PocoConfigAdapterTest, MissingFileIsReported)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_FALSE(config.loadConfig("/nonexistent/mediaconv/config.json"));
    EXPECT_EQ(config.getMaxAttempts(), 4);
}

TEST_F(PocoConfigAdapterTest, UpdateConfig)
{
    auto &config = PocoConfigAdapter::getInstance();

    config.updateConfig(R"({
        "conversion": { "max_attempts": 7 },
        "log_level": "WARN"
    })");

    EXPECT_EQ(config.getMaxAttempts(), 7);
    EXPECT_EQ(config.getLogLevel(), "WARN");

    // Malformed input leaves the configuration untouched
    config.updateConfig("{ not json");
    EXPECT_EQ(config.getMaxAttempts(), 7);
}

TEST_F(PocoConfigAdapterTest, ConfigurationValidation)
{
    auto &config = PocoConfigAdapter::getInstance();
    EXPECT_TRUE(config.validateConfig());

    config.update(nlohmann::json{{"conversion", {{"max_attempts", 0}}}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigAdapterTest, SaveAndReload)
{
    auto &config = PocoConfigAdapter::getInstance();
    std::string saved = test_config_path_ + ".saved";
    config.update(nlohmann::json{{"video", {{"width", 640}}}});
    ASSERT_TRUE(config.saveConfig(saved));

    config.resetToDefaults();
    EXPECT_EQ(config.getVideoWidth(), 1280);

    ASSERT_TRUE(config.loadConfig(saved));
    EXPECT_EQ(config.getVideoWidth(), 640);
    EXPECT_EQ(config.getMaxAttempts(), 4);
    std::filesystem::remove(saved);
}

TEST_F(PocoConfigAdapterTest, ObserverPattern)
{
    auto &config = PocoConfigAdapter::getInstance();
    MockObserver observer;
    config.subscribe(&observer);

    config.update(nlohmann::json{{"conversion", {{"max_attempts", 5}, {"backoff_base_ms", 10}}}});

    EXPECT_EQ(observer.event_count_, 1);
    EXPECT_EQ(observer.last_event_.source, "api");
    EXPECT_EQ(observer.last_event_.changed_keys.size(), 2u);
    EXPECT_TRUE(observer.last_event_.touches("conversion"));
    EXPECT_TRUE(observer.last_event_.touches("conversion.max_attempts"));
    EXPECT_FALSE(observer.last_event_.touches("conv"));
    EXPECT_FALSE(observer.last_event_.touches("image"));
    EXPECT_FALSE(observer.last_event_.update_id.empty());

    config.unsubscribe(&observer);
    config.setLogLevel("ERROR");
    EXPECT_EQ(observer.event_count_, 1);
}

TEST_F(PocoConfigAdapterTest, UpdateIdsAreUnique)
{
    auto &config = PocoConfigAdapter::getInstance();
    MockObserver observer;
    config.subscribe(&observer);

    config.update(nlohmann::json{{"audio", {{"volume", 0.5}}}}, "cli");
    std::string first = observer.last_event_.update_id;
    EXPECT_EQ(observer.last_event_.source, "cli");

    config.update(nlohmann::json{{"audio", {{"volume", 0.7}}}});
    EXPECT_NE(observer.last_event_.update_id, first);

    // An empty patch changes nothing and publishes nothing
    config.update(nlohmann::json::object());
    EXPECT_EQ(observer.event_count_, 2);

    config.unsubscribe(&observer);
}

TEST_F(PocoConfigAdapterTest, LoadingAFilePublishesEveryKey)
{
    auto &config = PocoConfigAdapter::getInstance();
    MockObserver observer;
    config.subscribe(&observer);

    ASSERT_TRUE(config.loadConfig(test_config_path_));
    EXPECT_EQ(observer.event_count_, 1);
    EXPECT_EQ(observer.last_event_.source, "file");
    EXPECT_TRUE(observer.last_event_.touches("log_level"));
    EXPECT_TRUE(observer.last_event_.touches("conversion.max_attempts"));
    EXPECT_TRUE(observer.last_event_.touches("backend"));

    config.unsubscribe(&observer);
}

TEST_F(PocoConfigAdapterTest, LoggerObserverAppliesLogLevel)
{
    auto &config = PocoConfigAdapter::getInstance();
    LoggerObserver observer;
    config.subscribe(&observer);

    config.setLogLevel("ERROR");
    EXPECT_EQ(spdlog::get("mediaconv")->level(), spdlog::level::err);

    config.setLogLevel("DEBUG");
    EXPECT_EQ(spdlog::get("mediaconv")->level(), spdlog::level::debug);

    // Unrelated keys leave the level alone
    config.update(nlohmann::json{{"video", {{"frame_rate", 60}}}});
    EXPECT_EQ(spdlog::get("mediaconv")->level(), spdlog::level::debug);

    config.unsubscribe(&observer);
}

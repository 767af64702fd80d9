#include "core/poco_config_adapter.hpp"
#include "core/config_observer.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <functional>

namespace
{
    constexpr uint64_t kBytesPerMB = 1024ULL * 1024ULL;

    uint64_t megabytesToBytes(int megabytes)
    {
        return static_cast<uint64_t>(std::max(megabytes, 0)) * kBytesPerMB;
    }
}

PocoConfigAdapter::PocoConfigAdapter()
    : poco_cfg_(PocoConfigManager::getInstance())
{
    Logger::debug("PocoConfigAdapter initialized with default configuration");
}

nlohmann::json PocoConfigAdapter::getAll() const
{
    return poco_cfg_.getAll();
}

std::string PocoConfigAdapter::getLogLevel() const
{
    return poco_cfg_.getString("log_level", "INFO");
}

// Cache configuration getters
std::string PocoConfigAdapter::getCacheDirectory() const
{
    return poco_cfg_.getString("cache.directory", "");
}

int PocoConfigAdapter::getCacheRetentionHours() const
{
    return poco_cfg_.getInt("cache.retention_hours", 24);
}

bool PocoConfigAdapter::getCacheSweepOnStart() const
{
    return poco_cfg_.getBool("cache.sweep_on_start", true);
}

// Conversion pipeline getters
int PocoConfigAdapter::getMaxAttempts() const
{
    return poco_cfg_.getInt("conversion.max_attempts", 3);
}

int PocoConfigAdapter::getBackoffBaseMs() const
{
    return poco_cfg_.getInt("conversion.backoff_base_ms", 1000);
}

int PocoConfigAdapter::getMaxBackoffMs() const
{
    return poco_cfg_.getInt("conversion.max_backoff_ms", 30000);
}

int PocoConfigAdapter::getMediaTimeoutSeconds() const
{
    return poco_cfg_.getInt("conversion.media_timeout_seconds", 300);
}

int PocoConfigAdapter::getDocumentTimeoutSeconds() const
{
    return poco_cfg_.getInt("conversion.document_timeout_seconds", 180);
}

int PocoConfigAdapter::getMaxConcurrentConversions() const
{
    return poco_cfg_.getInt("conversion.max_concurrent", 1);
}

bool PocoConfigAdapter::getQualityFallbackEnabled() const
{
    return poco_cfg_.getBool("conversion.quality_fallback", true);
}

// Image settings
double PocoConfigAdapter::getImageQuality() const
{
    return std::clamp(poco_cfg_.getDouble("image.quality", 0.95), 0.0, 1.0);
}

bool PocoConfigAdapter::getPreserveMetadata() const
{
    return poco_cfg_.getBool("image.preserve_metadata", true);
}

bool PocoConfigAdapter::getResizeImage() const
{
    return poco_cfg_.getBool("image.resize", false);
}

int PocoConfigAdapter::getImageTargetWidth() const
{
    return poco_cfg_.getInt("image.target_width", 1920);
}

int PocoConfigAdapter::getImageTargetHeight() const
{
    return poco_cfg_.getInt("image.target_height", 1080);
}

bool PocoConfigAdapter::getMaintainAspectRatio() const
{
    return poco_cfg_.getBool("image.maintain_aspect_ratio", true);
}

bool PocoConfigAdapter::getEnhanceImage() const
{
    return poco_cfg_.getBool("image.enhance", false);
}

bool PocoConfigAdapter::getAdjustColors() const
{
    return poco_cfg_.getBool("image.adjust_colors", false);
}

double PocoConfigAdapter::getSaturation() const
{
    return poco_cfg_.getDouble("image.saturation", 1.0);
}

double PocoConfigAdapter::getBrightness() const
{
    return poco_cfg_.getDouble("image.brightness", 0.0);
}

double PocoConfigAdapter::getContrast() const
{
    return poco_cfg_.getDouble("image.contrast", 1.0);
}

// Video settings
int PocoConfigAdapter::getVideoBitrateKbps() const
{
    return poco_cfg_.getInt("video.bitrate_kbps", 0);
}

int PocoConfigAdapter::getAudioBitrateKbps() const
{
    return poco_cfg_.getInt("video.audio_bitrate_kbps", 0);
}

int PocoConfigAdapter::getFrameRate() const
{
    return poco_cfg_.getInt("video.frame_rate", 30);
}

double PocoConfigAdapter::getVideoDurationSeconds() const
{
    return poco_cfg_.getDouble("video.duration_seconds", 3.0);
}

int PocoConfigAdapter::getVideoWidth() const
{
    return poco_cfg_.getInt("video.width", 1280);
}

int PocoConfigAdapter::getVideoHeight() const
{
    return poco_cfg_.getInt("video.height", 720);
}

// Audio mix settings
double PocoConfigAdapter::getAudioVolume() const
{
    return poco_cfg_.getDouble("audio.volume", 1.0);
}

double PocoConfigAdapter::getAudioTempo() const
{
    return poco_cfg_.getDouble("audio.tempo", 1.0);
}

// Animated output settings
int PocoConfigAdapter::getAnimationFrameCount() const
{
    return poco_cfg_.getInt("animation.frame_count", 10);
}

double PocoConfigAdapter::getAnimationFrameDuration() const
{
    return poco_cfg_.getDouble("animation.frame_duration", 0.1);
}

// Input size limits
uint64_t PocoConfigAdapter::getImageSizeLimit() const
{
    return megabytesToBytes(poco_cfg_.getInt("limits.image_mb", 100));
}

uint64_t PocoConfigAdapter::getAudioSizeLimit() const
{
    return megabytesToBytes(poco_cfg_.getInt("limits.audio_mb", 500));
}

uint64_t PocoConfigAdapter::getVideoSizeLimit() const
{
    return megabytesToBytes(poco_cfg_.getInt("limits.video_mb", 1000));
}

uint64_t PocoConfigAdapter::getDocumentSizeLimit() const
{
    return megabytesToBytes(poco_cfg_.getInt("limits.document_mb", 200));
}

// Backend settings
std::string PocoConfigAdapter::getFFmpegPath() const
{
    return poco_cfg_.getString("backend.ffmpeg_path", "ffmpeg");
}

int PocoConfigAdapter::getRenderThreads() const
{
    return poco_cfg_.getInt("backend.render_threads", 4);
}

int PocoConfigAdapter::getPdfDpi() const
{
    return poco_cfg_.getInt("backend.pdf_dpi", 150);
}

// Configuration updates
void PocoConfigAdapter::setLogLevel(const std::string &level)
{
    update(nlohmann::json{{"log_level", level}});
}

void PocoConfigAdapter::update(const nlohmann::json &patch, const std::string &source)
{
    std::vector<std::string> changed = poco_cfg_.update(patch);
    if (changed.empty())
    {
        return;
    }

    ConfigUpdateEvent event;
    event.changed_keys = std::move(changed);
    event.source = source;
    event.update_id = nextUpdateId();
    publishEvent(event);
}

void PocoConfigAdapter::updateConfig(const std::string &json_config)
{
    try
    {
        update(nlohmann::json::parse(json_config));
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Failed to update configuration: " + std::string(e.what()));
    }
}

// Configuration persistence
bool PocoConfigAdapter::loadConfig(const std::string &file_path)
{
    if (!poco_cfg_.load(file_path))
    {
        Logger::warn("Could not load configuration from " + file_path);
        return false;
    }
    Logger::info("Configuration loaded from " + file_path);

    // Every key may have changed; let observers re-read what they care about
    ConfigUpdateEvent event;
    std::function<void(const std::string &, const nlohmann::json &)> collect;
    collect = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                collect(prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
            }
        }
        else
        {
            event.changed_keys.push_back(prefix);
        }
    };
    collect("", poco_cfg_.getAll());
    event.source = "file";
    event.update_id = nextUpdateId();
    publishEvent(event);
    return true;
}

bool PocoConfigAdapter::saveConfig(const std::string &file_path) const
{
    std::string target_path = file_path.empty() ? "config.json" : file_path;
    return poco_cfg_.save(target_path);
}

void PocoConfigAdapter::resetToDefaults()
{
    poco_cfg_.reset();
}

bool PocoConfigAdapter::validateConfig() const
{
    return poco_cfg_.validateConfig();
}

// Observer management
void PocoConfigAdapter::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
    {
        observers_.push_back(observer);
        Logger::debug("Configuration observer subscribed");
    }
}

void PocoConfigAdapter::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("Configuration observer unsubscribed");
}

void PocoConfigAdapter::publishEvent(const ConfigUpdateEvent &event)
{
    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }

    Logger::debug("Publishing config update " + event.update_id + " (" +
                  std::to_string(event.changed_keys.size()) + " keys, source: " + event.source + ")");
    for (auto observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("Error in config observer: " + std::string(e.what()));
        }
    }
}

std::string PocoConfigAdapter::nextUpdateId()
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    return "cfg-" + std::to_string(++update_counter_);
}

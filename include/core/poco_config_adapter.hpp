#pragma once

#include "core/poco_config_manager.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

class ConfigObserver;
struct ConfigUpdateEvent;

/**
 * @brief Typed configuration facade over PocoConfigManager.
 *
 * Owns observer registration; every update() publishes a ConfigUpdateEvent
 * listing the flattened keys that changed.
 */
class PocoConfigAdapter
{
public:
    static PocoConfigAdapter &getInstance()
    {
        static PocoConfigAdapter instance;
        return instance;
    }

    nlohmann::json getAll() const;
    std::string getLogLevel() const;

    // Cache configuration getters
    std::string getCacheDirectory() const;
    int getCacheRetentionHours() const;
    bool getCacheSweepOnStart() const;

    // Conversion pipeline getters
    int getMaxAttempts() const;
    int getBackoffBaseMs() const;
    int getMaxBackoffMs() const;
    int getMediaTimeoutSeconds() const;
    int getDocumentTimeoutSeconds() const;
    int getMaxConcurrentConversions() const;
    bool getQualityFallbackEnabled() const;

    // Image settings
    double getImageQuality() const;
    bool getPreserveMetadata() const;
    bool getResizeImage() const;
    int getImageTargetWidth() const;
    int getImageTargetHeight() const;
    bool getMaintainAspectRatio() const;
    bool getEnhanceImage() const;
    bool getAdjustColors() const;
    double getSaturation() const;
    double getBrightness() const;
    double getContrast() const;

    // Video settings
    int getVideoBitrateKbps() const;
    int getAudioBitrateKbps() const;
    int getFrameRate() const;
    double getVideoDurationSeconds() const;
    int getVideoWidth() const;
    int getVideoHeight() const;

    // Audio mix settings
    double getAudioVolume() const;
    double getAudioTempo() const;

    // Animated output settings
    int getAnimationFrameCount() const;
    double getAnimationFrameDuration() const;

    // Input size limits in bytes
    uint64_t getImageSizeLimit() const;
    uint64_t getAudioSizeLimit() const;
    uint64_t getVideoSizeLimit() const;
    uint64_t getDocumentSizeLimit() const;

    // Backend settings
    std::string getFFmpegPath() const;
    int getRenderThreads() const;
    int getPdfDpi() const;

    // Configuration updates with event publishing
    void setLogLevel(const std::string &level);
    void update(const nlohmann::json &patch, const std::string &source = "api");
    void updateConfig(const std::string &json_config);

    // Configuration file operations
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;
    void resetToDefaults();

    bool validateConfig() const;

    // Observer management
    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigAdapter();
    PocoConfigAdapter(const PocoConfigAdapter &) = delete;
    PocoConfigAdapter &operator=(const PocoConfigAdapter &) = delete;

    void publishEvent(const ConfigUpdateEvent &event);
    std::string nextUpdateId();

    PocoConfigManager &poco_cfg_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;
    uint64_t update_counter_{0};
};

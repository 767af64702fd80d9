#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;

    // Overlay the file on top of the current values so missing keys keep their defaults
    nlohmann::json file_json;
    try
    {
        file_json = nlohmann::json::parse(in);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.what());
        return false;
    }

    std::stringstream current;
    cfg_->save(current);
    nlohmann::json merged = nlohmann::json::parse(current.str());
    merged.merge_patch(file_json);

    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    std::istringstream merged_in(merged.dump());
    try
    {
        tmp->load(merged_in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to load configuration file " + path + ": " + e.displayText());
        return false;
    }
    cfg_ = tmp;
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

std::vector<std::string> PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> changed;

    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
            changed.push_back(prefix);
        }
    };
    apply("", patch);
    return changed;
}

void PocoConfigManager::reset()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

uint32_t PocoConfigManager::getUInt32(const std::string &key, uint32_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(cfg_->getUInt(key, def));
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

bool PocoConfigManager::validateConfig() const
{
    bool valid = true;

    double quality = getDouble("image.quality", 0.95);
    if (quality < 0.0 || quality > 1.0)
    {
        Logger::error("Invalid image.quality: " + std::to_string(quality) + " (expected 0.0 - 1.0)");
        valid = false;
    }

    if (getInt("conversion.max_attempts", 3) < 1)
    {
        Logger::error("Invalid conversion.max_attempts: must be at least 1");
        valid = false;
    }

    if (getInt("conversion.max_concurrent", 1) < 1)
    {
        Logger::error("Invalid conversion.max_concurrent: must be at least 1");
        valid = false;
    }

    if (getInt("conversion.media_timeout_seconds", 300) <= 0 ||
        getInt("conversion.document_timeout_seconds", 180) <= 0)
    {
        Logger::error("Invalid conversion timeouts: must be positive");
        valid = false;
    }

    if (getInt("video.frame_rate", 30) <= 0)
    {
        Logger::error("Invalid video.frame_rate: must be positive");
        valid = false;
    }

    if (getInt("cache.retention_hours", 24) <= 0)
    {
        Logger::error("Invalid cache.retention_hours: must be positive");
        valid = false;
    }

    return valid;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");

    // Cache defaults
    cfg_->setString("cache.directory", "");
    cfg_->setInt("cache.retention_hours", 24);
    cfg_->setBool("cache.sweep_on_start", true);

    // Conversion pipeline defaults
    cfg_->setInt("conversion.max_attempts", 3);
    cfg_->setInt("conversion.backoff_base_ms", 1000);
    cfg_->setInt("conversion.max_backoff_ms", 30000);
    cfg_->setInt("conversion.media_timeout_seconds", 300);
    cfg_->setInt("conversion.document_timeout_seconds", 180);
    cfg_->setInt("conversion.max_concurrent", 1);
    cfg_->setBool("conversion.quality_fallback", true);

    // Image defaults
    cfg_->setDouble("image.quality", 0.95);
    cfg_->setBool("image.preserve_metadata", true);
    cfg_->setBool("image.resize", false);
    cfg_->setInt("image.target_width", 1920);
    cfg_->setInt("image.target_height", 1080);
    cfg_->setBool("image.maintain_aspect_ratio", true);
    cfg_->setBool("image.enhance", false);
    cfg_->setBool("image.adjust_colors", false);
    cfg_->setDouble("image.saturation", 1.0);
    cfg_->setDouble("image.brightness", 0.0);
    cfg_->setDouble("image.contrast", 1.0);

    // Video defaults
    cfg_->setInt("video.bitrate_kbps", 0);
    cfg_->setInt("video.audio_bitrate_kbps", 0);
    cfg_->setInt("video.frame_rate", 30);
    cfg_->setDouble("video.duration_seconds", 3.0);
    cfg_->setInt("video.width", 1280);
    cfg_->setInt("video.height", 720);

    // Audio defaults
    cfg_->setDouble("audio.volume", 1.0);
    cfg_->setDouble("audio.tempo", 1.0);

    // Animated output defaults
    cfg_->setInt("animation.frame_count", 10);
    cfg_->setDouble("animation.frame_duration", 0.1);

    // Input size limits
    cfg_->setInt("limits.image_mb", 100);
    cfg_->setInt("limits.audio_mb", 500);
    cfg_->setInt("limits.video_mb", 1000);
    cfg_->setInt("limits.document_mb", 200);

    // Backend defaults
    cfg_->setString("backend.ffmpeg_path", "ffmpeg");
    cfg_->setInt("backend.render_threads", 4);
    cfg_->setInt("backend.pdf_dpi", 150);
}

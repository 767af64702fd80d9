#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    /**
     * @brief Apply a nested JSON patch; returns the flattened keys that were set
     */
    std::vector<std::string> update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Restore built-in defaults, dropping anything loaded from disk
    void reset();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    uint32_t getUInt32(const std::string &key, uint32_t def = 0) const;
    double getDouble(const std::string &key, double def = 0.0) const;

    // Configuration validation
    bool validateConfig() const;

private:
    PocoConfigManager();
    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

#pragma once

#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Flattened keys, e.g. "conversion.max_attempts"
    std::string source;                    // "file", "cli" or "api"
    std::string update_id;                 // Unique identifier of the update

    /**
     * @brief True if any changed key equals `prefix` or lives under `prefix.`
     */
    bool touches(const std::string &prefix) const
    {
        return std::any_of(changed_keys.begin(), changed_keys.end(),
                           [&prefix](const std::string &key)
                           {
                               return key == prefix ||
                                      (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0 &&
                                       key[prefix.size()] == '.');
                           });
    }
};

/**
 * @brief Observer interface for configuration changes
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};

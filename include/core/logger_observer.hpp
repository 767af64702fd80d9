#pragma once

#include "config_observer.hpp"

/**
 * @brief Observer that applies log level configuration changes
 */
class LoggerObserver : public ConfigObserver
{
public:
    LoggerObserver() = default;
    ~LoggerObserver() override = default;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;
};

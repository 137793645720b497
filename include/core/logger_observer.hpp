#pragma once

#include "config_observer.hpp"

/**
 * @brief Applies "log_level" changes to the running logger
 */
class LoggerObserver : public ConfigObserver
{
public:
    void onConfigUpdate(const ConfigUpdateEvent &event) override;
};

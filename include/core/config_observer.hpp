#pragma once

#include <algorithm>
#include <string>
#include <vector>

/**
 * @brief Configuration update event
 */
struct ConfigUpdateEvent
{
    std::vector<std::string> changed_keys; // Top-level sections whose value changed, e.g. "server", "retention"
    std::string source;                    // "api" (programmatic update) or "file_observer"
    std::string update_id;                 // Random UUID identifying this update

    bool touches(const std::string &section) const
    {
        return std::find(changed_keys.begin(), changed_keys.end(), section) != changed_keys.end();
    }
};

/**
 * @brief Observer interface for configuration changes
 *
 * Called on the thread that applied the update (the file watcher thread for
 * file reloads). Exceptions are logged by the publisher and do not reach
 * other observers.
 */
class ConfigObserver
{
public:
    virtual ~ConfigObserver() = default;
    virtual void onConfigUpdate(const ConfigUpdateEvent &event) = 0;
};

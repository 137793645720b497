#include "core/logger_observer.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"

void LoggerObserver::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("log_level"))
    {
        return;
    }

    try
    {
        std::string new_log_level = PocoConfigManager::getInstance().getLogLevel();
        Logger::info("LoggerObserver: log level change detected (" + event.source + "): " + new_log_level);
        Logger::setLevel(new_log_level);
    }
    catch (const std::exception &e)
    {
        Logger::error("LoggerObserver: error updating log level: " + std::string(e.what()));
    }
}

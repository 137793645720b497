#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Environment.h>
#include <Poco/UUIDGenerator.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    std::string envOr(const std::string &name, const std::string &def)
    {
        if (Poco::Environment::has(name))
        {
            std::string value = Poco::Environment::get(name);
            if (!value.empty())
                return value;
        }
        return def;
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return value;
    }
}

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

PocoConfigManager::~PocoConfigManager()
{
    stopWatching();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
    try
    {
        tmp->load(in);
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("PocoConfigManager: invalid configuration in " + path + ": " + e.displayText());
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

void PocoConfigManager::update(const nlohmann::json &patch)
{
    nlohmann::json before = getAll();
    {
        std::lock_guard<std::mutex> lock(mutex_);
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
                else if (node.is_number_integer())
                    cfg_->setInt(prefix, node.get<int>());
                else if (node.is_number_float())
                    cfg_->setDouble(prefix, node.get<double>());
                else if (node.is_string())
                    cfg_->setString(prefix, node.get<std::string>());
                else
                    cfg_->setString(prefix, node.dump());
            }
        };
        apply("", patch);
    }
    publishChanges(before, getAll(), "api");
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

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

std::string PocoConfigManager::getServerHost() const
{
    return getString("server.host", "0.0.0.0");
}

int PocoConfigManager::getServerPort() const
{
    std::string port = envOr("PORT", "");
    if (!port.empty())
    {
        size_t consumed = 0;
        int value = 0;
        try
        {
            value = std::stoi(port, &consumed);
        }
        catch (const std::logic_error &)
        {
            consumed = 0;
        }
        if (consumed == port.size() && value >= 1 && value <= 65535)
        {
            return value;
        }
        Logger::warn("PocoConfigManager: ignoring invalid PORT value: " + port);
    }
    return getInt("server.port", 8000);
}

int PocoConfigManager::getServerThreads() const
{
    return std::max(1, getInt("server.threads", 64));
}

std::string PocoConfigManager::getLogLevel() const
{
    return envOr("LOG_LEVEL", getString("log_level", "INFO"));
}

std::string PocoConfigManager::getDownloadRoot() const
{
    return envOr("DOWNLOAD_ROOT", getString("download_root", "/tmp/downloads"));
}

std::string PocoConfigManager::getDatabasePath() const
{
    return getString("database.path", "media_server.db");
}

int PocoConfigManager::getRetentionMaxAgeHours() const
{
    return getInt("retention.max_age_hours", 0);
}

int PocoConfigManager::getRetentionSweepIntervalSeconds() const
{
    return std::max(1, getInt("retention.sweep_interval_seconds", 3600));
}

int PocoConfigManager::getHistoryDefaultLimit() const
{
    return getInt("history.default_limit", 20);
}

std::string PocoConfigManager::getFetchBinary() const
{
    return getString("tools.fetch_binary", "yt-dlp");
}

std::string PocoConfigManager::getTranscodeBinary() const
{
    return getString("tools.transcode_binary", "ffmpeg");
}

std::string PocoConfigManager::getProbeBinary() const
{
    return getString("tools.probe_binary", "ffprobe");
}

std::string PocoConfigManager::getFfmpegLocation() const
{
    return envOr("FFMPEG_PATH", getString("tools.ffmpeg_location", ""));
}

bool PocoConfigManager::isSponsorBlockEnabled() const
{
    if (Poco::Environment::has("ENABLE_SPONSORBLOCK"))
    {
        return toLower(Poco::Environment::get("ENABLE_SPONSORBLOCK")) == "true";
    }
    return getBool("sponsorblock.enabled", false);
}

std::string PocoConfigManager::getSponsorBlockCategories() const
{
    return getString("sponsorblock.categories", "sponsor,intro,outro");
}

FetchToolOptions PocoConfigManager::getFetchToolOptions() const
{
    FetchToolOptions options;
    options.tool_binary = getFetchBinary();
    options.ffmpeg_location = getFfmpegLocation();
    options.sponsorblock_enabled = isSponsorBlockEnabled();
    options.sponsorblock_categories = getSponsorBlockCategories();
    return options;
}

void PocoConfigManager::startWatching(const std::string &file_path, int interval_seconds)
{
    if (watching_.load())
        return;

    watched_file_path_ = file_path;
    watch_interval_seconds_ = std::max(1, interval_seconds);

    std::error_code ec;
    last_write_time_ = std::filesystem::last_write_time(watched_file_path_, ec);
    if (ec)
    {
        Logger::warn("PocoConfigManager: cannot stat " + watched_file_path_ + ": " + ec.message());
        last_write_time_ = std::filesystem::file_time_type{};
    }

    watching_.store(true);
    watcher_thread_ = std::thread(&PocoConfigManager::watchLoop, this);
}

void PocoConfigManager::stopWatching()
{
    if (!watching_.load())
        return;

    {
        std::lock_guard<std::mutex> lock(watch_mutex_);
        watching_.store(false);
    }
    watch_cv_.notify_all();
    if (watcher_thread_.joinable())
        watcher_thread_.join();
}

void PocoConfigManager::watchLoop()
{
    Logger::info("PocoConfigManager: watching configuration file " + watched_file_path_);
    while (watching_.load())
    {
        std::error_code ec;
        auto current = std::filesystem::last_write_time(watched_file_path_, ec);
        if (!ec && current != last_write_time_)
        {
            Logger::info("PocoConfigManager: detected change in configuration file, reloading");
            nlohmann::json before = getAll();
            if (load(watched_file_path_))
            {
                last_write_time_ = current;
                try
                {
                    publishChanges(before, getAll(), "file_observer");
                }
                catch (const std::exception &e)
                {
                    Logger::warn(std::string("PocoConfigManager: config watcher error: ") + e.what());
                }
            }
            else
            {
                Logger::warn("PocoConfigManager: failed to reload configuration from file");
            }
        }

        std::unique_lock<std::mutex> lock(watch_mutex_);
        watch_cv_.wait_for(lock, std::chrono::seconds(watch_interval_seconds_), [this]
                           { return !watching_.load(); });
    }
    Logger::info("PocoConfigManager: configuration file watcher stopped");
}

void PocoConfigManager::subscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.push_back(observer);
    Logger::debug("PocoConfigManager: observer subscribed");
}

void PocoConfigManager::unsubscribe(ConfigObserver *observer)
{
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
    Logger::debug("PocoConfigManager: observer unsubscribed");
}

void PocoConfigManager::publishChanges(const nlohmann::json &before, const nlohmann::json &after, const std::string &source)
{
    ConfigUpdateEvent event;
    event.changed_keys = changedKeys(before, after);
    if (event.changed_keys.empty())
        return;
    event.source = source;
    event.update_id = Poco::UUIDGenerator::defaultGenerator().createRandom().toString();

    std::vector<ConfigObserver *> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers = observers_;
    }
    for (auto *observer : observers)
    {
        try
        {
            observer->onConfigUpdate(event);
        }
        catch (const std::exception &e)
        {
            Logger::error("PocoConfigManager: observer failed to handle update: " + std::string(e.what()));
        }
    }
}

std::vector<std::string> PocoConfigManager::changedKeys(const nlohmann::json &before, const nlohmann::json &after)
{
    std::vector<std::string> keys;
    for (auto it = after.begin(); it != after.end(); ++it)
    {
        if (!before.contains(it.key()) || before.at(it.key()) != it.value())
            keys.push_back(it.key());
    }
    for (auto it = before.begin(); it != before.end(); ++it)
    {
        if (!after.contains(it.key()))
            keys.push_back(it.key());
    }
    return keys;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");
    cfg_->setString("download_root", "/tmp/downloads");

    cfg_->setString("server.host", "0.0.0.0");
    cfg_->setInt("server.port", 8000);
    cfg_->setInt("server.threads", 64);

    cfg_->setString("database.path", "media_server.db");

    cfg_->setString("tools.fetch_binary", "yt-dlp");
    cfg_->setString("tools.transcode_binary", "ffmpeg");
    cfg_->setString("tools.probe_binary", "ffprobe");
    cfg_->setString("tools.ffmpeg_location", "");

    cfg_->setBool("sponsorblock.enabled", false);
    cfg_->setString("sponsorblock.categories", "sponsor,intro,outro");

    cfg_->setInt("retention.max_age_hours", 0);
    cfg_->setInt("retention.sweep_interval_seconds", 3600);

    cfg_->setInt("history.default_limit", 20);
}

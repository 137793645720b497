#pragma once

#include "core/config_observer.hpp"
#include "core/fetch_invocation_builder.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Process-wide configuration backed by a Poco JSONConfiguration
 *
 * Built-in defaults are loaded at construction and replaced wholesale by
 * load(). Typed getters fall back to the same defaults for missing keys.
 * Deployment settings that the service historically took from the
 * environment (DOWNLOAD_ROOT, FFMPEG_PATH, ENABLE_SPONSORBLOCK, PORT,
 * LOG_LEVEL) override the file when set.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    ~PocoConfigManager();

    bool load(const std::string &path);
    bool save(const std::string &path) const;

    nlohmann::json getAll() const;

    /**
     * @brief Merge a (possibly nested) JSON object into the configuration
     *
     * Observers are notified with the top-level keys whose value changed.
     */
    void update(const nlohmann::json &patch);

    // Restore the built-in defaults
    void resetToDefaults();

    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;

    // Server
    std::string getServerHost() const;
    int getServerPort() const;
    int getServerThreads() const;
    std::string getLogLevel() const;

    // Storage
    std::string getDownloadRoot() const;
    std::string getDatabasePath() const;
    int getRetentionMaxAgeHours() const;
    int getRetentionSweepIntervalSeconds() const;
    int getHistoryDefaultLimit() const;

    // External tools
    std::string getFetchBinary() const;
    std::string getTranscodeBinary() const;
    std::string getProbeBinary() const;
    std::string getFfmpegLocation() const;
    bool isSponsorBlockEnabled() const;
    std::string getSponsorBlockCategories() const;

    /**
     * @brief Fetch tool switches resolved from configuration and environment
     */
    FetchToolOptions getFetchToolOptions() const;

    // Runtime config file watching
    void startWatching(const std::string &file_path = "config.json", int interval_seconds = 2);
    void stopWatching();
    bool isWatching() const { return watching_.load(); }

    void subscribe(ConfigObserver *observer);
    void unsubscribe(ConfigObserver *observer);

private:
    PocoConfigManager();
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();
    void watchLoop();
    void publishChanges(const nlohmann::json &before, const nlohmann::json &after, const std::string &source);

    static std::vector<std::string> changedKeys(const nlohmann::json &before, const nlohmann::json &after);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    mutable std::mutex observers_mutex_;
    std::vector<ConfigObserver *> observers_;

    std::atomic<bool> watching_{false};
    std::thread watcher_thread_;
    std::mutex watch_mutex_;
    std::condition_variable watch_cv_;
    std::string watched_file_path_;
    int watch_interval_seconds_{2};
    std::filesystem::file_time_type last_write_time_{};
};

#include "core/workspace_janitor.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>

WorkspaceJanitor::WorkspaceJanitor(SessionWorkspaceManager &workspaces,
                                   std::chrono::seconds max_age,
                                   std::chrono::seconds sweep_interval)
    : workspaces_(workspaces),
      max_age_seconds_(std::max<long long>(0, max_age.count())),
      sweep_interval_seconds_(std::max<long long>(1, sweep_interval.count()))
{
}

WorkspaceJanitor::~WorkspaceJanitor()
{
    stop();
}

void WorkspaceJanitor::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load())
    {
        Logger::warn("WorkspaceJanitor: already running");
        return;
    }

    running_.store(true);
    sweep_thread_ = std::thread(&WorkspaceJanitor::sweepLoop, this);
    Logger::info("WorkspaceJanitor: started (max age " + std::to_string(max_age_seconds_.load()) +
                 "s, sweep every " + std::to_string(sweep_interval_seconds_.load()) + "s)");
}

void WorkspaceJanitor::stop()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.load())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (sweep_thread_.joinable())
    {
        sweep_thread_.join();
    }
    Logger::info("WorkspaceJanitor: stopped");
}

size_t WorkspaceJanitor::evictOlderThan(std::chrono::seconds max_age)
{
    auto cutoff = std::filesystem::file_time_type::clock::now() - max_age;
    size_t removed = 0;

    for (const auto &entry : workspaces_.listSessions())
    {
        if (entry.last_modified >= cutoff)
        {
            continue;
        }
        if (workspaces_.isActive(entry.id))
        {
            Logger::debug("WorkspaceJanitor: skipping session " + entry.id + ", fetch still running");
            continue;
        }
        try
        {
            if (workspaces_.removeSession(entry.id))
            {
                ++removed;
                Logger::debug("WorkspaceJanitor: removed expired session " + entry.id);
            }
        }
        catch (const std::exception &e)
        {
            Logger::warn("WorkspaceJanitor: failed to remove session " + entry.id + ": " + e.what());
        }
    }

    if (removed > 0)
    {
        Logger::info("WorkspaceJanitor: evicted " + std::to_string(removed) + " expired session(s)");
    }
    return removed;
}

size_t WorkspaceJanitor::sweep()
{
    long long max_age = max_age_seconds_.load();
    if (max_age <= 0)
    {
        return 0;
    }
    return evictOlderThan(std::chrono::seconds(max_age));
}

void WorkspaceJanitor::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("retention"))
    {
        return;
    }

    auto &config = PocoConfigManager::getInstance();
    long long max_age = static_cast<long long>(std::max(0, config.getRetentionMaxAgeHours())) * 3600;
    max_age_seconds_.store(max_age);
    sweep_interval_seconds_.store(config.getRetentionSweepIntervalSeconds());
    Logger::info("WorkspaceJanitor: retention changed to " + std::to_string(max_age) + "s");

    if (max_age > 0 && !running_.load())
    {
        start();
    }
    else if (max_age == 0 && running_.load())
    {
        stop();
    }
}

void WorkspaceJanitor::sweepLoop()
{
    while (running_.load())
    {
        try
        {
            sweep();
        }
        catch (const std::exception &e)
        {
            Logger::error("WorkspaceJanitor: sweep failed: " + std::string(e.what()));
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(sweep_interval_seconds_.load()), [this]
                     { return !running_.load(); });
    }
}

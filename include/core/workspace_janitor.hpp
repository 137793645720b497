#pragma once

#include "core/config_observer.hpp"
#include "core/session_workspace.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

/**
 * @brief Periodically deletes session workspaces older than a retention limit
 *
 * Only UUID-named directories under the workspace root are considered.
 * A max age of zero disables eviction. Observes the "retention" section of
 * the configuration and starts or stops itself accordingly.
 */
class WorkspaceJanitor : public ConfigObserver
{
public:
    WorkspaceJanitor(SessionWorkspaceManager &workspaces,
                     std::chrono::seconds max_age,
                     std::chrono::seconds sweep_interval);
    ~WorkspaceJanitor() override;

    void start();
    void stop();
    bool isRunning() const { return running_.load(); }

    /**
     * @brief Delete every session whose last modification is older than max_age
     * @return Number of sessions removed
     */
    size_t evictOlderThan(std::chrono::seconds max_age);

    // One sweep with the configured max age; no-op when disabled
    size_t sweep();

    std::chrono::seconds maxAge() const { return std::chrono::seconds(max_age_seconds_.load()); }
    std::chrono::seconds sweepInterval() const { return std::chrono::seconds(sweep_interval_seconds_.load()); }

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

private:
    void sweepLoop();

    SessionWorkspaceManager &workspaces_;
    std::atomic<long long> max_age_seconds_;
    std::atomic<long long> sweep_interval_seconds_;

    std::atomic<bool> running_{false};
    std::thread sweep_thread_;
    std::mutex mutex_;
    std::mutex lifecycle_mutex_;
    std::condition_variable cv_;
};

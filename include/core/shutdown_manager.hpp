#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>
#include <string>
#include <thread>

/**
 * Process-wide shutdown coordination.
 * - SIGINT/SIGTERM/SIGQUIT set async-signal-safe flags; a watcher thread
 *   turns them into a shutdown request
 * - SIGPIPE is ignored so a client hanging up mid-download only fails that write
 * - main() blocks in waitForShutdown() while the server runs
 */
class ShutdownManager
{
public:
    static ShutdownManager &getInstance();

    void installSignalHandlers();

    // Safe from any thread, not from a signal handler
    void requestShutdown(const std::string &reason, int signal_number = 0) noexcept;

    bool isShutdownRequested() const noexcept { return shutdown_requested_.load(); }

    void waitForShutdown();

    /**
     * @brief Wait at most timeout for a shutdown request
     * @return true if shutdown was requested
     */
    bool waitForShutdown(std::chrono::milliseconds timeout);

    int getSignalNumber() const noexcept { return last_signal_.load(); }
    std::string getReason() const;

    // Reset state for testing purposes
    void reset() noexcept;

private:
    ShutdownManager() = default;
    ~ShutdownManager();
    ShutdownManager(const ShutdownManager &) = delete;
    ShutdownManager &operator=(const ShutdownManager &) = delete;

    static void handleSignal(int sig) noexcept;

    void startWatcher();
    void stopWatcher();

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_in_progress_{false};
    std::atomic<int> last_signal_{0};
    std::string reason_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::thread watcher_;
    std::atomic<bool> watcher_running_{false};

    static volatile sig_atomic_t signal_flag_;
    static volatile sig_atomic_t signal_num_;
};

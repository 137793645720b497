#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <cstring>

volatile sig_atomic_t ShutdownManager::signal_flag_ = 0;
volatile sig_atomic_t ShutdownManager::signal_num_ = 0;

ShutdownManager &ShutdownManager::getInstance()
{
    static ShutdownManager instance;
    return instance;
}

ShutdownManager::~ShutdownManager()
{
    stopWatcher();
}

void ShutdownManager::installSignalHandlers()
{
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &ShutdownManager::handleSignal;
    sigemptyset(&action.sa_mask);

    for (int sig : {SIGINT, SIGTERM, SIGQUIT})
    {
        if (sigaction(sig, &action, nullptr) != 0)
        {
            Logger::warn("ShutdownManager: failed to install handler for signal " + std::to_string(sig) +
                         ": " + std::strerror(errno));
        }
    }

    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);

    startWatcher();
    Logger::info("ShutdownManager: signal handlers installed");
}

void ShutdownManager::handleSignal(int sig) noexcept
{
    signal_num_ = sig;
    signal_flag_ = 1;
}

void ShutdownManager::startWatcher()
{
    if (watcher_running_.exchange(true))
    {
        return;
    }
    if (watcher_.joinable())
    {
        watcher_.join();
    }
    watcher_ = std::thread([this]()
                           {
        while (watcher_running_.load())
        {
            if (signal_flag_)
            {
                int sig = signal_num_;
                signal_flag_ = 0;
                requestShutdown("Signal received", sig);
            }

            if (shutdown_requested_.load())
            {
                break;
            }

            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        } });
}

void ShutdownManager::stopWatcher()
{
    // requestShutdown() may already have cleared the flag; the thread still needs joining
    watcher_running_.store(false);
    if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id())
    {
        watcher_.join();
    }
}

void ShutdownManager::requestShutdown(const std::string &reason, int signal_number) noexcept
{
    if (shutdown_in_progress_.exchange(true))
    {
        return;
    }

    last_signal_.store(signal_number);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        reason_ = reason;
        shutdown_requested_.store(true);
    }
    cv_.notify_all();

    watcher_running_.store(false);

    if (signal_number != 0)
    {
        Logger::info("ShutdownManager: received signal " + std::to_string(signal_number) + ", initiating graceful shutdown");
    }
    else
    {
        Logger::info("ShutdownManager: shutdown requested - " + reason);
    }
}

void ShutdownManager::waitForShutdown()
{
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this]
             { return shutdown_requested_.load(); });
}

bool ShutdownManager::waitForShutdown(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [this]
                        { return shutdown_requested_.load(); });
}

std::string ShutdownManager::getReason() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return reason_;
}

void ShutdownManager::reset() noexcept
{
    stopWatcher();

    shutdown_requested_.store(false);
    shutdown_in_progress_.store(false);
    last_signal_.store(0);

    signal_flag_ = 0;
    signal_num_ = 0;

    std::lock_guard<std::mutex> lk(mutex_);
    reason_.clear();
}

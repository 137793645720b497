#pragma once

#include <httplib.h>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <string>
#include "config_observer.hpp"
#include "logging/logger.hpp"

/**
 * @brief Owns the HTTP server and its listener thread
 *
 * Requests are served by a fixed-size worker pool, which is the effective
 * bound on concurrent fetch/convert processes. Changes to the "server"
 * configuration section rebind the listener without restarting the process.
 */
class HttpServerManager : public ConfigObserver
{
public:
    static HttpServerManager &getInstance();

    /**
     * @brief Bind and start serving on a background thread
     * @param port 0 binds an ephemeral port (see getCurrentPort())
     * @return false if the address could not be bound
     */
    bool start(const std::string &host, int port, int worker_threads);
    void stop();
    bool isRunning() const;

    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    std::string getCurrentHost() const;
    int getCurrentPort() const;

    // Registers the application routes on every (re)created server
    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    /**
     * @brief Apply permissive CORS headers and the preflight handler
     */
    static void enableCors(httplib::Server &server);

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    bool startLocked(const std::string &host, int port, int worker_threads);
    void stopLocked();
    void serverThread();
    void setupRoutes();

    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};

    std::string current_host_;
    int current_port_;
    int worker_threads_;

    RouteSetupCallback route_setup_callback_;

    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};

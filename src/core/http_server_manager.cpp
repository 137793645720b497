#include "core/http_server_manager.hpp"
#include "core/poco_config_manager.hpp"
#include "web/openapi_docs.hpp"
#include "server_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>

HttpServerManager::HttpServerManager() : current_host_("0.0.0.0"), current_port_(8000), worker_threads_(64)
{
    Logger::debug("HttpServerManager: Initialized with default configuration");
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

bool HttpServerManager::start(const std::string &host, int port, int worker_threads)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stopLocked();
    }
    return startLocked(host, port, worker_threads);
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    stopLocked();
}

bool HttpServerManager::startLocked(const std::string &host, int port, int worker_threads)
{
    server_ = std::make_unique<httplib::Server>();

    size_t pool_size = static_cast<size_t>(std::max(1, worker_threads));
    server_->new_task_queue = [pool_size]
    { return new httplib::ThreadPool(pool_size); };

    setupRoutes();

    int bound_port = port;
    if (port == 0)
    {
        bound_port = server_->bind_to_any_port(host);
        if (bound_port < 0)
        {
            Logger::error("HttpServerManager: Failed to bind an ephemeral port on " + host);
            server_.reset();
            return false;
        }
    }
    else if (!server_->bind_to_port(host, port))
    {
        Logger::error("HttpServerManager: Failed to bind " + host + ":" + std::to_string(port));
        server_.reset();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        current_host_ = host;
        current_port_ = bound_port;
        worker_threads_ = static_cast<int>(pool_size);
    }

    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    // stop() is a no-op until the listener loop has entered
    for (int i = 0; i < 500 && running_.load() && !server_->is_running(); ++i)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    Logger::info("HttpServerManager: Server listening on " + ServerConfig::getServerUrl(host, bound_port) +
                 " with " + std::to_string(pool_size) + " worker threads");
    Logger::info("HttpServerManager: API documentation available at " +
                 ServerConfig::getServerUrl(host, bound_port) + ServerConfig::API_DOCS_PATH);
    return true;
}

void HttpServerManager::stopLocked()
{
    if (!server_)
    {
        return;
    }

    running_.store(false);
    server_->stop();

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    server_.reset();
    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::isRunning() const
{
    return running_.load();
}

std::string HttpServerManager::getCurrentHost() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_host_;
}

int HttpServerManager::getCurrentPort() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return current_port_;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (!event.touches("server"))
    {
        return;
    }

    auto &config = PocoConfigManager::getInstance();
    std::string new_host = config.getServerHost();
    int new_port = config.getServerPort();
    int new_threads = config.getServerThreads();

    std::lock_guard<std::mutex> lock(server_mutex_);
    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        if (new_host == current_host_ && new_port == current_port_ && new_threads == worker_threads_)
        {
            return;
        }
    }

    if (!running_.load())
    {
        Logger::info("HttpServerManager: Server not running, updating configuration for next start");
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = new_host;
        current_port_ = new_port;
        worker_threads_ = new_threads;
        return;
    }

    Logger::info("HttpServerManager: Reconfiguring server to " + new_host + ":" + std::to_string(new_port));
    stopLocked();
    if (!startLocked(new_host, new_port, new_threads))
    {
        Logger::error("HttpServerManager: Server reconfiguration failed, server is down");
    }
}

void HttpServerManager::serverThread()
{
    Logger::debug("HttpServerManager: Listener thread started");
    if (!server_->listen_after_bind())
    {
        Logger::warn("HttpServerManager: Listener exited with an error");
    }
    running_.store(false);
    Logger::debug("HttpServerManager: Listener thread completed");
}

void HttpServerManager::enableCors(httplib::Server &server)
{
    server.set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                {"Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS"},
                                {"Access-Control-Allow-Headers", "*"}});

    server.Options(R"(.*)", [](const httplib::Request &, httplib::Response &res)
                   { res.status = 204; });
}

void HttpServerManager::setupRoutes()
{
    enableCors(*server_);

    server_->Get(ServerConfig::SWAGGER_JSON_PATH, [](const httplib::Request &, httplib::Response &res)
                 { res.set_content(OpenApiDocs::getSpec(), "application/json"); });

    server_->Get(ServerConfig::API_DOCS_PATH, [](const httplib::Request &, httplib::Response &res)
                 { res.set_content(OpenApiDocs::getSwaggerUI(), "text/html"); });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                   {
        std::string detail = "Unknown error";
        try
        {
            if (ep)
                std::rethrow_exception(ep);
        }
        catch (const std::exception &e)
        {
            detail = e.what();
        }
        Logger::error("HttpServerManager: Unhandled error on " + req.method + " " + req.path + ": " + detail);
        res.status = 500;
        res.set_content(nlohmann::json{{"error", "InternalError"}, {"detail", detail}}.dump(), "application/json"); });

    if (route_setup_callback_)
    {
        route_setup_callback_(*server_);
    }
    else
    {
        Logger::warn("HttpServerManager: No route setup callback registered");
    }
}

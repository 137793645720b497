#include "core/artifact_locator.hpp"
#include "core/convert_invocation_builder.hpp"
#include "core/fetch_invocation_builder.hpp"
#include "core/http_server_manager.hpp"
#include "core/logger_observer.hpp"
#include "core/media_service.hpp"
#include "core/outcome_recorder.hpp"
#include "core/poco_config_manager.hpp"
#include "core/process_runner.hpp"
#include "core/session_workspace.hpp"
#include "core/shutdown_manager.hpp"
#include "core/workspace_janitor.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <httplib.h>
#include <iostream>
#include <memory>
#include <unistd.h>

static void printUsage(const char *program)
{
    std::cout << "Media Downloader & Converter API" << std::endl;
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config, -c <path>  Configuration file (default: config.json)" << std::endl;
    std::cout << "  --help, -h           Show this help message" << std::endl;
    std::cout << "Environment overrides: DOWNLOAD_ROOT, FFMPEG_PATH, ENABLE_SPONSORBLOCK, PORT, LOG_LEVEL" << std::endl;
}

static int runServer(const std::string &config_path)
{
    auto &config = PocoConfigManager::getInstance();
    bool config_loaded = config.load(config_path);

    Logger::init(config.getLogLevel());
    if (config_loaded)
        Logger::info("Configuration loaded from " + config_path);
    else
        Logger::info("No configuration file at " + config_path + ", using defaults");

    Logger::info("Starting media server (PID: " + std::to_string(getpid()) + ")...");

    LoggerObserver logger_observer;
    config.subscribe(&logger_observer);

    auto &db = DatabaseManager::getInstance(config.getDatabasePath());
    if (!db.isOpen())
    {
        Logger::warn("Database " + config.getDatabasePath() + " unavailable; history will not be recorded");
    }

    SessionWorkspaceManager workspaces(config.getDownloadRoot());
    FetchInvocationBuilder fetch_builder(config.getFetchToolOptions());
    ConvertInvocationBuilder convert_builder(config.getTranscodeBinary());
    ProcessRunner runner;
    ArtifactLocator locator;
    DatabaseOutcomeRecorder recorder(db);
    MediaService service(workspaces, fetch_builder, convert_builder, runner, locator, recorder, config.getProbeBinary());

    WorkspaceJanitor janitor(workspaces,
                             std::chrono::hours(std::max(0, config.getRetentionMaxAgeHours())),
                             std::chrono::seconds(config.getRetentionSweepIntervalSeconds()));
    config.subscribe(&janitor);
    if (config.getRetentionMaxAgeHours() > 0)
    {
        janitor.start();
    }
    else
    {
        Logger::info("Workspace retention disabled; session directories are kept");
    }

    int history_limit = config.getHistoryDefaultLimit();
    auto &server = HttpServerManager::getInstance();
    server.setRouteSetupCallback([&](httplib::Server &svr)
                                 { RouteHandlers::setupRoutes(svr, service, db, workspaces, history_limit); });
    config.subscribe(&server);

    int exit_code = 0;
    if (server.start(config.getServerHost(), config.getServerPort(), config.getServerThreads()))
    {
        if (config_loaded)
        {
            config.startWatching(config_path);
        }
        ShutdownManager::getInstance().waitForShutdown();
        Logger::info("Shutting down: " + ShutdownManager::getInstance().getReason());
    }
    else
    {
        Logger::error("Failed to start HTTP server");
        exit_code = 1;
    }

    config.stopWatching();
    config.unsubscribe(&server);
    config.unsubscribe(&janitor);
    config.unsubscribe(&logger_observer);

    server.stop();
    janitor.stop();
    DatabaseManager::shutdown();

    Logger::info("Media server stopped");
    return exit_code;
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    ShutdownManager::getInstance().installSignalHandlers();

    try
    {
        return runServer(config_path);
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        DatabaseManager::shutdown();
        return 1;
    }
}

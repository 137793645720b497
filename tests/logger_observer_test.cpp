#include "test_base.hpp"
#include "core/logger_observer.hpp"
#include <spdlog/spdlog.h>

class LoggerObserverTest : public TestBase
{
protected:
    static spdlog::level::level_enum currentLevel()
    {
        return spdlog::get("media_server")->level();
    }

    void TearDown() override
    {
        Logger::setLevel("INFO");
        TestBase::TearDown();
    }
};

TEST_F(LoggerObserverTest, LogLevelUpdateIsApplied)
{
    auto &config = PocoConfigManager::getInstance();
    Logger::setLevel("INFO");
    LoggerObserver observer;
    config.subscribe(&observer);

    config.update({{"log_level", "DEBUG"}});
    EXPECT_EQ(currentLevel(), spdlog::level::debug);

    config.update({{"log_level", "ERROR"}});
    EXPECT_EQ(currentLevel(), spdlog::level::err);

    config.unsubscribe(&observer);
}

TEST_F(LoggerObserverTest, UnknownLevelFallsBackToInfo)
{
    Logger::setLevel("DEBUG");
    LoggerObserver observer;
    PocoConfigManager::getInstance().update({{"log_level", "LOUD"}});

    ConfigUpdateEvent event;
    event.changed_keys = {"log_level"};
    event.source = "api";
    observer.onConfigUpdate(event);

    EXPECT_EQ(currentLevel(), spdlog::level::info);
}

TEST_F(LoggerObserverTest, OtherSectionsLeaveLevelAlone)
{
    Logger::setLevel("WARN");
    LoggerObserver observer;

    ConfigUpdateEvent event;
    event.changed_keys = {"server"};
    observer.onConfigUpdate(event);

    EXPECT_EQ(currentLevel(), spdlog::level::warn);
}

#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include <csignal>
#include "core/shutdown_manager.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownUnblocksWait)
{
    auto &mgr = ShutdownManager::getInstance();

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        mgr.waitForShutdown();
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), 0);
}

TEST_F(ShutdownManagerTest, RequestRecordsSignalAndReason)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("test-signal", SIGTERM);

    ASSERT_TRUE(mgr.isShutdownRequested());
    ASSERT_EQ(mgr.getSignalNumber(), SIGTERM);
    ASSERT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, FirstRequestWins)
{
    auto &mgr = ShutdownManager::getInstance();

    mgr.requestShutdown("first", SIGINT);
    mgr.requestShutdown("second", SIGTERM);

    EXPECT_EQ(mgr.getReason(), "first");
    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);
}

TEST_F(ShutdownManagerTest, TimedWaitExpiresWithoutRequest)
{
    auto &mgr = ShutdownManager::getInstance();
    EXPECT_FALSE(mgr.waitForShutdown(std::chrono::milliseconds(50)));
}

TEST_F(ShutdownManagerTest, TimedWaitReturnsOnceRequested)
{
    auto &mgr = ShutdownManager::getInstance();
    std::thread requester([&]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        mgr.requestShutdown("timed"); });

    EXPECT_TRUE(mgr.waitForShutdown(std::chrono::seconds(5)));
    requester.join();
}

TEST_F(ShutdownManagerTest, ResetClearsState)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("before-reset", SIGQUIT);
    mgr.reset();

    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_TRUE(mgr.getReason().empty());
}

TEST_F(ShutdownManagerTest, SignalDeliveryRequestsShutdown)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.installSignalHandlers();

    std::raise(SIGTERM);

    EXPECT_TRUE(mgr.waitForShutdown(std::chrono::seconds(5)));
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
    EXPECT_EQ(mgr.getReason(), "Signal received");
}

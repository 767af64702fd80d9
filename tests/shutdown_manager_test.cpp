#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include <csignal>
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"

class ShutdownManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("ERROR");
        ShutdownManager::getInstance().reset();
    }

    void TearDown() override
    {
        ShutdownManager::getInstance().reset();
    }
};

TEST_F(ShutdownManagerTest, ProgrammaticShutdownCancelsWatchedTokens)
{
    auto &mgr = ShutdownManager::getInstance();
    auto root = CancellationToken::create();
    auto child = CancellationToken::childOf(root);
    mgr.watch(root);

    std::atomic<bool> unblocked{false};
    std::thread waiter([&]()
                       {
        child->waitFor(std::chrono::seconds(5));
        unblocked.store(true); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    mgr.requestShutdown("unit-test");

    waiter.join();
    ASSERT_TRUE(unblocked.load());
    EXPECT_TRUE(root->isCancelled());
    EXPECT_TRUE(child->isCancelled());
    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_EQ(mgr.getReason(), "unit-test");
}

TEST_F(ShutdownManagerTest, SignalNumberAndReasonAreRecorded)
{
    auto &mgr = ShutdownManager::getInstance();
    ASSERT_FALSE(mgr.isShutdownRequested());

    mgr.requestShutdown("test-signal", SIGTERM);

    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGTERM);
    EXPECT_EQ(mgr.getReason(), "test-signal");
}

TEST_F(ShutdownManagerTest, OnlyTheFirstRequestIsRecorded)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("first", SIGINT);
    mgr.requestShutdown("second", SIGTERM);

    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);
    EXPECT_EQ(mgr.getReason(), "first");
}

TEST_F(ShutdownManagerTest, LateWatchIsCancelledImmediately)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.requestShutdown("early");

    auto token = CancellationToken::create();
    mgr.watch(token);
    EXPECT_TRUE(token->isCancelled());

    // A null token is ignored
    mgr.watch(nullptr);
}

TEST_F(ShutdownManagerTest, ResetClearsStateAndWatchedTokens)
{
    auto &mgr = ShutdownManager::getInstance();
    auto stale = CancellationToken::create();
    mgr.watch(stale);
    mgr.reset();

    EXPECT_FALSE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), 0);
    EXPECT_TRUE(mgr.getReason().empty());

    mgr.requestShutdown("after-reset");
    EXPECT_FALSE(stale->isCancelled());
}

TEST_F(ShutdownManagerTest, DeliveredSignalIsTranslatedIntoCancellation)
{
    auto &mgr = ShutdownManager::getInstance();
    mgr.installSignalHandlers();

    auto token = CancellationToken::create();
    mgr.watch(token);

    std::raise(SIGINT);

    EXPECT_TRUE(token->waitFor(std::chrono::seconds(5)));
    EXPECT_TRUE(mgr.isShutdownRequested());
    EXPECT_EQ(mgr.getSignalNumber(), SIGINT);

    // The handler restored the default disposition; keep the test process alive
    std::signal(SIGINT, SIG_IGN);
}

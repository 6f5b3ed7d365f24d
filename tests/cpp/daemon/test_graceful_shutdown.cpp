#include "daemon/core/graceful_shutdown.h"
#include "daemon/core/shutdown_manager.h"

#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using daemon_core::SignalFlags;
using daemon_core::StopController;
using daemon_core::StopReason;

namespace {

class StopControllerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        flags.clear();
        controller.setStopHook([this](StopReason reason, const std::string& origin) {
            decisions.emplace_back(reason, origin);
        });
    }

    void raise(int sig) {
        flags.lastSignal = sig;
        if (sig == SIGHUP) {
            flags.hangup = 1;
        } else {
            flags.terminate = 1;
        }
    }

    SignalFlags flags;
    StopController controller{&flags};
    std::vector<std::pair<StopReason, std::string>> decisions;
};

}  // namespace

TEST_F(StopControllerTest, NothingPendingKeepsRunning) {
    EXPECT_EQ(controller.poll(), StopReason::None);
    EXPECT_FALSE(controller.stopping());
    EXPECT_TRUE(decisions.empty());
}

TEST_F(StopControllerTest, SigtermStopsOnceAndClearsFlags) {
    raise(SIGTERM);

    EXPECT_EQ(controller.poll(), StopReason::Shutdown);
    EXPECT_TRUE(controller.stopping());
    EXPECT_EQ(controller.origin(), "SIGTERM");
    EXPECT_EQ(flags.terminate, 0);

    // Later polls do not fire the hook again
    EXPECT_EQ(controller.poll(), StopReason::None);
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].first, StopReason::Shutdown);
}

TEST_F(StopControllerTest, SighupRequestsReload) {
    raise(SIGHUP);

    EXPECT_EQ(controller.poll(), StopReason::Reload);
    EXPECT_EQ(controller.reason(), StopReason::Reload);
    EXPECT_EQ(controller.origin(), "SIGHUP");
    EXPECT_EQ(flags.hangup, 0);
}

TEST_F(StopControllerTest, ShutdownWinsOverSimultaneousReload) {
    raise(SIGHUP);
    raise(SIGINT);

    EXPECT_EQ(controller.poll(), StopReason::Shutdown);
    EXPECT_EQ(controller.origin(), "SIGINT");
    EXPECT_EQ(flags.hangup, 0);
    EXPECT_EQ(controller.poll(), StopReason::None);
}

TEST_F(StopControllerTest, ShutdownUpgradesAnEarlierReload) {
    controller.requestReload("operator");
    EXPECT_EQ(controller.poll(), StopReason::Reload);

    raise(SIGTERM);
    EXPECT_EQ(controller.poll(), StopReason::Shutdown);
    EXPECT_EQ(controller.reason(), StopReason::Shutdown);
    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[1].second, "SIGTERM");
}

TEST_F(StopControllerTest, ReloadNeverDowngradesShutdown) {
    controller.requestShutdown("operator");
    controller.requestReload("operator");
    EXPECT_EQ(controller.poll(), StopReason::Shutdown);

    raise(SIGHUP);
    EXPECT_EQ(controller.poll(), StopReason::None);
    EXPECT_EQ(controller.reason(), StopReason::Shutdown);
}

TEST_F(StopControllerTest, OperatorRequestFromAnotherThread) {
    std::thread requester([this]() { controller.requestReload("operator"); });
    requester.join();

    EXPECT_EQ(controller.poll(), StopReason::Reload);
    EXPECT_EQ(controller.origin(), "operator");
}

TEST_F(StopControllerTest, RearmAllowsTheNextIterationToStop) {
    raise(SIGHUP);
    controller.poll();
    controller.rearm();
    EXPECT_FALSE(controller.stopping());
    EXPECT_EQ(controller.reason(), StopReason::None);

    raise(SIGTERM);
    EXPECT_EQ(controller.poll(), StopReason::Shutdown);
}

TEST_F(StopControllerTest, WithoutSignalFlagsOnlyRequestsCount) {
    StopController detached;
    EXPECT_EQ(detached.poll(), StopReason::None);
    detached.requestShutdown("test");
    EXPECT_EQ(detached.poll(), StopReason::Shutdown);
}

TEST(SignalHandler, SetsProcessFlags) {
    auto& flags = daemon_core::processSignalFlags();
    flags.clear();

    daemon_core::onSignal(SIGTERM);
    EXPECT_EQ(flags.terminate, 1);
    EXPECT_EQ(flags.hangup, 0);
    EXPECT_EQ(flags.lastSignal, SIGTERM);

    flags.clear();
    daemon_core::onSignal(SIGHUP);
    EXPECT_EQ(flags.terminate, 0);
    EXPECT_EQ(flags.hangup, 1);
    flags.clear();
}

TEST(StopReasonNames, AreStable) {
    EXPECT_STREQ(daemon_core::stopReasonName(StopReason::None), "none");
    EXPECT_STREQ(daemon_core::stopReasonName(StopReason::Shutdown), "shutdown");
    EXPECT_STREQ(daemon_core::stopReasonName(StopReason::Reload), "reload");
}

class ShutdownManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        daemon_core::processSignalFlags().clear();
    }
    void TearDown() override {
        daemon_core::processSignalFlags().clear();
    }
};

TEST_F(ShutdownManagerTest, TickStopsOnSignalAndBeginsDrain) {
    std::vector<StopReason> drains;
    daemon_core::ShutdownManager::Dependencies deps;
    deps.beginDrain = [&](StopReason reason) { drains.push_back(reason); };
    daemon_core::ShutdownManager manager(std::move(deps));

    EXPECT_TRUE(manager.tick());

    daemon_core::onSignal(SIGHUP);
    EXPECT_FALSE(manager.tick());
    EXPECT_TRUE(manager.reloadRequested());
    ASSERT_EQ(drains.size(), 1u);
    EXPECT_EQ(drains[0], StopReason::Reload);

    manager.rearm();
    EXPECT_TRUE(manager.tick());
    EXPECT_FALSE(manager.reloadRequested());
}

TEST_F(ShutdownManagerTest, OperatorShutdownEndsTheLoop) {
    daemon_core::ShutdownManager manager({});
    manager.controller().requestShutdown("operator");
    EXPECT_FALSE(manager.tick());
    EXPECT_FALSE(manager.reloadRequested());
}

TEST_F(ShutdownManagerTest, DrainWaitsForPendingOperationsOnce) {
    int polls = 0;
    daemon_core::ShutdownManager::Dependencies deps;
    deps.operationsPending = [&]() { return ++polls < 3; };
    deps.drainTimeout = std::chrono::milliseconds(2000);
    daemon_core::ShutdownManager manager(std::move(deps));

    EXPECT_TRUE(manager.drain());
    EXPECT_EQ(polls, 3);

    EXPECT_TRUE(manager.drain());
    EXPECT_EQ(polls, 3);

    manager.rearm();
    manager.drain();
    EXPECT_EQ(polls, 4);
}

TEST_F(ShutdownManagerTest, DrainGivesUpAfterTimeout) {
    daemon_core::ShutdownManager::Dependencies deps;
    deps.operationsPending = []() { return true; };
    deps.drainTimeout = std::chrono::milliseconds(60);
    daemon_core::ShutdownManager manager(std::move(deps));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(manager.drain());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

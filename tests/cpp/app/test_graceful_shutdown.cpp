#include "app/graceful_shutdown.h"

#include <gtest/gtest.h>

using namespace voxcap::app;

class GracefulShutdownTest : public ::testing::Test {
   protected:
    void SetUp() override {
        state_.reset();
        controller_.setSignalState(&state_);
        finalizeCalls_ = 0;
        quitCalls_ = 0;
        controller_.setFinalizeCallback([this]() { ++finalizeCalls_; });
        controller_.setQuitCallback([this]() { ++quitCalls_; });
    }

    SignalState state_;
    ShutdownController controller_;
    int finalizeCalls_ = 0;
    int quitCalls_ = 0;
};

// ========== Signal State Tests ==========

TEST_F(GracefulShutdownTest, SignalState_InitiallyZero) {
    SignalState s;
    EXPECT_EQ(s.shutdown, 0);
    EXPECT_EQ(s.received, 0);
}

TEST_F(GracefulShutdownTest, SignalState_Reset) {
    state_.shutdown = 1;
    state_.received = SIGINT;
    state_.reset();
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_EQ(state_.received, 0);
}

// ========== Controller Tests ==========

TEST_F(GracefulShutdownTest, Controller_InitialState) {
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_EQ(controller_.getLastSignal(), 0);
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_NoSignal_ReturnsFalse) {
    EXPECT_FALSE(controller_.processPendingSignals());
    EXPECT_TRUE(controller_.isRunning());
    EXPECT_EQ(finalizeCalls_, 0);
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_WithoutState_ReturnsFalse) {
    ShutdownController bare;
    EXPECT_FALSE(bare.processPendingSignals());
    EXPECT_TRUE(bare.isRunning());
}

TEST_F(GracefulShutdownTest, ProcessPendingSignals_SIGTERM_FinalizesAndQuits) {
    state_.shutdown = 1;
    state_.received = SIGTERM;

    EXPECT_TRUE(controller_.processPendingSignals());
    EXPECT_EQ(controller_.getLastSignal(), SIGTERM);
    EXPECT_EQ(state_.shutdown, 0);
    EXPECT_EQ(finalizeCalls_, 1);
    EXPECT_EQ(quitCalls_, 1);
    EXPECT_FALSE(controller_.isRunning());
}

TEST_F(GracefulShutdownTest, SecondSignal_DoesNotFinalizeTwice) {
    state_.shutdown = 1;
    state_.received = SIGINT;
    controller_.processPendingSignals();

    state_.shutdown = 1;
    state_.received = SIGTERM;
    EXPECT_TRUE(controller_.processPendingSignals());

    EXPECT_EQ(finalizeCalls_, 1);
    EXPECT_EQ(quitCalls_, 2);
    EXPECT_EQ(controller_.getLastSignal(), SIGTERM);
}

TEST_F(GracefulShutdownTest, RequestShutdown_FinalizesOnce) {
    controller_.requestShutdown();
    controller_.requestShutdown();

    EXPECT_EQ(finalizeCalls_, 1);
    EXPECT_FALSE(controller_.isRunning());
}

TEST_F(GracefulShutdownTest, SignalHandler_SetsGlobalFlags) {
    auto& global = getGlobalSignalState();
    global.reset();

    signalHandler(SIGINT);

    EXPECT_EQ(global.shutdown, 1);
    EXPECT_EQ(global.received, SIGINT);
    global.reset();
}

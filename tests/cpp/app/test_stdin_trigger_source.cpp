/**
 * @file test_stdin_trigger_source.cpp
 * @brief Command parsing and line reading for the stdin trigger source
 */

#include "app/graceful_shutdown.h"
#include "app/stdin_trigger_source.h"

#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

using namespace voxcap::app;
using Kind = TriggerCommand::Kind;
using voxcap::control::Intent;
using ms = std::chrono::milliseconds;

TEST(TriggerCommand, ParsesIntents) {
    auto cmd = parseTriggerCommand("  Start \n");
    EXPECT_EQ(cmd.kind, Kind::Intent);
    EXPECT_EQ(cmd.intent, Intent::Start);

    cmd = parseTriggerCommand("tap");
    EXPECT_EQ(cmd.kind, Kind::Intent);
    EXPECT_EQ(cmd.intent, Intent::CancelKeyPress);
}

TEST(TriggerCommand, ParsesLocalCommands) {
    EXPECT_EQ(parseTriggerCommand("listen   ON").kind, Kind::ListenOn);
    EXPECT_EQ(parseTriggerCommand("listen off").kind, Kind::ListenOff);
    EXPECT_EQ(parseTriggerCommand("status").kind, Kind::Status);
    EXPECT_EQ(parseTriggerCommand("?").kind, Kind::Help);
    EXPECT_EQ(parseTriggerCommand("exit").kind, Kind::Quit);
}

TEST(TriggerCommand, InternalIntentsAreNotTypable) {
    EXPECT_EQ(parseTriggerCommand("buffer_full").kind, Kind::Invalid);
    EXPECT_EQ(parseTriggerCommand("device_lost").kind, Kind::Invalid);
}

TEST(TriggerCommand, BlankLineIsInvalidWithEmptyText) {
    auto cmd = parseTriggerCommand("   \t ");
    EXPECT_EQ(cmd.kind, Kind::Invalid);
    EXPECT_TRUE(cmd.text.empty());
}

class StdinTriggerSourceTest : public ::testing::Test {
   protected:
    void SetUp() override {
        ASSERT_EQ(::pipe(fds_), 0);
    }
    void TearDown() override {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
        }
        closeWriter();
    }

    void write(const std::string& data) {
        ASSERT_EQ(::write(fds_[1], data.data(), data.size()),
                  static_cast<ssize_t>(data.size()));
    }
    void closeWriter() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

    int fds_[2] = {-1, -1};
};

TEST_F(StdinTriggerSourceTest, TimeoutWithoutInputKeepsOpen) {
    StdinTriggerSource source(fds_[0]);
    std::vector<std::string> lines;

    EXPECT_TRUE(source.poll(ms(10), lines));
    EXPECT_TRUE(lines.empty());
    EXPECT_FALSE(source.eof());
}

TEST_F(StdinTriggerSourceTest, SplitsCompleteLines) {
    StdinTriggerSource source(fds_[0]);
    std::vector<std::string> lines;
    write("start\nsto");

    ASSERT_TRUE(source.poll(ms(100), lines));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "start");

    write("p\n");
    ASSERT_TRUE(source.poll(ms(100), lines));
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "stop");
}

TEST_F(StdinTriggerSourceTest, EofFlushesPartialLine) {
    StdinTriggerSource source(fds_[0]);
    std::vector<std::string> lines;
    write("quit");
    closeWriter();

    // First poll reads the bytes, second sees EOF
    source.poll(ms(100), lines);
    EXPECT_FALSE(source.poll(ms(100), lines));
    EXPECT_TRUE(source.eof());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "quit");

    EXPECT_FALSE(source.poll(ms(10), lines));
}

TEST_F(StdinTriggerSourceTest, CloseIgnoresUnreadInput) {
    StdinTriggerSource source(fds_[0]);
    std::vector<std::string> lines;
    write("status\nstar");
    ASSERT_TRUE(source.poll(ms(100), lines));
    ASSERT_EQ(lines.size(), 1u);

    write("t\nstop\n");
    source.close();

    EXPECT_FALSE(source.poll(ms(10), lines));
    EXPECT_TRUE(source.eof());
    EXPECT_EQ(lines.size(), 1u);
}

TEST_F(StdinTriggerSourceTest, ShutdownQuitCallbackEndsInput) {
    StdinTriggerSource source(fds_[0]);
    voxcap::app::ShutdownController shutdown;
    shutdown.setQuitCallback([&source]() { source.close(); });
    std::vector<std::string> lines;
    write("cancel\n");

    shutdown.requestShutdown();

    EXPECT_FALSE(shutdown.isRunning());
    EXPECT_FALSE(source.poll(ms(10), lines));
    EXPECT_TRUE(lines.empty());
}

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>
#include "common/utils/signal_handler.hpp"

using namespace chatlive::utils;
using namespace std::chrono_literals;

class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& handler = SignalHandler::getInstance();
        handler.cleanup();
        handler.reset();
    }

    void TearDown() override {
        auto& handler = SignalHandler::getInstance();
        handler.cleanup();
        handler.reset();
    }
};

TEST_F(SignalHandlerTest, SignalNames) {
    EXPECT_EQ(SignalHandler::signalName(SIGINT), "SIGINT");
    EXPECT_EQ(SignalHandler::signalName(SIGTERM), "SIGTERM");
    EXPECT_EQ(SignalHandler::signalName(SIGQUIT), "SIGQUIT");
    EXPECT_EQ(SignalHandler::signalName(SIGHUP), "SIGHUP");
    EXPECT_EQ(SignalHandler::signalName(SIGUSR1), "SIG" + std::to_string(SIGUSR1));
}

TEST_F(SignalHandlerTest, GracefulShutdownRunsCallbackOnWaitingThread) {
    auto& handler = SignalHandler::getInstance();
    std::atomic<int> received{0};
    std::string name;
    std::thread::id callback_thread;

    ASSERT_TRUE(handler.registerGracefulShutdown([&](int signal, const std::string& signal_name) {
        received = signal;
        name = signal_name;
        callback_thread = std::this_thread::get_id();
    }));
    EXPECT_FALSE(handler.isShutdownRequested());

    std::raise(SIGTERM);
    EXPECT_TRUE(handler.isShutdownRequested());
    // Only recorded until someone waits
    EXPECT_EQ(received.load(), 0);

    handler.waitForShutdown();
    EXPECT_EQ(received.load(), SIGTERM);
    EXPECT_EQ(name, "SIGTERM");
    EXPECT_EQ(callback_thread, std::this_thread::get_id());
}

TEST_F(SignalHandlerTest, ThrowingCallbackDoesNotStopOthers) {
    auto& handler = SignalHandler::getInstance();
    bool second_called = false;
    handler.registerSignalHandler(SIGINT, [](int, const std::string&) {
        throw std::runtime_error("callback failure");
    });
    handler.registerSignalHandler(SIGINT, [&](int, const std::string&) { second_called = true; });

    std::raise(SIGINT);
    EXPECT_NO_THROW(handler.waitForShutdown());
    EXPECT_TRUE(second_called);
}

TEST_F(SignalHandlerTest, WaitBlocksUntilSignal) {
    auto& handler = SignalHandler::getInstance();
    handler.registerGracefulShutdown([](int, const std::string&) {});

    std::atomic<bool> returned{false};
    std::thread waiter([&] {
        handler.waitForShutdown();
        returned = true;
    });

    std::this_thread::sleep_for(200ms);
    EXPECT_FALSE(returned.load());

    std::raise(SIGQUIT);
    waiter.join();
    EXPECT_TRUE(returned.load());
}

TEST_F(SignalHandlerTest, ResetClearsRequest) {
    auto& handler = SignalHandler::getInstance();
    handler.registerGracefulShutdown([](int, const std::string&) {});
    std::raise(SIGINT);
    EXPECT_TRUE(handler.isShutdownRequested());

    handler.reset();
    EXPECT_FALSE(handler.isShutdownRequested());
}

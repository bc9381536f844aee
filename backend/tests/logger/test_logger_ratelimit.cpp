#include <gtest/gtest.h>
#include "common/Logger.h"
#include "helpers/FreshLoggerTest.h"

#include <chrono>
#include <thread>

using nocturna::backend::tests::FreshLoggerTest;
using namespace std::chrono_literals;

class LoggerRateLimit : public FreshLoggerTest {};

TEST_F(LoggerRateLimit, SuppressesWithinPeriodAndReleasesAfter) {
    start();
    logger().setLoggerLevel("RateLimit.Window", spdlog::level::off);
    EXPECT_TRUE(logger().warnRateLimited("RateLimit.Window", "window", 200ms, "first"));
    EXPECT_FALSE(logger().warnRateLimited("RateLimit.Window", "window", 200ms, "suppressed"));
    std::this_thread::sleep_for(250ms);
    EXPECT_TRUE(logger().warnRateLimited("RateLimit.Window", "window", 200ms, "after period"));
}

TEST_F(LoggerRateLimit, KeysAreIndependent) {
    start();
    EXPECT_TRUE(logger().warnRateLimited("RateLimit.Keys", "keys:a", 1h, "a"));
    EXPECT_TRUE(logger().warnRateLimited("RateLimit.Keys", "keys:b", 1h, "b"));
    EXPECT_FALSE(logger().warnRateLimited("RateLimit.Keys", "keys:a", 1h, "a again"));
}

TEST_F(LoggerRateLimit, LimiterRunsWithoutInitialization) {
    EXPECT_TRUE(logger().warnRateLimited("RateLimit.Silent", "silent", 1h, "dropped"));
    EXPECT_FALSE(logger().warnRateLimited("RateLimit.Silent", "silent", 1h, "dropped again"));
    EXPECT_EQ(logger().tryGet("RateLimit.Silent"), nullptr);
}

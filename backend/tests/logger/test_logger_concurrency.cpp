#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include "common/Logger.h"
#include "helpers/FreshLoggerTest.h"

using nocturna::backend::tests::FreshLoggerTest;

class LoggerConcurrency : public FreshLoggerTest {};

TEST_F(LoggerConcurrency, ParallelGetYieldsOneLoggerPerName) {
    start(spdlog::level::off);
    constexpr int Threads = 8;
    constexpr int Iter = 500;
    std::vector<std::vector<spdlog::logger*>> seen(Threads);

    std::vector<std::thread> ts;
    for (int t = 0; t < Threads; ++t) {
        ts.emplace_back([&, t]() {
            for (int i = 0; i < Iter; ++i) {
                auto lg = logger().get("Conc.Shared." + std::to_string(i % 4));
                if (i < 4) seen[t].push_back(lg.get());
                lg->debug("suppressed {}", i);
            }
        });
    }
    for (auto& th : ts) th.join();

    for (int t = 1; t < Threads; ++t) EXPECT_EQ(seen[t], seen[0]);
}

TEST_F(LoggerConcurrency, RateLimitedWarningPassesOnceAcrossThreads) {
    start();
    logger().setLoggerLevel("Conc.Outage", spdlog::level::off);
    constexpr int Threads = 8;
    constexpr int Iter = 200;
    std::atomic<int> emitted{0};

    std::vector<std::thread> ts;
    for (int t = 0; t < Threads; ++t) {
        ts.emplace_back([&]() {
            for (int i = 0; i < Iter; ++i) {
                if (logger().warnRateLimited("Conc.Outage", "conc:outage", std::chrono::hours(1), "gateway down")) {
                    emitted++;
                }
            }
        });
    }
    for (auto& th : ts) th.join();

    EXPECT_EQ(emitted.load(), 1);
}

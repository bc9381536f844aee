#pragma once
#include <gtest/gtest.h>
#include <string>

#include "common/Logger.h"
#include "helpers/EnvVarGuard.h"

namespace nocturna { namespace backend { namespace tests {

// Each test starts with logging shut down and the NOCTURNA_LOG_* variables
// cleared, and leaves logging shut down again. Tests set their own variables
// before calling start().
class FreshLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Logger::instance().shutdown();
        env_ = EnvVarGuard({{"NOCTURNA_LOG_LEVEL", nullptr},
                            {"NOCTURNA_LOG_QUEUE_SIZE", nullptr},
                            {"NOCTURNA_LOG_WORKERS", nullptr}});
    }
    void TearDown() override { common::Logger::instance().shutdown(); }

    void start(spdlog::level::level_enum level = spdlog::level::info) {
        common::Logger::instance().initialize("logs/test/logger/" + logFileName() + ".log", level);
        ASSERT_TRUE(common::Logger::instance().isInitialized());
    }

    common::Logger& logger() { return common::Logger::instance(); }

private:
    static std::string logFileName() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        return info ? std::string(info->test_suite_name()) : std::string("logger");
    }

    EnvVarGuard env_;
};

}}} // namespace nocturna::backend::tests

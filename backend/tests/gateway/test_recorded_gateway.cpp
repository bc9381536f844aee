#include <gtest/gtest.h>

#include "gateway/RecordedMeasurementGateway.h"
#include "common/Errors.h"

#include <filesystem>
#include <fstream>

using namespace nocturna::backend;
using gateway::RecordedMeasurementGateway;

namespace {
class RecordedGatewayFixture : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("nocturna_recording_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                 ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".csv");
        std::ofstream out(path_);
        out << "lat,lng,year,value,quality,source\n"
            << "# Boulder station\n"
            << "40.0150,-105.2705,2020,18.0,high,sqm\n"
            << "40.0150,-105.2705,2021,18.4,high,sqm\n"
            << "40.0150,-105.2705,2021,18.8,medium,sqm\n"
            << "40.0150,-105.2705,2022,19.1,high,sqm\n"
            << "\n"
            << "41.0000,-106.0000,2022,2.5,low,viirs\n"
            << "not,a,valid,line\n"
            << "41.5,-106.5,2022,3.0,excellent,viirs\n";
    }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    std::filesystem::path path_;
};
}

TEST_F(RecordedGatewayFixture, LoadsAndCountsSkippedLines) {
    RecordedMeasurementGateway gw(path_.string());
    ASSERT_TRUE(gw.load());
    EXPECT_TRUE(gw.isDataLoaded());
    EXPECT_EQ(gw.getRecordCount(), 5u);
    EXPECT_EQ(gw.getSkippedLineCount(), 2u);
}

TEST_F(RecordedGatewayFixture, PointSnapsToNearestStationLatestYear) {
    RecordedMeasurementGateway gw(path_.string());
    ASSERT_TRUE(gw.load());
    auto m = gw.fetchPoint(40.02, -105.27);
    ASSERT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ(m->value, 19.1);
    EXPECT_EQ(m->quality, common::QualityTag::High);
    EXPECT_EQ(m->sourceLabel, "sqm");
    EXPECT_FALSE(gw.fetchPoint(10.0, 10.0).has_value());
}

TEST_F(RecordedGatewayFixture, SeriesAveragesDuplicateYears) {
    RecordedMeasurementGateway gw(path_.string());
    ASSERT_TRUE(gw.load());
    auto s = gw.fetchSeries(40.015, -105.2705, 2020, 2022);
    ASSERT_EQ(s.size(), 3u);
    EXPECT_NEAR(s[1].value, 18.6, 1e-12);
    auto clipped = gw.fetchSeries(40.015, -105.2705, 2021, 2021);
    EXPECT_EQ(clipped.size(), 1u);
    EXPECT_TRUE(gw.fetchSeries(0.0, 0.0, 2020, 2022).empty());
    EXPECT_THROW(gw.fetchSeries(40.015, -105.2705, 2022, 2020), common::InvalidRequestError);
}

TEST_F(RecordedGatewayFixture, UnloadedGatewayIsUnavailable) {
    RecordedMeasurementGateway gw(path_.string());
    EXPECT_THROW(gw.fetchPoint(40.0, -105.0), common::GatewayUnavailableError);
}

TEST(RecordedGatewayTest, MissingFileFailsToLoad) {
    RecordedMeasurementGateway gw("/nonexistent/nocturna/recording.csv");
    EXPECT_FALSE(gw.load());
    EXPECT_FALSE(gw.isDataLoaded());
}

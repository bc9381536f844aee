#include <gtest/gtest.h>

#include "gateway/SyntheticMeasurementGateway.h"
#include "common/Errors.h"

using namespace nocturna::backend;
using gateway::SyntheticMeasurementGateway;

TEST(SyntheticGatewayTest, BrightestAtGlowCenter) {
    SyntheticMeasurementGateway gw(SyntheticMeasurementGateway::Config{});
    auto center = gw.fetchPoint(40.0, -105.0);
    auto far = gw.fetchPoint(45.0, -100.0);
    ASSERT_TRUE(center && far);
    EXPECT_NEAR(center->value, 40.5, 1e-9);
    EXPECT_NEAR(far->value, 0.5, 1e-6);
    EXPECT_EQ(center->quality, common::QualityTag::High);
    EXPECT_EQ(far->quality, common::QualityTag::Low);
    EXPECT_EQ(center->sourceLabel, "Synthetic_0");
}

TEST(SyntheticGatewayTest, DeterministicValues) {
    SyntheticMeasurementGateway a(SyntheticMeasurementGateway::Config{});
    SyntheticMeasurementGateway b(SyntheticMeasurementGateway::Config{});
    EXPECT_EQ(a.fetchPoint(40.1, -105.2)->value, b.fetchPoint(40.1, -105.2)->value);
    EXPECT_DOUBLE_EQ(a.fetchPoint(40.1, -105.2)->value, a.radianceAt(40.1, -105.2, 2023));
}

TEST(SyntheticGatewayTest, SeriesGrowsWithConfiguredRate) {
    SyntheticMeasurementGateway gw(SyntheticMeasurementGateway::Config{});
    auto series = gw.fetchSeries(40.0, -105.0, 2020, 2023);
    ASSERT_EQ(series.size(), 4u);
    EXPECT_EQ(series.front().year, 2020);
    EXPECT_NEAR(series.back().value, 40.5, 1e-9);
    for (std::size_t i = 1; i < series.size(); ++i) EXPECT_GT(series[i].value, series[i - 1].value);
    EXPECT_THROW(gw.fetchSeries(40.0, -105.0, 2023, 2020), common::InvalidRequestError);
}

TEST(SyntheticGatewayTest, FaultInjection) {
    SyntheticMeasurementGateway gw(SyntheticMeasurementGateway::Config{});
    SyntheticMeasurementGateway::FaultInjectionConfig fic;
    fic.missingEveryN = 3;
    gw.configureFaultInjection(fic);
    int missing = 0;
    for (int i = 0; i < 9; ++i) {
        if (!gw.fetchPoint(40.0, -105.0)) ++missing;
    }
    EXPECT_EQ(missing, 3);
    auto st = gw.stats();
    EXPECT_EQ(st.calls, 9u);
    EXPECT_EQ(st.missing, 3u);
    EXPECT_EQ(st.served, 6u);

    fic = {};
    fic.offline = true;
    gw.configureFaultInjection(fic);
    EXPECT_THROW(gw.fetchPoint(40.0, -105.0), common::GatewayUnavailableError);
    EXPECT_THROW(gw.fetchSeries(40.0, -105.0, 2020, 2021), common::GatewayUnavailableError);
}

TEST(SyntheticGatewayTest, CycleComponentShowsInSeries) {
    SyntheticMeasurementGateway::Config cfg;
    cfg.annualGrowth = 0.0;
    cfg.cycleAmplitude = 2.0;
    cfg.cyclePeriod = 4;
    SyntheticMeasurementGateway gw(cfg);
    auto series = gw.fetchSeries(40.0, -105.0, 2023, 2027);
    EXPECT_NEAR(series[0].value, series[4].value, 1e-9);
    EXPECT_NEAR(series[1].value - series[0].value, 2.0, 1e-9);
}

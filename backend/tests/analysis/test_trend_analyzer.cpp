#include <gtest/gtest.h>

#include "analysis/TrendAnalyzer.h"
#include "common/Errors.h"

using namespace nocturna::backend::analysis;
using nocturna::backend::common::InsufficientSeriesError;
using nocturna::backend::common::YearlySeries;

TEST(TrendAnalyzerTest, RisingBrightnessIsWorsening) {
    TrendAnalyzer analyzer;
    auto r = analyzer.analyze(YearlySeries::fromValues(2019, {18.0, 18.2, 18.6, 19.0, 19.5}));
    EXPECT_EQ(r.direction, TrendDirection::Worsening);
    EXPECT_EQ(r.periodWindow, 1u);
    EXPECT_DOUBLE_EQ(r.firstPeriodAvg, 18.0);
    EXPECT_DOUBLE_EQ(r.recentPeriodAvg, 19.5);
    EXPECT_NEAR(r.percentChange, 1.5 / 18.0 * 100.0, 1e-9);
    EXPECT_NEAR(r.magnitude, 1.5, 1e-12);
    EXPECT_NEAR(r.volatility, 0.108972473, 1e-6);
    EXPECT_EQ(r.firstYear, 2019);
    EXPECT_EQ(r.lastYear, 2023);
    EXPECT_EQ(r.yearCount, 5u);
}

TEST(TrendAnalyzerTest, ReversedSeriesIsImproving) {
    TrendAnalyzer analyzer;
    auto forward = analyzer.analyze(YearlySeries::fromValues(2019, {18.0, 18.2, 18.6, 19.0, 19.5}));
    auto reversed = analyzer.analyze(YearlySeries::fromValues(2019, {19.5, 19.0, 18.6, 18.2, 18.0}));
    EXPECT_EQ(reversed.direction, TrendDirection::Improving);
    EXPECT_LT(reversed.percentChange, 0.0);
    EXPECT_NE(forward.percentChange, reversed.percentChange);
    EXPECT_DOUBLE_EQ(forward.magnitude, reversed.magnitude);
}

TEST(TrendAnalyzerTest, SmallChangeIsStable) {
    TrendAnalyzer analyzer;
    auto r = analyzer.analyze(YearlySeries::fromValues(2015, {10.0, 10.05, 9.98, 10.02}));
    EXPECT_EQ(r.direction, TrendDirection::Stable);
    EXPECT_NEAR(r.percentChange, 0.2, 1e-9);
}

TEST(TrendAnalyzerTest, WindowIsOneThirdOfSeries) {
    TrendAnalyzer analyzer;
    auto r = analyzer.analyze(YearlySeries::fromValues(2000, {1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(r.periodWindow, 3u);
    EXPECT_DOUBLE_EQ(r.firstPeriodAvg, 2.0);
    EXPECT_DOUBLE_EQ(r.recentPeriodAvg, 8.0);
    EXPECT_DOUBLE_EQ(r.percentChange, 300.0);
    EXPECT_DOUBLE_EQ(r.volatility, 0.0);
}

TEST(TrendAnalyzerTest, DarkBaselineReportsFullChange) {
    TrendAnalyzer analyzer;
    auto r = analyzer.analyze(YearlySeries::fromValues(2020, {0.0, 0.0, 5.0}));
    EXPECT_DOUBLE_EQ(r.percentChange, 100.0);
    EXPECT_EQ(r.direction, TrendDirection::Worsening);
    auto flat = analyzer.analyze(YearlySeries::fromValues(2020, {0.0, 0.0}));
    EXPECT_DOUBLE_EQ(flat.percentChange, 0.0);
    EXPECT_EQ(flat.direction, TrendDirection::Stable);
}

TEST(TrendAnalyzerTest, ShortSeriesRejected) {
    TrendAnalyzer analyzer;
    EXPECT_THROW(analyzer.analyze(YearlySeries::fromValues(2020, {1.0})), InsufficientSeriesError);
    EXPECT_THROW(analyzer.analyze(YearlySeries()), InsufficientSeriesError);
}

TEST(TrendAnalyzerTest, SignificanceOfPerfectLine) {
    auto sig = TrendAnalyzer::significance(YearlySeries::fromValues(2010, {1, 3, 5, 7, 9, 11}));
    EXPECT_NEAR(sig.slope, 2.0, 1e-12);
    EXPECT_NEAR(sig.intercept, 1.0, 1e-12);
    EXPECT_NEAR(sig.rSquared, 1.0, 1e-12);
    EXPECT_NEAR(sig.theilSenSlope, 2.0, 1e-12);
    EXPECT_EQ(sig.mannKendallS, 15);
    EXPECT_GT(sig.mannKendallZ, 1.96);
    EXPECT_DOUBLE_EQ(sig.confidence, 1.0);
}

TEST(TrendAnalyzerTest, SignificanceUsesYearGaps) {
    YearlySeries s({{2000, 1.0}, {2002, 2.0}, {2006, 4.0}});
    auto sig = TrendAnalyzer::significance(s);
    EXPECT_NEAR(sig.slope, 0.5, 1e-12);
    EXPECT_NEAR(sig.theilSenSlope, 0.5, 1e-12);
}

TEST(TrendAnalyzerTest, CustomStableBand) {
    TrendAnalyzer::Config cfg;
    cfg.stableBandPercent = 10.0;
    TrendAnalyzer analyzer(cfg);
    auto r = analyzer.analyze(YearlySeries::fromValues(2019, {18.0, 18.2, 18.6, 19.0, 19.5}));
    EXPECT_EQ(r.direction, TrendDirection::Stable);
}

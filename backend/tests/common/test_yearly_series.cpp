#include <gtest/gtest.h>

#include "common/YearlySeries.h"
#include "common/Errors.h"

#include <limits>

using namespace nocturna::backend::common;

TEST(YearlySeriesTest, FromValuesAssignsConsecutiveYears) {
    auto s = YearlySeries::fromValues(2019, {1.0, 2.0, 3.0});
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s.front().year, 2019);
    EXPECT_EQ(s.back().year, 2021);
    EXPECT_EQ(s.values(), (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(YearlySeriesTest, GapsAreAllowed) {
    YearlySeries s({{2010, 1.0}, {2013, 2.0}, {2020, 3.0}});
    EXPECT_EQ(s[1].year, 2013);
}

TEST(YearlySeriesTest, RejectsUnorderedOrDuplicateYears) {
    EXPECT_THROW(YearlySeries({{2020, 1.0}, {2019, 2.0}}), InvalidSeriesError);
    EXPECT_THROW(YearlySeries({{2020, 1.0}, {2020, 2.0}}), InvalidSeriesError);
}

TEST(YearlySeriesTest, RejectsNonFiniteValues) {
    EXPECT_THROW(YearlySeries({{2020, std::numeric_limits<double>::quiet_NaN()}}), InvalidSeriesError);
    EXPECT_THROW(YearlySeries::fromValues(2000, {1.0, std::numeric_limits<double>::infinity()}), InvalidSeriesError);
}

TEST(YearlySeriesTest, HeadTruncates) {
    auto s = YearlySeries::fromValues(2000, {1, 2, 3, 4});
    EXPECT_EQ(s.head(2).size(), 2u);
    EXPECT_EQ(s.head(2).back().year, 2001);
    EXPECT_EQ(s.head(10).size(), 4u);
}

TEST(ErrorsTest, CategoriesAndKinds) {
    InsufficientDataError data(1, 5, 2);
    EXPECT_EQ(data.category(), ErrorCategory::NoData);
    EXPECT_EQ(data.validCount(), 1u);
    EXPECT_EQ(data.totalCount(), 5u);
    EXPECT_STREQ(data.kind(), "insufficient_data");

    InsufficientHistoryError hist(2, 3);
    EXPECT_EQ(hist.category(), ErrorCategory::NoData);
    EXPECT_EQ(hist.available(), 2u);
    EXPECT_EQ(hist.required(), 3u);

    ModelFitError fit("exponential", "non-positive value");
    EXPECT_EQ(fit.category(), ErrorCategory::Computation);
    EXPECT_EQ(fit.model(), "exponential");

    GatewayUnavailableError down("offline");
    EXPECT_EQ(down.category(), ErrorCategory::Unavailable);
    EXPECT_STREQ(toString(ErrorCategory::Unavailable), "unavailable");
}

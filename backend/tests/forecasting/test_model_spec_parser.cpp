#include <gtest/gtest.h>
#include "forecasting/ModelSpecParser.h"
#include "forecasting/ForecastModels.h"
#include "common/Errors.h"

using namespace nocturna::backend::forecasting;
using nocturna::backend::common::InvalidRequestError;

TEST(ModelSpecParserTest, ParsesSimpleList) {
    auto res = parseModelSpec("linear,exponential,seasonal");
    ASSERT_TRUE(res.ok);
    ASSERT_EQ(res.models.size(), 3u);
    EXPECT_EQ(res.models[0].name, "linear");
    EXPECT_EQ(res.models[1].name, "exponential");
    EXPECT_EQ(res.models[2].name, "seasonal");
}

TEST(ModelSpecParserTest, ParsesParamsAndLowercases) {
    auto res = parseModelSpec(" Moving_Average(Window=5, nudge=0) , seasonal(max_lag=6,min_correlation=0.25)");
    ASSERT_TRUE(res.ok);
    ASSERT_EQ(res.models.size(), 2u);
    EXPECT_EQ(res.models[0].name, "moving_average");
    auto& p = res.models[0].params;
    ASSERT_EQ(p.count("window"), 1u);
    EXPECT_EQ(p.at("window"), "5");
    EXPECT_EQ(p.at("nudge"), "0");
    EXPECT_EQ(res.models[1].params.at("min_correlation"), "0.25");
}

TEST(ModelSpecParserTest, ErrorsOnMissingParen) {
    auto res = parseModelSpec("moving_average(window=");
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(res.error.find("unmatched") != std::string::npos);
}

TEST(ModelSpecParserTest, ErrorsOnBadParam) {
    auto res = parseModelSpec("moving_average(window)");
    EXPECT_FALSE(res.ok);
    EXPECT_TRUE(res.error.find("param missing") != std::string::npos);
}

TEST(ModelSpecParserTest, ErrorsOnTrailingText) {
    auto res = parseModelSpec("seasonal(max_lag=3)x");
    EXPECT_FALSE(res.ok);
}

TEST(ModelSpecParserTest, EmptySpecRejected) {
    auto res = parseModelSpec("   \t  \n");
    EXPECT_FALSE(res.ok);
    EXPECT_EQ(res.error, "empty model spec");
}

TEST(ModelSpecParserTest, DefaultsCoverAllFamilies) {
    auto specs = defaultModelSpecs();
    ASSERT_EQ(specs.size(), 4u);
    EXPECT_EQ(createForecastModel(specs[0])->kind(), AlgorithmKind::Linear);
    EXPECT_EQ(createForecastModel(specs[1])->kind(), AlgorithmKind::Exponential);
    EXPECT_EQ(createForecastModel(specs[2])->kind(), AlgorithmKind::MovingAverage);
    EXPECT_EQ(createForecastModel(specs[3])->kind(), AlgorithmKind::Seasonal);
}

TEST(ModelSpecParserTest, FactoryAppliesParameters) {
    auto res = parseModelSpec("moving_average(window=5,nudge=0)");
    ASSERT_TRUE(res.ok);
    auto model = createForecastModel(res.models[0]);
    auto* ma = dynamic_cast<MovingAverageModel*>(model.get());
    ASSERT_NE(ma, nullptr);
    EXPECT_EQ(ma->config().window, 5);
    EXPECT_FALSE(ma->config().trendNudge);
}

TEST(ModelSpecParserTest, FactoryRejectsUnknownOrInvalid) {
    EXPECT_THROW(createForecastModel(ModelSpec{"arima", {}}), InvalidRequestError);
    EXPECT_THROW(createForecastModel(ModelSpec{"linear", {{"slope", "2"}}}), InvalidRequestError);
    EXPECT_THROW(createForecastModel(ModelSpec{"moving_average", {{"window", "0"}}}), InvalidRequestError);
    EXPECT_THROW(createForecastModel(ModelSpec{"moving_average", {{"window", "3x"}}}), InvalidRequestError);
    EXPECT_THROW(createForecastModel(ModelSpec{"seasonal", {{"min_lag", "5"}, {"max_lag", "3"}}}), InvalidRequestError);
}

TEST(ModelSpecParserTest, CamelCaseAliasAccepted) {
    auto res = parseModelSpec("movingAverage");
    ASSERT_TRUE(res.ok);
    EXPECT_EQ(createForecastModel(res.models[0])->name(), "moving_average");
}

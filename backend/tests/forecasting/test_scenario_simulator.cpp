#include <gtest/gtest.h>

#include "forecasting/ScenarioSimulator.h"
#include "common/Errors.h"

#include <limits>

using namespace nocturna::backend::forecasting;
using nocturna::backend::common::InvalidRequestError;
using nocturna::backend::common::YearlySeries;

namespace {
EnsembleResult tenPercentGrowth() {
    EnsembleResult r;
    r.yearsForward = 2;
    r.ensembleModel.name = "ensemble";
    r.ensembleModel.kind = AlgorithmKind::Ensemble;
    r.ensembleModel.predictions.push_back({2024, 11.0, 11.0, 11.0});
    r.ensembleModel.predictions.push_back({2025, 12.1, 12.1, 12.1});
    return r;
}
}

TEST(ScenarioSimulatorTest, BaselineRateFromEnsemble) {
    EXPECT_NEAR(ScenarioSimulator::baselineRate(10.0, tenPercentGrowth()), 0.1, 1e-12);
    EXPECT_DOUBLE_EQ(ScenarioSimulator::baselineRate(0.0, tenPercentGrowth()), 0.0);
    EXPECT_DOUBLE_EQ(ScenarioSimulator::baselineRate(10.0, EnsembleResult{}), 0.0);
}

TEST(ScenarioSimulatorTest, NoEffectReproducesBaseline) {
    ScenarioSimulator sim;
    auto history = YearlySeries::fromValues(2021, {9.0, 9.5, 10.0});
    auto out = sim.simulate(history, tenPercentGrowth(), {{"business_as_usual", 0.0, 2024}});
    ASSERT_EQ(out.size(), 1u);
    ASSERT_EQ(out[0].values.size(), 2u);
    EXPECT_NEAR(out[0].values[0].value, 11.0, 1e-9);
    EXPECT_NEAR(out[0].values[1].value, 12.1, 1e-9);
    EXPECT_EQ(out[0].values[1].year, 2025);
}

TEST(ScenarioSimulatorTest, PolicyAppliesFromStartYear) {
    ScenarioSimulator sim;
    auto history = YearlySeries::fromValues(2021, {9.0, 9.5, 10.0});
    auto out = sim.simulate(history, tenPercentGrowth(),
                            {{"dimming", -50.0, 2025}, {"freeze", -100.0, 2024}});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_NEAR(out[0].effectiveRate, 0.05, 1e-12);
    EXPECT_NEAR(out[0].values[0].value, 11.0, 1e-9);
    EXPECT_NEAR(out[0].values[1].value, 11.55, 1e-9);
    EXPECT_NEAR(out[1].values[0].value, 10.0, 1e-9);
    EXPECT_NEAR(out[1].values[1].value, 10.0, 1e-9);
}

TEST(ScenarioSimulatorTest, NonFiniteEffectRejected) {
    ScenarioSimulator sim;
    auto history = YearlySeries::fromValues(2021, {9.0, 9.5, 10.0});
    EXPECT_THROW(sim.simulate(history, tenPercentGrowth(),
                              {{"bad", std::numeric_limits<double>::quiet_NaN(), 2024}}),
                 InvalidRequestError);
}

TEST(ScenarioSimulatorTest, EmptyInputsYieldNothing) {
    ScenarioSimulator sim;
    EXPECT_TRUE(sim.simulate(YearlySeries(), tenPercentGrowth(), {{"x", 0.0, 2024}}).empty());
    EXPECT_TRUE(sim.simulate(YearlySeries::fromValues(2021, {1.0}), EnsembleResult{}, {{"x", 0.0, 2024}}).empty());
}

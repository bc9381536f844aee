/***********************************************************************
ForecastModels.h - The model families combined by the ensemble
forecaster: least-squares linear and log-linear trends, a nudged
trailing average, and a trend-plus-cycle decomposition.
***********************************************************************/

#pragma once

#include "IForecastModel.h"

namespace nocturna::backend::forecasting {

/**
 * Ordinary least squares of value against years since the first year.
 */
class LinearTrendModel : public IForecastModel {
public:
    AlgorithmKind kind() const override { return AlgorithmKind::Linear; }
    std::string name() const override { return "linear"; }
    std::unique_ptr<IFittedModel> fit(const common::YearlySeries& history) const override;
};

/**
 * Least squares of log(value) against years, exponentiated back.
 * Any value <= 0 makes the family inapplicable (ModelFitError).
 */
class ExponentialTrendModel : public IForecastModel {
public:
    AlgorithmKind kind() const override { return AlgorithmKind::Exponential; }
    std::string name() const override { return "exponential"; }
    std::unique_ptr<IFittedModel> fit(const common::YearlySeries& history) const override;
};

/**
 * Trailing mean of the last `window` years carried forward. With nudging
 * enabled the flat line is tilted by the OLS slope of that same window,
 * measured from the window's mean year, so gapped history extrapolates
 * along the same line.
 */
class MovingAverageModel : public IForecastModel {
public:
    struct Config {
        int window = 3;
        bool trendNudge = true;
    };

    MovingAverageModel() = default;
    explicit MovingAverageModel(Config cfg) : cfg_(cfg) {}

    AlgorithmKind kind() const override { return AlgorithmKind::MovingAverage; }
    std::string name() const override { return "moving_average"; }
    std::unique_ptr<IFittedModel> fit(const common::YearlySeries& history) const override;

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
};

/**
 * Approximate decomposition: linear trend plus a short cycle.
 *
 * 1. Detrend with OLS.
 * 2. Autocorrelation of the residuals at every lag in [minLag, min(maxLag, n/2)].
 * 3. The lag with the highest autocorrelation is the cycle period, provided
 *    the correlation reaches minCorrelation; otherwise there is no cycle and
 *    the model reduces to the linear trend. History with missing years
 *    never gets a cycle.
 * 4. Cycle profile = mean residual per phase (year offset mod period),
 *    centered, scaled by the peak correlation.
 *
 * Deterministic. This is the least rigorous family: no significance test on
 * the cycle, and the profile comes from as few as two cycles.
 */
class SeasonalCycleModel : public IForecastModel {
public:
    struct Config {
        int minLag = 2;
        int maxLag = 4;
        double minCorrelation = 0.1;
    };

    SeasonalCycleModel() = default;
    explicit SeasonalCycleModel(Config cfg) : cfg_(cfg) {}

    AlgorithmKind kind() const override { return AlgorithmKind::Seasonal; }
    std::string name() const override { return "seasonal"; }
    std::unique_ptr<IFittedModel> fit(const common::YearlySeries& history) const override;

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
};

} // namespace nocturna::backend::forecasting

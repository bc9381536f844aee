#ifndef NOCTURNA_BACKEND_FORECASTING_MODEL_VALIDATOR_H
#define NOCTURNA_BACKEND_FORECASTING_MODEL_VALIDATOR_H

#include "forecasting/IForecastModel.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>

namespace nocturna::backend::forecasting {

/**
 * Held-out backtest: refit on all but the last k years, predict those k
 * years, and grade the mean absolute error (series units).
 */
class ModelValidator {
public:
    struct Config {
        double holdoutFraction = 0.2;   // k = max(1, floor(n * fraction)), at most n - 1
        double excellentBelow = 0.5;
        double goodBelow = 1.0;
        double fairBelow = 2.0;
        bool clampNonNegative = true;   // score the same clamped values the forecaster reports
    };

    ModelValidator();
    explicit ModelValidator(Config cfg, std::shared_ptr<spdlog::logger> log = nullptr);

    // nullopt when the history is too short to split or the model cannot be
    // fit on the training part.
    std::optional<ValidationResult> validate(const IForecastModel& model, const common::YearlySeries& history) const;

    std::size_t holdoutSize(std::size_t historyYears) const;
    QualityGrade grade(double mae) const;

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace nocturna::backend::forecasting

#endif // NOCTURNA_BACKEND_FORECASTING_MODEL_VALIDATOR_H

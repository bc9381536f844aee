#ifndef NOCTURNA_BACKEND_FORECASTING_ENSEMBLE_FORECASTER_H
#define NOCTURNA_BACKEND_FORECASTING_ENSEMBLE_FORECASTER_H

#include "forecasting/IForecastModel.h"
#include "forecasting/ModelSpecParser.h"
#include "forecasting/ModelValidator.h"

#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace nocturna::backend::forecasting {

/**
 * Fits every configured model family to a history, forecasts each one,
 * backtests each one, and averages the fitted families into an ensemble.
 *
 * Per-year uncertainty is the spread of the model point estimates; with a
 * single fitted model it falls back to that model's own +/- band. A family
 * that cannot be fit is reported under `skipped` and left out of the average.
 */
class EnsembleForecaster {
public:
    struct Config {
        std::vector<ModelSpec> models = defaultModelSpecs();
        double bandFraction = 0.10;     // per-model min/max = value -/+ fraction * |value|
        bool clampNonNegative = true;   // brightness cannot go below zero
        ModelValidator::Config validator;
    };

    // Throws InvalidRequestError for unknown or duplicate model specs.
    EnsembleForecaster();
    explicit EnsembleForecaster(Config cfg, std::shared_ptr<spdlog::logger> log = nullptr,
                                std::shared_ptr<spdlog::logger> validationLog = nullptr);

    // Explicit model families (tests, custom hosts). cfg.models is ignored.
    EnsembleForecaster(std::vector<std::unique_ptr<IForecastModel>> models, Config cfg,
                       std::shared_ptr<spdlog::logger> log = nullptr);

    // Throws InsufficientHistoryError for fewer than 3 years, InvalidRequestError
    // for yearsForward < 1 and ModelFitError when no family could be fit.
    EnsembleResult forecast(const common::YearlySeries& history, int yearsForward) const;

    std::vector<std::string> modelNames() const;

private:
    PredictionModel project(const IForecastModel& model, const IFittedModel& fitted,
                            const common::YearlySeries& history, int yearsForward) const;
    void buildEnsemble(EnsembleResult& result, const common::YearlySeries& history) const;

    Config cfg_;
    std::vector<std::unique_ptr<IForecastModel>> models_;
    ModelValidator validator_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace nocturna::backend::forecasting

#endif // NOCTURNA_BACKEND_FORECASTING_ENSEMBLE_FORECASTER_H

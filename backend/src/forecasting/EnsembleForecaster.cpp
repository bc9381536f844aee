#include "forecasting/EnsembleForecaster.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace nocturna::backend::forecasting {

namespace {
constexpr std::size_t kMinHistoryYears = 3;
}

EnsembleForecaster::EnsembleForecaster() : EnsembleForecaster(Config{}) {}

EnsembleForecaster::EnsembleForecaster(Config cfg, std::shared_ptr<spdlog::logger> log,
                                       std::shared_ptr<spdlog::logger> validationLog)
    : cfg_(std::move(cfg)), validator_(cfg_.validator, std::move(validationLog)), log_(std::move(log)) {
    if (cfg_.models.empty()) throw common::InvalidRequestError("no forecast models configured");
    std::set<std::string> seen;
    for (const auto& spec : cfg_.models) {
        auto model = createForecastModel(spec);
        if (!seen.insert(model->name()).second) {
            throw common::InvalidRequestError("forecast model '" + model->name() + "' configured twice");
        }
        models_.push_back(std::move(model));
    }
}

EnsembleForecaster::EnsembleForecaster(std::vector<std::unique_ptr<IForecastModel>> models, Config cfg,
                                       std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)), models_(std::move(models)), validator_(cfg_.validator, log), log_(std::move(log)) {
    if (models_.empty()) throw common::InvalidRequestError("no forecast models configured");
}

std::vector<std::string> EnsembleForecaster::modelNames() const {
    std::vector<std::string> names;
    for (const auto& m : models_) names.push_back(m->name());
    return names;
}

PredictionModel EnsembleForecaster::project(const IForecastModel& model, const IFittedModel& fitted,
                                            const common::YearlySeries& history, int yearsForward) const {
    PredictionModel pm;
    pm.name = model.name();
    pm.kind = model.kind();
    pm.parameters = fitted.parameters();

    auto clamp = [this](double v) { return cfg_.clampNonNegative ? std::max(0.0, v) : v; };
    const int lastYear = history.back().year;
    for (int h = 1; h <= yearsForward; ++h) {
        Prediction p;
        p.year = lastYear + h;
        p.value = clamp(fitted.valueAt(p.year));
        const double spread = cfg_.bandFraction * std::fabs(p.value);
        p.min = clamp(p.value - spread);
        p.max = p.value + spread;
        pm.predictions.push_back(p);
    }
    // Mean yearly change from the model's own value at the last observed year
    const double anchor = clamp(fitted.valueAt(lastYear));
    pm.parameters["annual_change"] = (pm.predictions.back().value - anchor) / yearsForward;
    pm.parameters["anchor"] = anchor;
    return pm;
}

void EnsembleForecaster::buildEnsemble(EnsembleResult& result, const common::YearlySeries& history) const {
    PredictionModel& ens = result.ensembleModel;
    ens.name = "ensemble";
    ens.kind = AlgorithmKind::Ensemble;

    const auto& models = result.models;
    const double count = static_cast<double>(models.size());
    for (int h = 0; h < result.yearsForward; ++h) {
        const auto idx = static_cast<std::size_t>(h);
        double sum = 0.0;
        double lo = models.front().predictions[idx].value;
        double hi = lo;
        for (const auto& m : models) {
            const double v = m.predictions[idx].value;
            sum += v;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (models.size() == 1) {
            lo = models.front().predictions[idx].min;
            hi = models.front().predictions[idx].max;
        }
        Prediction p;
        p.year = history.back().year + h + 1;
        p.value = std::clamp(sum / count, std::min(lo, hi), std::max(lo, hi));
        p.min = lo;
        p.max = hi;
        ens.predictions.push_back(p);
        result.uncertainty.push_back({p.year, lo, hi});
    }

    double anchorSum = 0.0;
    for (const auto& m : models) anchorSum += m.parameter("anchor");
    const double anchor = anchorSum / count;
    ens.parameters["model_count"] = count;
    ens.parameters["anchor"] = anchor;
    ens.parameters["annual_change"] = (ens.predictions.back().value - anchor) / result.yearsForward;
}

EnsembleResult EnsembleForecaster::forecast(const common::YearlySeries& history, int yearsForward) const {
    if (yearsForward < 1) {
        throw common::InvalidRequestError("yearsForward must be >= 1, got " + std::to_string(yearsForward));
    }
    if (history.size() < kMinHistoryYears) {
        throw common::InsufficientHistoryError(history.size(), kMinHistoryYears);
    }

    EnsembleResult result;
    result.historyYears = history.size();
    result.yearsForward = yearsForward;

    for (const auto& model : models_) {
        std::unique_ptr<IFittedModel> fitted;
        try {
            fitted = model->fit(history);
        } catch (const common::ModelFitError& ex) {
            if (log_) log_->warn("Skipping {} model: {}", model->name(), ex.reason());
            result.skipped.push_back({model->name(), model->kind(), ex.reason()});
            continue;
        }
        result.models.push_back(project(*model, *fitted, history, yearsForward));
        if (auto v = validator_.validate(*model, history)) {
            result.validation.push_back(*v);
        }
    }

    if (result.models.empty()) {
        throw common::ModelFitError("ensemble", "no forecast model could be fit to "
            + std::to_string(history.size()) + " years of history");
    }
    buildEnsemble(result, history);

    if (log_) {
        const auto& last = result.ensembleModel.predictions.back();
        log_->info("Forecast {} years from {} ({} models, {} skipped): {} -> {:.3f} [{:.3f}, {:.3f}]",
                   yearsForward, history.back().year, result.models.size(), result.skipped.size(),
                   last.year, last.value, last.min, last.max);
    }
    return result;
}

} // namespace nocturna::backend::forecasting

#include "forecasting/ModelValidator.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>

namespace nocturna::backend::forecasting {

ModelValidator::ModelValidator() : ModelValidator(Config{}) {}

ModelValidator::ModelValidator(Config cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)) {}

std::size_t ModelValidator::holdoutSize(std::size_t historyYears) const {
    if (historyYears < 2) return 0;
    const auto k = static_cast<std::size_t>(std::floor(static_cast<double>(historyYears) * cfg_.holdoutFraction));
    return std::clamp<std::size_t>(k, 1, historyYears - 1);
}

QualityGrade ModelValidator::grade(double mae) const {
    if (mae < cfg_.excellentBelow) return QualityGrade::Excellent;
    if (mae < cfg_.goodBelow) return QualityGrade::Good;
    if (mae < cfg_.fairBelow) return QualityGrade::Fair;
    return QualityGrade::Poor;
}

std::optional<ValidationResult> ModelValidator::validate(const IForecastModel& model,
                                                         const common::YearlySeries& history) const {
    const std::size_t k = holdoutSize(history.size());
    if (k == 0) return std::nullopt;
    const std::size_t trainSize = history.size() - k;

    std::unique_ptr<IFittedModel> fitted;
    try {
        fitted = model.fit(history.head(trainSize));
    } catch (const common::ModelFitError& ex) {
        if (log_) log_->info("No backtest for {}: {}", model.name(), ex.what());
        return std::nullopt;
    }

    double absSum = 0.0;
    for (std::size_t i = trainSize; i < history.size(); ++i) {
        double predicted = fitted->valueAt(history[i].year);
        if (cfg_.clampNonNegative) predicted = std::max(0.0, predicted);
        absSum += std::fabs(predicted - history[i].value);
    }

    ValidationResult r;
    r.modelName = model.name();
    r.kind = model.kind();
    r.mae = absSum / static_cast<double>(k);
    r.grade = grade(r.mae);
    r.trainingSize = trainSize;
    r.heldOut = k;
    if (log_) {
        log_->debug("Backtest {}: train={} held_out={} mae={:.4f} grade={}",
                    r.modelName, trainSize, k, r.mae, toString(r.grade));
    }
    return r;
}

} // namespace nocturna::backend::forecasting

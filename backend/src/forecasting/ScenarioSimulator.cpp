#include "ScenarioSimulator.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>

namespace nocturna::backend::forecasting {

double ScenarioSimulator::baselineRate(double lastObserved, const EnsembleResult& ensemble) {
    const auto& preds = ensemble.ensembleModel.predictions;
    if (preds.empty() || !(lastObserved > 0.0) || !(preds.back().value > 0.0)) return 0.0;
    return std::pow(preds.back().value / lastObserved, 1.0 / static_cast<double>(preds.size())) - 1.0;
}

std::vector<ScenarioProjection> ScenarioSimulator::simulate(const common::YearlySeries& history,
                                                            const EnsembleResult& ensemble,
                                                            const std::vector<PolicyScenario>& scenarios) const {
    std::vector<ScenarioProjection> out;
    if (history.empty() || ensemble.ensembleModel.predictions.empty()) return out;

    const double lastObserved = history.back().value;
    const double base = baselineRate(lastObserved, ensemble);
    for (const auto& sc : scenarios) {
        if (!std::isfinite(sc.effectPercent)) {
            throw common::InvalidRequestError("scenario '" + sc.name + "' has a non-finite effect");
        }
        ScenarioProjection p;
        p.name = sc.name;
        p.effectPercent = sc.effectPercent;
        p.startYear = sc.startYear;
        p.baselineRate = base;
        p.effectiveRate = base * (1.0 + sc.effectPercent / 100.0);

        double value = lastObserved;
        for (const auto& pred : ensemble.ensembleModel.predictions) {
            const double rate = pred.year >= sc.startYear ? p.effectiveRate : base;
            value = std::max(0.0, value * (1.0 + rate));
            p.values.push_back({pred.year, value});
        }
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace nocturna::backend::forecasting

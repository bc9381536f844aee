#pragma once

#include "ForecastTypes.h"
#include "common/DataTypes.h"
#include "common/YearlySeries.h"

#include <string>
#include <vector>

namespace nocturna::backend::forecasting {

// Lighting policy applied from startYear on; effectPercent scales the
// baseline growth rate (-50 halves it, -100 freezes brightness).
struct PolicyScenario {
    std::string name;
    double effectPercent = 0.0;
    int startYear = 0;
};

struct ScenarioProjection {
    std::string name;
    double effectPercent = 0.0;
    int startYear = 0;
    double baselineRate = 0.0;   // compound annual rate implied by the ensemble
    double effectiveRate = 0.0;  // rate once the policy is active
    std::vector<common::YearValue> values; // one per forecast year
};

/**
 * Re-projects an ensemble forecast under policy scenarios. The baseline
 * compound rate runs from the last observed value to the last ensemble
 * value; each scenario compounds from the last observation with the
 * baseline rate before its start year and the adjusted rate afterwards.
 */
class ScenarioSimulator {
public:
    // Throws InvalidRequestError for non-finite effects; empty history or
    // ensemble yields no projections.
    std::vector<ScenarioProjection> simulate(const common::YearlySeries& history,
                                             const EnsembleResult& ensemble,
                                             const std::vector<PolicyScenario>& scenarios) const;

    static double baselineRate(double lastObserved, const EnsembleResult& ensemble);
};

} // namespace nocturna::backend::forecasting

#include "AnomalyDetector.h"
#include "Regression.h"

#include <cmath>

namespace nocturna::backend::analysis {

AnomalyResult AnomalyDetector::evaluate(double current, const std::vector<double>& history) const {
    AnomalyResult r;
    r.value = current;
    r.historyCount = history.size();
    if (history.size() < cfg_.minHistory || !std::isfinite(current)) return r;

    r.historicalMean = mean(history);
    r.historicalStdDev = populationStdDev(history);
    if (r.historicalStdDev > 0.0) {
        r.zScore = (current - r.historicalMean) / r.historicalStdDev;
        r.isAnomaly = std::fabs(r.zScore) > cfg_.zThreshold;
    }
    return r;
}

} // namespace nocturna::backend::analysis

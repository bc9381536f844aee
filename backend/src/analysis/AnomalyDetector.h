#pragma once

#include "AnalysisTypes.h"

#include <cstddef>
#include <vector>

namespace nocturna::backend::analysis {

// Flags a current reading whose z score against history exceeds the threshold.
class AnomalyDetector {
public:
    struct Config {
        double zThreshold = 2.0;
        std::size_t minHistory = 3;  // shorter histories are never anomalous
    };

    AnomalyDetector() = default;
    explicit AnomalyDetector(Config cfg) : cfg_(cfg) {}

    AnomalyResult evaluate(double current, const std::vector<double>& history) const;

private:
    Config cfg_;
};

} // namespace nocturna::backend::analysis

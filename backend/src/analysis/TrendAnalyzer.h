#pragma once

#include "AnalysisTypes.h"
#include "common/YearlySeries.h"

#include <memory>
#include <spdlog/spdlog.h>

namespace nocturna {
namespace backend {
namespace analysis {

/**
 * TrendAnalyzer compares the average of the first third of a series with
 * the average of its last third. Rising brightness is "worsening".
 * Changes inside the stable band (percent) are reported as "stable".
 */
class TrendAnalyzer {
public:
    struct Config {
        double stableBandPercent = 1.0;
    };

    TrendAnalyzer();
    explicit TrendAnalyzer(Config cfg, std::shared_ptr<spdlog::logger> log = nullptr);

    // Throws InsufficientSeriesError for fewer than 2 years.
    TrendResult analyze(const common::YearlySeries& series) const;

    // OLS / Theil-Sen / Mann-Kendall over (year, value); no minimum length.
    static TrendSignificance significance(const common::YearlySeries& series);

    const Config& config() const { return cfg_; }

private:
    Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace analysis
} // namespace backend
} // namespace nocturna

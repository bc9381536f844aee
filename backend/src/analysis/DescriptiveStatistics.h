/***********************************************************************
DescriptiveStatistics.h - Reduces a set of brightness samples to summary
statistics (location, spread, shape) with a normal-approximation
confidence interval on the mean.
***********************************************************************/

#pragma once

#include "AnalysisTypes.h"
#include "common/DataTypes.h"
#include "sampling/SampleSet.h"

#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace nocturna {
namespace backend {
namespace analysis {

/**
 * DescriptiveStatistics summarizes brightness samples.
 *
 * - NaN, infinite and negative values are excluded but counted
 * - population variance (divide by N)
 * - percentiles by linear interpolation at index p/100*(n-1)
 * - adjusted skewness / excess kurtosis, 0 for degenerate input
 * - mean +/- z*stdDev/sqrt(n) confidence interval
 *
 * Values are sorted before any reduction, so every permutation of the same
 * input yields bit-identical results.
 */
class DescriptiveStatistics {
public:
    struct Config {
        double confidenceZ = 1.96;        // 95% two-sided
        std::size_t minValidSamples = 2;
    };

    DescriptiveStatistics();
    explicit DescriptiveStatistics(Config cfg, std::shared_ptr<spdlog::logger> log = nullptr);

    // Throws InsufficientDataError when fewer than minValidSamples usable values remain.
    StatisticsResult summarize(const std::vector<common::Measurement>& samples) const;

    // Absent, rejected and cancelled samples count toward totalCount only.
    StatisticsResult summarize(const sampling::SampleSet& samples) const;

    StatisticsResult summarizeValues(const std::vector<double>& values) const;

    /**
     * Linear-interpolation percentile over ascending values.
     * Throws InvalidRequestError when p is outside [0,100] or sorted is empty.
     */
    static double percentile(const std::vector<double>& sorted, double p);

    const Config& config() const { return cfg_; }

private:
    StatisticsResult reduce(std::vector<double> values, std::size_t totalCount, const QualityCounts& quality) const;

    Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace analysis
} // namespace backend
} // namespace nocturna

#pragma once

#include <cstddef>
#include <string>

namespace nocturna::backend::analysis {

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
    double margin = 0.0;   // half-width
};

struct QualityCounts {
    std::size_t high = 0;
    std::size_t medium = 0;
    std::size_t low = 0;
};

// Snapshot of one summarize() call; never modified after it is returned.
struct StatisticsResult {
    std::size_t count = 0;          // valid values that entered the reduction
    std::size_t totalCount = 0;     // inputs offered, including absent / invalid
    std::size_t excludedCount = 0;  // totalCount - count
    double mean = 0.0;
    double median = 0.0;
    double variance = 0.0;          // population (divide by N)
    double stdDev = 0.0;
    double min = 0.0;
    double max = 0.0;
    double range = 0.0;
    double percentile25 = 0.0;
    double percentile75 = 0.0;
    double percentile95 = 0.0;
    double skewness = 0.0;          // adjusted Fisher-Pearson
    double kurtosis = 0.0;          // adjusted excess kurtosis
    ConfidenceInterval confidenceInterval;
    QualityCounts quality;
};

enum class TrendDirection { Improving, Worsening, Stable };

inline const char* toString(TrendDirection d) {
    switch (d) {
        case TrendDirection::Improving: return "improving";
        case TrendDirection::Worsening: return "worsening";
        case TrendDirection::Stable: return "stable";
    }
    return "stable";
}

// Slope-based companions to the period comparison.
struct TrendSignificance {
    double slope = 0.0;            // OLS, series units per year
    double intercept = 0.0;        // OLS value at the first year
    double rSquared = 0.0;
    double theilSenSlope = 0.0;    // median pairwise slope
    long mannKendallS = 0;
    double mannKendallZ = 0.0;
    double confidence = 0.0;       // min(|z| / 1.96, 1)
};

struct TrendResult {
    TrendDirection direction = TrendDirection::Stable;
    double percentChange = 0.0;
    double magnitude = 0.0;        // |recentPeriodAvg - firstPeriodAvg|
    double volatility = 0.0;       // population stdDev of year-over-year deltas
    double firstPeriodAvg = 0.0;
    double recentPeriodAvg = 0.0;
    std::size_t periodWindow = 0;  // years averaged at each end
    std::size_t yearCount = 0;
    int firstYear = 0;
    int lastYear = 0;
    TrendSignificance significance;
};

struct AnomalyResult {
    double value = 0.0;
    double zScore = 0.0;
    bool isAnomaly = false;
    std::size_t historyCount = 0;
    double historicalMean = 0.0;
    double historicalStdDev = 0.0;
};

} // namespace nocturna::backend::analysis

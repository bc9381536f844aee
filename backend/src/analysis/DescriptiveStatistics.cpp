/***********************************************************************
DescriptiveStatistics.cpp - Summary statistics over brightness samples.
***********************************************************************/

#include "DescriptiveStatistics.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace nocturna {
namespace backend {
namespace analysis {

namespace {
void tally(QualityCounts& q, common::QualityTag tag) {
    switch (tag) {
        case common::QualityTag::High: ++q.high; break;
        case common::QualityTag::Medium: ++q.medium; break;
        case common::QualityTag::Low: ++q.low; break;
    }
}
}

DescriptiveStatistics::DescriptiveStatistics() : DescriptiveStatistics(Config{}) {}

DescriptiveStatistics::DescriptiveStatistics(Config cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)) {}

double DescriptiveStatistics::percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        throw common::InvalidRequestError("percentile of an empty sample");
    }
    if (!(p >= 0.0 && p <= 100.0)) {
        throw common::InvalidRequestError("percentile must be within [0,100], got " + std::to_string(p));
    }
    const double index = p / 100.0 * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(index));
    const std::size_t hi = static_cast<std::size_t>(std::ceil(index));
    if (lo == hi) return sorted[lo];
    const double frac = index - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

StatisticsResult DescriptiveStatistics::summarize(const std::vector<common::Measurement>& samples) const {
    std::vector<double> values;
    values.reserve(samples.size());
    QualityCounts quality;
    for (const auto& m : samples) {
        if (!common::isUsableValue(m.value)) continue;
        values.push_back(m.value);
        tally(quality, m.quality);
    }
    return reduce(std::move(values), samples.size(), quality);
}

StatisticsResult DescriptiveStatistics::summarize(const sampling::SampleSet& samples) const {
    std::vector<double> values;
    values.reserve(samples.samples().size());
    QualityCounts quality;
    for (const auto& s : samples.samples()) {
        if (!s.usable() || !s.measurement || !common::isUsableValue(s.measurement->value)) continue;
        values.push_back(s.measurement->value);
        tally(quality, s.measurement->quality);
    }
    return reduce(std::move(values), samples.samples().size(), quality);
}

StatisticsResult DescriptiveStatistics::summarizeValues(const std::vector<double>& values) const {
    std::vector<double> valid;
    valid.reserve(values.size());
    for (double v : values) {
        if (common::isUsableValue(v)) valid.push_back(v);
    }
    return reduce(std::move(valid), values.size(), QualityCounts{});
}

StatisticsResult DescriptiveStatistics::reduce(std::vector<double> values, std::size_t totalCount,
                                               const QualityCounts& quality) const {
    const std::size_t required = std::max<std::size_t>(2, cfg_.minValidSamples);
    if (values.size() < required) {
        if (log_) log_->warn("Insufficient data: {} valid of {} samples", values.size(), totalCount);
        throw common::InsufficientDataError(values.size(), totalCount, required);
    }
    std::sort(values.begin(), values.end());

    StatisticsResult r;
    r.count = values.size();
    r.totalCount = totalCount;
    r.excludedCount = totalCount - values.size();
    r.quality = quality;
    r.min = values.front();
    r.max = values.back();
    r.range = r.max - r.min;

    const double n = static_cast<double>(values.size());
    const std::size_t mid = values.size() / 2;
    r.median = values.size() % 2 ? values[mid] : (values[mid - 1] + values[mid]) / 2.0;
    r.percentile25 = percentile(values, 25.0);
    r.percentile75 = percentile(values, 75.0);
    r.percentile95 = percentile(values, 95.0);

    if (r.min == r.max) {
        // Degenerate set: no spread, no shape
        r.mean = r.min;
        r.confidenceInterval = {r.mean, r.mean, 0.0};
        if (log_) log_->debug("Summarized {} identical values ({})", r.count, r.mean);
        return r;
    }

    double sum = 0.0;
    for (double v : values) sum += v;
    r.mean = std::clamp(sum / n, r.min, r.max);

    double m2 = 0.0, m3 = 0.0, m4 = 0.0;
    for (double v : values) {
        const double d = v - r.mean;
        const double d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    m2 /= n;
    m3 /= n;
    m4 /= n;

    r.variance = m2;
    r.stdDev = std::sqrt(m2);

    if (r.stdDev > 0.0) {
        if (values.size() >= 3) {
            const double g1 = m3 / std::pow(m2, 1.5);
            r.skewness = g1 * std::sqrt(n * (n - 1.0)) / (n - 2.0);
        }
        if (values.size() >= 4) {
            const double g2 = m4 / (m2 * m2) - 3.0;
            r.kurtosis = (n - 1.0) / ((n - 2.0) * (n - 3.0)) * ((n + 1.0) * g2 + 6.0);
        }
    }

    const double margin = cfg_.confidenceZ * r.stdDev / std::sqrt(n);
    r.confidenceInterval = {r.mean - margin, r.mean + margin, margin};

    if (log_) {
        log_->debug("Summarized n={} (excluded {}): mean={:.4f} sd={:.4f} p95={:.4f}",
                    r.count, r.excludedCount, r.mean, r.stdDev, r.percentile95);
    }
    return r;
}

} // namespace analysis
} // namespace backend
} // namespace nocturna

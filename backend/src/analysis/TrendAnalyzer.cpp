#include "TrendAnalyzer.h"
#include "Regression.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nocturna {
namespace backend {
namespace analysis {

namespace {
constexpr std::size_t kMinYears = 2;
}

TrendAnalyzer::TrendAnalyzer() : TrendAnalyzer(Config{}) {}

TrendAnalyzer::TrendAnalyzer(Config cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)) {}

TrendSignificance TrendAnalyzer::significance(const common::YearlySeries& series) {
    TrendSignificance sig;
    if (series.empty()) return sig;
    std::vector<double> x;
    x.reserve(series.size());
    for (const auto& p : series.points()) x.push_back(static_cast<double>(p.year - series.front().year));
    const auto y = series.values();

    const auto fit = fitLinear(x, y);
    sig.slope = fit.slope;
    sig.intercept = fit.intercept;
    sig.rSquared = fit.rSquared;
    sig.theilSenSlope = theilSenSlope(x, y);
    const auto mk = mannKendall(y);
    sig.mannKendallS = mk.s;
    sig.mannKendallZ = mk.z;
    sig.confidence = std::min(std::fabs(mk.z) / 1.96, 1.0);
    return sig;
}

TrendResult TrendAnalyzer::analyze(const common::YearlySeries& series) const {
    if (series.size() < kMinYears) {
        throw common::InsufficientSeriesError(series.size(), kMinYears);
    }
    const auto values = series.values();
    const std::size_t n = values.size();
    const std::size_t window = std::max<std::size_t>(1, n / 3);

    TrendResult r;
    r.yearCount = n;
    r.periodWindow = window;
    r.firstYear = series.front().year;
    r.lastYear = series.back().year;

    double firstSum = 0.0, recentSum = 0.0;
    for (std::size_t i = 0; i < window; ++i) {
        firstSum += values[i];
        recentSum += values[n - window + i];
    }
    r.firstPeriodAvg = firstSum / static_cast<double>(window);
    r.recentPeriodAvg = recentSum / static_cast<double>(window);

    const double delta = r.recentPeriodAvg - r.firstPeriodAvg;
    r.magnitude = std::fabs(delta);
    if (r.firstPeriodAvg != 0.0) {
        r.percentChange = delta / r.firstPeriodAvg * 100.0;
    } else {
        // Dark baseline: any rise counts as a full doubling
        r.percentChange = delta > 0.0 ? 100.0 : (delta < 0.0 ? -100.0 : 0.0);
    }

    if (std::fabs(r.percentChange) < cfg_.stableBandPercent) {
        r.direction = TrendDirection::Stable;
    } else {
        r.direction = r.percentChange > 0.0 ? TrendDirection::Worsening : TrendDirection::Improving;
    }

    std::vector<double> deltas;
    deltas.reserve(n - 1);
    for (std::size_t i = 1; i < n; ++i) deltas.push_back(values[i] - values[i - 1]);
    r.volatility = populationStdDev(deltas);

    r.significance = significance(series);

    if (log_) {
        log_->debug("Trend {}..{}: {} ({:+.2f}%), volatility={:.4f}, MK z={:.3f}",
                    r.firstYear, r.lastYear, toString(r.direction), r.percentChange, r.volatility,
                    r.significance.mannKendallZ);
    }
    return r;
}

} // namespace analysis
} // namespace backend
} // namespace nocturna

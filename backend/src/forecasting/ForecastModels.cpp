#include "ForecastModels.h"
#include "analysis/Regression.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nocturna::backend::forecasting {

using analysis::LinearFit;
using common::ModelFitError;
using common::YearlySeries;

namespace {

std::vector<double> yearOffsets(const YearlySeries& s) {
    std::vector<double> x;
    x.reserve(s.size());
    for (const auto& p : s.points()) x.push_back(static_cast<double>(p.year - s.front().year));
    return x;
}

bool consecutiveYears(const YearlySeries& s) {
    for (std::size_t i = 1; i < s.size(); ++i) {
        if (s[i].year - s[i - 1].year != 1) return false;
    }
    return true;
}

void requirePoints(const YearlySeries& s, std::size_t n, const std::string& model) {
    if (s.size() < n) {
        throw ModelFitError(model, "needs at least " + std::to_string(n) + " years, got " + std::to_string(s.size()));
    }
}

class FittedLinear : public IFittedModel {
public:
    FittedLinear(int originYear, LinearFit fit) : origin_(originYear), fit_(fit) {}
    double valueAt(int year) const override { return fit_.at(year - origin_); }
    std::map<std::string, double> parameters() const override {
        return {{"slope", fit_.slope}, {"intercept", fit_.intercept}, {"r_squared", fit_.rSquared}};
    }
private:
    int origin_;
    LinearFit fit_;
};

class FittedExponential : public IFittedModel {
public:
    FittedExponential(int originYear, LinearFit logFit) : origin_(originYear), fit_(logFit) {}
    double valueAt(int year) const override { return std::exp(fit_.at(year - origin_)); }
    std::map<std::string, double> parameters() const override {
        return {{"log_intercept", fit_.intercept},
                {"log_slope", fit_.slope},
                {"growth_rate", std::exp(fit_.slope) - 1.0},
                {"r_squared", fit_.rSquared}};
    }
private:
    int origin_;
    LinearFit fit_;
};

class FittedMovingAverage : public IFittedModel {
public:
    FittedMovingAverage(int lastYear, int window, double base, double slope, double centerOffset)
        : last_(lastYear), window_(window), base_(base), slope_(slope), center_(centerOffset) {}
    double valueAt(int year) const override {
        // base sits at the mean year offset of the window (<= 0, relative to last_)
        return base_ + slope_ * ((year - last_) - center_);
    }
    std::map<std::string, double> parameters() const override {
        return {{"window", static_cast<double>(window_)}, {"base", base_}, {"slope", slope_}};
    }
private:
    int last_;
    int window_;
    double base_;
    double slope_;
    double center_;
};

class FittedSeasonal : public IFittedModel {
public:
    FittedSeasonal(int originYear, LinearFit trend, std::vector<double> profile, double strength)
        : origin_(originYear), trend_(trend), profile_(std::move(profile)), strength_(strength) {}
    double valueAt(int year) const override {
        double v = trend_.at(year - origin_);
        if (!profile_.empty()) {
            const int period = static_cast<int>(profile_.size());
            const int phase = ((year - origin_) % period + period) % period;
            v += strength_ * profile_[static_cast<std::size_t>(phase)];
        }
        return v;
    }
    std::map<std::string, double> parameters() const override {
        double amplitude = 0.0;
        for (double c : profile_) amplitude = std::max(amplitude, std::fabs(c));
        return {{"slope", trend_.slope},
                {"intercept", trend_.intercept},
                {"cycle_period", static_cast<double>(profile_.size())},
                {"cycle_strength", profile_.empty() ? 0.0 : strength_},
                {"cycle_amplitude", strength_ * amplitude}};
    }
private:
    int origin_;
    LinearFit trend_;
    std::vector<double> profile_; // empty when no cycle was detected
    double strength_;
};

} // namespace

std::unique_ptr<IFittedModel> LinearTrendModel::fit(const YearlySeries& history) const {
    requirePoints(history, 2, name());
    return std::make_unique<FittedLinear>(history.front().year, analysis::fitLinear(yearOffsets(history), history.values()));
}

std::unique_ptr<IFittedModel> ExponentialTrendModel::fit(const YearlySeries& history) const {
    requirePoints(history, 2, name());
    std::vector<double> logs;
    logs.reserve(history.size());
    for (const auto& p : history.points()) {
        if (!(p.value > 0.0)) {
            throw ModelFitError(name(), "requires all values > 0 (year " + std::to_string(p.year) + " has "
                + std::to_string(p.value) + ")");
        }
        logs.push_back(std::log(p.value));
    }
    return std::make_unique<FittedExponential>(history.front().year, analysis::fitLinear(yearOffsets(history), logs));
}

std::unique_ptr<IFittedModel> MovingAverageModel::fit(const YearlySeries& history) const {
    requirePoints(history, 1, name());
    if (cfg_.window < 1) throw ModelFitError(name(), "window must be >= 1");
    const std::size_t w = std::min<std::size_t>(static_cast<std::size_t>(cfg_.window), history.size());
    const std::size_t start = history.size() - w;

    std::vector<double> x, y;
    for (std::size_t i = start; i < history.size(); ++i) {
        x.push_back(static_cast<double>(history[i].year - history.back().year));
        y.push_back(history[i].value);
    }
    const double base = analysis::mean(y);
    double slope = 0.0;
    if (cfg_.trendNudge && w >= 2) slope = analysis::fitLinear(x, y).slope;
    return std::make_unique<FittedMovingAverage>(history.back().year, static_cast<int>(w), base, slope,
                                                 analysis::mean(x));
}

std::unique_ptr<IFittedModel> SeasonalCycleModel::fit(const YearlySeries& history) const {
    requirePoints(history, 2, name());
    const auto x = yearOffsets(history);
    const auto y = history.values();
    const auto trend = analysis::fitLinear(x, y);

    std::vector<double> residuals;
    residuals.reserve(y.size());
    for (std::size_t i = 0; i < y.size(); ++i) residuals.push_back(y[i] - trend.at(x[i]));
    const double rMean = analysis::mean(residuals);
    double denom = 0.0, scale = 0.0;
    for (std::size_t i = 0; i < residuals.size(); ++i) {
        residuals[i] -= rMean;
        denom += residuals[i] * residuals[i];
        scale += y[i] * y[i];
    }

    const int n = static_cast<int>(residuals.size());
    const int hiLag = std::min(cfg_.maxLag, n / 2);
    int bestLag = 0;
    double bestAcf = 0.0;
    // Lags and phases are counted in years, so a cycle is only looked for on gap-free history.
    if (consecutiveYears(history) && denom > 1e-12 * std::max(1.0, scale)) {
        for (int lag = std::max(1, cfg_.minLag); lag <= hiLag; ++lag) {
            double num = 0.0;
            for (int i = 0; i + lag < n; ++i) num += residuals[i] * residuals[i + lag];
            const double acf = num / denom;
            if (acf > bestAcf) {
                bestAcf = acf;
                bestLag = lag;
            }
        }
    }

    std::vector<double> profile;
    if (bestLag > 0 && bestAcf >= cfg_.minCorrelation) {
        std::vector<double> sum(static_cast<std::size_t>(bestLag), 0.0);
        std::vector<int> count(static_cast<std::size_t>(bestLag), 0);
        for (int i = 0; i < n; ++i) {
            const auto phase = static_cast<std::size_t>(static_cast<int>(x[i]) % bestLag);
            sum[phase] += residuals[i];
            ++count[phase];
        }
        profile.resize(static_cast<std::size_t>(bestLag), 0.0);
        for (std::size_t p = 0; p < profile.size(); ++p) {
            if (count[p] > 0) profile[p] = sum[p] / count[p];
        }
        const double center = analysis::mean(profile);
        for (auto& c : profile) c -= center;
    }
    return std::make_unique<FittedSeasonal>(history.front().year, trend, std::move(profile), bestAcf);
}

} // namespace nocturna::backend::forecasting

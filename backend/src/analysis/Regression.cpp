#include "analysis/Regression.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace nocturna::backend::analysis {

double mean(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    double sum = 0.0;
    for (double x : v) sum += x;
    return sum / static_cast<double>(v.size());
}

double populationStdDev(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double m = mean(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return std::sqrt(ss / static_cast<double>(v.size()));
}

LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size() || x.empty()) {
        throw std::invalid_argument("fitLinear: x and y must be non-empty and of equal length");
    }
    const double mx = mean(x);
    const double my = mean(y);
    double sxx = 0.0, sxy = 0.0, syy = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }
    LinearFit fit;
    fit.slope = sxx > 0.0 ? sxy / sxx : 0.0;
    fit.intercept = my - fit.slope * mx;

    double ssRes = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        const double r = y[i] - fit.at(x[i]);
        ssRes += r * r;
    }
    fit.rSquared = syy > 0.0 ? std::clamp(1.0 - ssRes / syy, 0.0, 1.0) : 1.0;
    return fit;
}

double theilSenSlope(const std::vector<double>& x, const std::vector<double>& y) {
    std::vector<double> slopes;
    for (size_t i = 0; i < x.size(); ++i) {
        for (size_t j = i + 1; j < x.size(); ++j) {
            if (x[j] != x[i]) slopes.push_back((y[j] - y[i]) / (x[j] - x[i]));
        }
    }
    if (slopes.empty()) return 0.0;
    std::sort(slopes.begin(), slopes.end());
    const size_t mid = slopes.size() / 2;
    return slopes.size() % 2 ? slopes[mid] : 0.5 * (slopes[mid - 1] + slopes[mid]);
}

MannKendall mannKendall(const std::vector<double>& values) {
    MannKendall mk;
    const size_t n = values.size();
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            if (values[j] > values[i]) ++mk.s;
            else if (values[j] < values[i]) --mk.s;
        }
    }
    const double dn = static_cast<double>(n);
    mk.variance = dn * (dn - 1.0) * (2.0 * dn + 5.0) / 18.0;
    if (mk.variance > 0.0) {
        if (mk.s > 0) mk.z = (mk.s - 1) / std::sqrt(mk.variance);
        else if (mk.s < 0) mk.z = (mk.s + 1) / std::sqrt(mk.variance);
    }
    return mk;
}

} // namespace nocturna::backend::analysis

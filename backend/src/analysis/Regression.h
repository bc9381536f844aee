#ifndef NOCTURNA_BACKEND_ANALYSIS_REGRESSION_H
#define NOCTURNA_BACKEND_ANALYSIS_REGRESSION_H

#include <vector>

namespace nocturna::backend::analysis {

struct LinearFit {
    double slope = 0.0;
    double intercept = 0.0;
    double rSquared = 0.0;

    double at(double x) const { return intercept + slope * x; }
};

// Ordinary least squares y = intercept + slope * x. x and y must have equal,
// non-zero length. Constant x gives slope 0 through mean(y); a series with no
// variance in y reports rSquared 1.
LinearFit fitLinear(const std::vector<double>& x, const std::vector<double>& y);

// Median of pairwise slopes (y_j - y_i) / (x_j - x_i), i < j. 0 for fewer than 2 points.
double theilSenSlope(const std::vector<double>& x, const std::vector<double>& y);

struct MannKendall {
    long s = 0;
    double variance = 0.0;
    double z = 0.0;
};

// Mann-Kendall S with continuity-corrected z (no tie adjustment).
MannKendall mannKendall(const std::vector<double>& values);

// Population mean / standard deviation helpers.
double mean(const std::vector<double>& v);
double populationStdDev(const std::vector<double>& v);

} // namespace nocturna::backend::analysis

#endif // NOCTURNA_BACKEND_ANALYSIS_REGRESSION_H

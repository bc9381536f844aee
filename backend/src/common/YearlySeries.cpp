#include "common/YearlySeries.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace nocturna::backend::common {

YearlySeries::YearlySeries(std::vector<YearValue> points) : points_(std::move(points)) {
	for (std::size_t i = 0; i < points_.size(); ++i) {
		if (!std::isfinite(points_[i].value)) {
			throw InvalidSeriesError("non-finite value for year " + std::to_string(points_[i].year));
		}
		if (i > 0 && points_[i].year <= points_[i - 1].year) {
			throw InvalidSeriesError("years must be strictly increasing: " + std::to_string(points_[i - 1].year)
				+ " followed by " + std::to_string(points_[i].year));
		}
	}
}

YearlySeries YearlySeries::fromValues(int firstYear, const std::vector<double>& values) {
	std::vector<YearValue> pts;
	pts.reserve(values.size());
	for (std::size_t i = 0; i < values.size(); ++i) {
		pts.push_back({firstYear + static_cast<int>(i), values[i]});
	}
	return YearlySeries(std::move(pts));
}

std::vector<double> YearlySeries::values() const {
	std::vector<double> out;
	out.reserve(points_.size());
	for (const auto& p : points_) out.push_back(p.value);
	return out;
}

YearlySeries YearlySeries::head(std::size_t n) const {
	YearlySeries out;
	out.points_.assign(points_.begin(), points_.begin() + static_cast<std::ptrdiff_t>(std::min(n, points_.size())));
	return out;
}

} // namespace nocturna::backend::common

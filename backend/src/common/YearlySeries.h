#ifndef NOCTURNA_BACKEND_COMMON_YEARLY_SERIES_H
#define NOCTURNA_BACKEND_COMMON_YEARLY_SERIES_H

#include "common/DataTypes.h"

#include <cstddef>
#include <vector>

namespace nocturna::backend::common {

/**
 * Chronological (year, value) sequence for one location. Years are strictly
 * increasing and values finite; the constructor throws InvalidSeriesError
 * otherwise instead of sorting or dropping entries.
 */
class YearlySeries {
public:
	YearlySeries() = default;
	explicit YearlySeries(std::vector<YearValue> points);

	// Consecutive years starting at firstYear.
	static YearlySeries fromValues(int firstYear, const std::vector<double>& values);

	std::size_t size() const { return points_.size(); }
	bool empty() const { return points_.empty(); }
	const std::vector<YearValue>& points() const { return points_; }
	const YearValue& operator[](std::size_t i) const { return points_[i]; }
	const YearValue& front() const { return points_.front(); }
	const YearValue& back() const { return points_.back(); }

	std::vector<double> values() const;

	// First n points (all of them when n >= size()).
	YearlySeries head(std::size_t n) const;

private:
	std::vector<YearValue> points_;
};

} // namespace nocturna::backend::common

#endif // NOCTURNA_BACKEND_COMMON_YEARLY_SERIES_H

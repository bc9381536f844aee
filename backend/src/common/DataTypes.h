// Core data contracts shared by sampling, collection and analysis.

#pragma once

#include <chrono>
#include <cmath>
#include <optional>
#include <string>

namespace nocturna::backend::common {

struct GeoPoint {
	double lat = 0.0;
	double lng = 0.0;

	GeoPoint() = default;
	GeoPoint(double lat_, double lng_) : lat(lat_), lng(lng_) {}

	bool operator==(const GeoPoint& o) const { return lat == o.lat && lng == o.lng; }
	bool operator!=(const GeoPoint& o) const { return !(*this == o); }
};

enum class QualityTag { High, Medium, Low };

inline const char* toString(QualityTag q) {
	switch (q) {
		case QualityTag::High: return "high";
		case QualityTag::Medium: return "medium";
		case QualityTag::Low: return "low";
	}
	return "low";
}

// Accepts "high" / "medium" / "low" (case sensitive); nullopt otherwise.
inline std::optional<QualityTag> qualityFromString(const std::string& s) {
	if (s == "high") return QualityTag::High;
	if (s == "medium") return QualityTag::Medium;
	if (s == "low") return QualityTag::Low;
	return std::nullopt;
}

// One brightness reading. Produced by a gateway and never modified afterwards.
struct Measurement {
	GeoPoint location;
	double value = 0.0; // radiance, non-negative when valid
	QualityTag quality = QualityTag::Medium;
	std::string sourceLabel;
	std::optional<std::chrono::system_clock::time_point> observedAt;
};

// Brightness is a non-negative radiance; NaN, infinities and negatives are sensor or lookup garbage.
inline bool isUsableValue(double v) { return std::isfinite(v) && v >= 0.0; }

struct YearValue {
	int year = 0;
	double value = 0.0;
};

} // namespace nocturna::backend::common

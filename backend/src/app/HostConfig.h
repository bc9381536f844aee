#ifndef NOCTURNA_BACKEND_APP_HOST_CONFIG_H
#define NOCTURNA_BACKEND_APP_HOST_CONFIG_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

#include "AnalysisEngine.h"

namespace nocturna::backend::app {

// Everything the host application needs to run one analysis.
// Precedence: command line > NOCTURNA_* environment > defaults.
struct HostOptions {
	std::string gateway = "synthetic";  // synthetic | recorded
	std::string recordingPath;          // CSV for the recorded gateway
	std::optional<sampling::Geometry> area;
	std::optional<common::GeoPoint> point;
	int startYear = 2014;
	int endYear = 2023;
	int yearsForward = 5;
	std::vector<forecasting::PolicyScenario> scenarios;
	EngineConfig engine;
	bool showHelp = false;
};

struct ParseOutcome {
	bool ok = true;
	std::string error;
};

// Reads:
//   NOCTURNA_GATEWAY, NOCTURNA_RECORDING_PATH, NOCTURNA_SAMPLE_COUNT,
//   NOCTURNA_SAMPLER_SEED, NOCTURNA_MAX_IN_FLIGHT, NOCTURNA_MIN_VALID_SAMPLES,
//   NOCTURNA_FORECAST_MODELS, NOCTURNA_YEARS_FORWARD
// Malformed values are logged (when log is set) and leave the default in place.
HostOptions loadHostOptionsFromEnv(const std::shared_ptr<spdlog::logger>& log = nullptr);

// Applies argv on top of opts. Geometry flags build validated geometries and
// may throw InsufficientGeometryError.
ParseOutcome parseCommandLine(int argc, const char* const* argv, HostOptions& opts);

// "lng lat;lng lat;..." in selector order; the last vertex must repeat the first
std::optional<std::vector<common::GeoPoint>> parseRing(const std::string& text);
// "lat,lng"
std::optional<common::GeoPoint> parseLatLng(const std::string& text);
// "lat,lng,radius" with optional "m" / "deg" suffix on the radius (meters by default)
std::optional<sampling::Geometry> parsePointRegion(const std::string& text);
// "start:end"
std::optional<std::pair<int, int>> parseYearRange(const std::string& text);
// "name:effectPercent:startYear"
std::optional<forecasting::PolicyScenario> parseScenario(const std::string& text);

} // namespace nocturna::backend::app

#endif // NOCTURNA_BACKEND_APP_HOST_CONFIG_H

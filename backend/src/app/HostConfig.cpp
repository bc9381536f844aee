#include "app/HostConfig.h"

#include "common/Errors.h"
#include "forecasting/ModelSpecParser.h"

#include <cstdlib>
#include <set>
#include <sstream>

namespace nocturna::backend::app {

namespace {

std::optional<double> toDouble(const std::string& s) {
	try {
		size_t used = 0;
		double v = std::stod(s, &used);
		if (used == s.size()) return v;
	} catch (const std::logic_error&) {
	}
	return std::nullopt;
}

std::optional<long> toLong(const std::string& s) {
	try {
		size_t used = 0;
		long v = std::stol(s, &used);
		if (used == s.size()) return v;
	} catch (const std::logic_error&) {
	}
	return std::nullopt;
}

std::vector<std::string> split(const std::string& s, char sep) {
	std::vector<std::string> out;
	std::stringstream ss(s);
	std::string part;
	while (std::getline(ss, part, sep)) out.push_back(part);
	return out;
}

std::optional<long> envLong(const char* name, long minValue, const std::shared_ptr<spdlog::logger>& log) {
	const char* raw = std::getenv(name);
	if (!raw) return std::nullopt;
	auto v = toLong(raw);
	if (!v || *v < minValue) {
		if (log) log->warn("Ignoring {}='{}' (expected integer >= {})", name, raw, minValue);
		return std::nullopt;
	}
	return v;
}

bool applyModels(const std::string& text, HostOptions& opts, std::string& error) {
	auto parsed = forecasting::parseModelSpec(text);
	if (!parsed.ok) {
		error = parsed.error;
		return false;
	}
	// Build every model now so a bad name or parameter never reaches the engine
	std::set<std::string> seen;
	for (const auto& spec : parsed.models) {
		try {
			auto model = forecasting::createForecastModel(spec);
			if (!seen.insert(model->name()).second) {
				error = "forecast model '" + model->name() + "' listed twice";
				return false;
			}
		} catch (const common::InvalidRequestError& e) {
			error = e.what();
			return false;
		}
	}
	opts.engine.forecast.models = std::move(parsed.models);
	return true;
}

} // namespace

std::optional<std::vector<common::GeoPoint>> parseRing(const std::string& text) {
	std::vector<common::GeoPoint> ring;
	for (const auto& vertex : split(text, ';')) {
		std::istringstream vs(vertex);
		std::string lngText, latText, extra;
		if (!(vs >> lngText >> latText) || (vs >> extra)) return std::nullopt;
		auto lng = toDouble(lngText);
		auto lat = toDouble(latText);
		if (!lng || !lat) return std::nullopt;
		ring.push_back({*lat, *lng});
	}
	if (ring.empty()) return std::nullopt;
	return ring;
}

std::optional<common::GeoPoint> parseLatLng(const std::string& text) {
	auto parts = split(text, ',');
	if (parts.size() != 2) return std::nullopt;
	auto lat = toDouble(parts[0]);
	auto lng = toDouble(parts[1]);
	if (!lat || !lng) return std::nullopt;
	return common::GeoPoint{*lat, *lng};
}

std::optional<sampling::Geometry> parsePointRegion(const std::string& text) {
	auto parts = split(text, ',');
	if (parts.size() != 3) return std::nullopt;
	auto lat = toDouble(parts[0]);
	auto lng = toDouble(parts[1]);
	std::string radiusText = parts[2];
	sampling::RadiusUnit unit = sampling::RadiusUnit::Meters;
	if (radiusText.size() > 3 && radiusText.compare(radiusText.size() - 3, 3, "deg") == 0) {
		unit = sampling::RadiusUnit::Degrees;
		radiusText.resize(radiusText.size() - 3);
	} else if (radiusText.size() > 1 && radiusText.back() == 'm') {
		radiusText.pop_back();
	}
	auto radius = toDouble(radiusText);
	if (!lat || !lng || !radius) return std::nullopt;
	return sampling::Geometry::pointRegion({*lat, *lng}, *radius, unit);
}

std::optional<std::pair<int, int>> parseYearRange(const std::string& text) {
	auto parts = split(text, ':');
	if (parts.size() != 2) return std::nullopt;
	auto start = toLong(parts[0]);
	auto end = toLong(parts[1]);
	if (!start || !end || *start > *end) return std::nullopt;
	return std::make_pair(static_cast<int>(*start), static_cast<int>(*end));
}

std::optional<forecasting::PolicyScenario> parseScenario(const std::string& text) {
	auto parts = split(text, ':');
	if (parts.size() != 3 || parts[0].empty()) return std::nullopt;
	auto effect = toDouble(parts[1]);
	auto start = toLong(parts[2]);
	if (!effect || !start) return std::nullopt;
	return forecasting::PolicyScenario{parts[0], *effect, static_cast<int>(*start)};
}

HostOptions loadHostOptionsFromEnv(const std::shared_ptr<spdlog::logger>& log) {
	HostOptions opts;
	if (const char* g = std::getenv("NOCTURNA_GATEWAY")) opts.gateway = g;
	if (const char* p = std::getenv("NOCTURNA_RECORDING_PATH")) opts.recordingPath = p;
	if (auto v = envLong("NOCTURNA_SAMPLE_COUNT", 1, log)) opts.engine.sampleCount = static_cast<std::size_t>(*v);
	if (auto v = envLong("NOCTURNA_SAMPLER_SEED", 0, log)) opts.engine.sampler.seed = static_cast<uint32_t>(*v);
	if (auto v = envLong("NOCTURNA_MAX_IN_FLIGHT", 1, log)) opts.engine.collector.maxInFlight = static_cast<unsigned>(*v);
	if (auto v = envLong("NOCTURNA_MIN_VALID_SAMPLES", 2, log)) {
		opts.engine.collector.minValidSamples = static_cast<std::size_t>(*v);
		opts.engine.statistics.minValidSamples = static_cast<std::size_t>(*v);
	}
	if (const char* m = std::getenv("NOCTURNA_FORECAST_MODELS")) {
		std::string error;
		if (!applyModels(m, opts, error) && log) {
			log->warn("Ignoring NOCTURNA_FORECAST_MODELS='{}': {}", m, error);
		}
	}
	if (auto v = envLong("NOCTURNA_YEARS_FORWARD", 1, log)) opts.yearsForward = static_cast<int>(*v);
	return opts;
}

ParseOutcome parseCommandLine(int argc, const char* const* argv, HostOptions& opts) {
	ParseOutcome out;
	auto failWith = [&out](std::string message) {
		out.ok = false;
		out.error = std::move(message);
		return out;
	};
	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--help" || arg == "-h") {
			opts.showHelp = true;
			continue;
		}
		if (i + 1 >= argc) return failWith("missing value for " + arg);
		const std::string value = argv[++i];
		if (arg == "--area-polygon") {
			auto ring = parseRing(value);
			if (!ring) return failWith("malformed polygon: " + value);
			opts.area = sampling::Geometry::polygon(std::move(*ring));
		} else if (arg == "--area-point") {
			auto region = parsePointRegion(value);
			if (!region) return failWith("malformed point region: " + value);
			opts.area = std::move(region);
		} else if (arg == "--point") {
			auto p = parseLatLng(value);
			if (!p) return failWith("malformed point: " + value);
			opts.point = *p;
		} else if (arg == "--years") {
			auto range = parseYearRange(value);
			if (!range) return failWith("malformed year range: " + value);
			opts.startYear = range->first;
			opts.endYear = range->second;
		} else if (arg == "--forecast") {
			auto years = toLong(value);
			if (!years || *years < 1) return failWith("--forecast expects a positive integer");
			opts.yearsForward = static_cast<int>(*years);
		} else if (arg == "--samples") {
			auto n = toLong(value);
			if (!n || *n < 1) return failWith("--samples expects a positive integer");
			opts.engine.sampleCount = static_cast<std::size_t>(*n);
		} else if (arg == "--seed") {
			auto n = toLong(value);
			if (!n || *n < 0) return failWith("--seed expects a non-negative integer");
			opts.engine.sampler.seed = static_cast<uint32_t>(*n);
		} else if (arg == "--models") {
			std::string error;
			if (!applyModels(value, opts, error)) return failWith("bad --models: " + error);
		} else if (arg == "--gateway") {
			if (value != "synthetic" && value != "recorded") return failWith("unknown gateway: " + value);
			opts.gateway = value;
		} else if (arg == "--recording") {
			opts.recordingPath = value;
		} else if (arg == "--scenario") {
			auto sc = parseScenario(value);
			if (!sc) return failWith("malformed scenario: " + value);
			opts.scenarios.push_back(*sc);
		} else {
			return failWith("unknown argument: " + arg);
		}
	}
	return out;
}

} // namespace nocturna::backend::app

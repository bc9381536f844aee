// Orchestrates area and point analyses over an injected measurement gateway.

#ifndef NOCTURNA_BACKEND_ANALYSIS_ENGINE_H
#define NOCTURNA_BACKEND_ANALYSIS_ENGINE_H

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/logger.h>

#include "analysis/AnalysisTypes.h"
#include "analysis/AnomalyDetector.h"
#include "analysis/DescriptiveStatistics.h"
#include "analysis/TrendAnalyzer.h"
#include "common/YearlySeries.h"
#include "forecasting/EnsembleForecaster.h"
#include "forecasting/ScenarioSimulator.h"
#include "gateway/MeasurementCollector.h"
#include "sampling/RegionSampler.h"

namespace nocturna::backend {

struct EngineConfig {
	std::size_t sampleCount = 32;
	sampling::SamplerConfig sampler;
	gateway::MeasurementCollector::Config collector;
	analysis::DescriptiveStatistics::Config statistics;
	analysis::TrendAnalyzer::Config trend;
	analysis::AnomalyDetector::Config anomaly;
	forecasting::EnsembleForecaster::Config forecast;
};

struct AreaReport {
	sampling::SamplingResult sampling;
	sampling::Coverage coverage;
	bool cancelled = false;
	analysis::StatisticsResult statistics;
};

struct PointRequest {
	common::GeoPoint location;
	int startYear = 2014;
	int endYear = 2023;
	int yearsForward = 5;
	std::vector<forecasting::PolicyScenario> scenarios;
};

struct PointReport {
	common::GeoPoint location;
	common::YearlySeries series;
	analysis::TrendResult trend;
	forecasting::EnsembleResult forecast;
	analysis::AnomalyResult anomaly; // last year against the years before it
	std::vector<forecasting::ScenarioProjection> scenarios;
};

class AnalysisEngine {
public:
	// Component loggers are looked up by canonical name; without an
	// initialized Logger the engine runs silently.
	AnalysisEngine(std::shared_ptr<gateway::IMeasurementGateway> gateway, EngineConfig cfg = {});

	// RegionSampler -> concurrent gateway lookups -> DescriptiveStatistics.
	// Throws InsufficientDataError / GatewayUnavailableError for whole-batch failures.
	AreaReport analyzeArea(const sampling::Geometry& geometry, const std::atomic<bool>* cancel = nullptr) const;

	// Gateway series -> TrendAnalyzer + EnsembleForecaster (+ scenarios).
	// Throws InsufficientSeriesError / InsufficientHistoryError for short series.
	PointReport analyzePoint(const PointRequest& request) const;

	const EngineConfig& config() const { return cfg_; }

private:
	std::shared_ptr<spdlog::logger> lifecycleLogger_;
	std::shared_ptr<gateway::IMeasurementGateway> gateway_;
	EngineConfig cfg_;
	sampling::RegionSampler sampler_;
	gateway::MeasurementCollector collector_;
	analysis::DescriptiveStatistics statistics_;
	analysis::TrendAnalyzer trend_;
	analysis::AnomalyDetector anomaly_;
	forecasting::EnsembleForecaster forecaster_;
	forecasting::ScenarioSimulator scenarios_;
};

} // namespace nocturna::backend

#endif // NOCTURNA_BACKEND_ANALYSIS_ENGINE_H

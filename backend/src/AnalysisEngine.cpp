#include "AnalysisEngine.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "common/LoggingNames.h"
#include "gateway/IMeasurementGateway.h"

namespace nocturna::backend {

namespace {
std::shared_ptr<spdlog::logger> named(const char* name) {
	return common::Logger::instance().tryGet(name);
}
}

AnalysisEngine::AnalysisEngine(std::shared_ptr<gateway::IMeasurementGateway> gateway, EngineConfig cfg)
	: lifecycleLogger_(named(logging_names::APP_LIFECYCLE)),
	  gateway_(std::move(gateway)),
	  cfg_(std::move(cfg)),
	  sampler_(cfg_.sampler, named(logging_names::SAMPLING_REGION)),
	  collector_(gateway_, cfg_.collector, named(logging_names::GATEWAY_COLLECTOR)),
	  statistics_(cfg_.statistics, named(logging_names::ANALYSIS_STATS)),
	  trend_(cfg_.trend, named(logging_names::ANALYSIS_TREND)),
	  anomaly_(cfg_.anomaly),
	  forecaster_(cfg_.forecast, named(logging_names::FORECAST_ENSEMBLE), named(logging_names::FORECAST_VALIDATION))
{
	if (lifecycleLogger_) {
		lifecycleLogger_->info("AnalysisEngine wired (gateway={}, samples={}, in_flight={})",
			gateway_->getGatewayID(), cfg_.sampleCount, cfg_.collector.maxInFlight);
	}
}

AreaReport AnalysisEngine::analyzeArea(const sampling::Geometry& geometry, const std::atomic<bool>* cancel) const {
	AreaReport report;
	report.sampling = sampler_.generateSamples(geometry, cfg_.sampleCount);
	auto samples = collector_.collect(geometry, report.sampling.locations, cancel);
	report.coverage = samples.coverage();
	report.cancelled = samples.cancelled();
	report.statistics = statistics_.summarize(samples);
	return report;
}

PointReport AnalysisEngine::analyzePoint(const PointRequest& request) const {
	if (request.startYear > request.endYear) {
		throw common::InvalidRequestError("start year " + std::to_string(request.startYear)
			+ " is after end year " + std::to_string(request.endYear));
	}
	PointReport report;
	report.location = request.location;
	report.series = gateway_->fetchSeries(request.location.lat, request.location.lng, request.startYear, request.endYear);
	report.trend = trend_.analyze(report.series);
	report.forecast = forecaster_.forecast(report.series, request.yearsForward);

	auto values = report.series.values();
	const double current = values.back();
	values.pop_back();
	report.anomaly = anomaly_.evaluate(current, values);

	report.scenarios = scenarios_.simulate(report.series, report.forecast, request.scenarios);

	if (lifecycleLogger_) {
		lifecycleLogger_->info("Point ({:.4f},{:.4f}) {}..{}: trend={} forecast_models={} anomaly={}",
			request.location.lat, request.location.lng, report.trend.firstYear, report.trend.lastYear,
			analysis::toString(report.trend.direction), report.forecast.models.size(), report.anomaly.isAnomaly);
	}
	return report;
}

} // namespace nocturna::backend

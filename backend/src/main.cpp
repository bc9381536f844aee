#include "common/Logger.h"
#include "common/LoggingNames.h"

#include "AnalysisEngine.h"
#include "app/HostConfig.h"
#include "common/Errors.h"
#include "gateway/RecordedMeasurementGateway.h"
#include "gateway/SyntheticMeasurementGateway.h"
#include "report/ReportWriter.h"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Area analysis (one of):\n";
    std::cout << "  --area-polygon \"LNG LAT;...\"  Closed polygon ring (last vertex repeats the first)\n";
    std::cout << "  --area-point LAT,LNG,R[m|deg] Circle around a point (meters by default)\n";
    std::cout << "Point analysis:\n";
    std::cout << "  --point LAT,LNG               Trend + forecast for one location\n";
    std::cout << "  --years START:END             History range (default 2014:2023)\n";
    std::cout << "  --forecast N                  Years to forecast (default 5)\n";
    std::cout << "  --scenario NAME:EFFECT:YEAR   Policy scenario, EFFECT in percent of growth (repeatable)\n";
    std::cout << "Options:\n";
    std::cout << "  --samples N                   Sample locations per area (default 32)\n";
    std::cout << "  --seed N                      Sampler seed\n";
    std::cout << "  --models SPEC                 e.g. linear,exponential,moving_average(window=3),seasonal(max_lag=4)\n";
    std::cout << "  --gateway synthetic|recorded  Measurement source (default synthetic)\n";
    std::cout << "  --recording FILE              CSV for the recorded gateway (lat,lng,year,value,quality,source)\n";
    std::cout << "  --help, -h                    Show this help message\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  NOCTURNA_GATEWAY              Same as --gateway\n";
    std::cout << "  NOCTURNA_RECORDING_PATH       Same as --recording\n";
    std::cout << "  NOCTURNA_SAMPLE_COUNT         Same as --samples\n";
    std::cout << "  NOCTURNA_SAMPLER_SEED         Same as --seed\n";
    std::cout << "  NOCTURNA_MAX_IN_FLIGHT        Concurrent gateway lookups (default 8)\n";
    std::cout << "  NOCTURNA_MIN_VALID_SAMPLES    Minimum usable samples per area (default 2)\n";
    std::cout << "  NOCTURNA_FORECAST_MODELS      Same as --models\n";
    std::cout << "  NOCTURNA_YEARS_FORWARD        Same as --forecast\n";
    std::cout << "  NOCTURNA_LOG_LEVEL            Global log level\n";
}

int main(int argc, char* argv[]) {
	using nocturna::backend::common::Logger;
	using namespace nocturna::backend::logging_names;
	using namespace nocturna::backend;

	Logger::instance().initialize("logs/backend/nocturna.log", spdlog::level::info);
	// Reports go to stdout; keep console chatter to warnings unless NOCTURNA_LOG_LEVEL says otherwise
	if (!std::getenv("NOCTURNA_LOG_LEVEL")) {
		Logger::instance().setGlobalLevel(spdlog::level::warn);
	}

	report::ReportWriter writer;
	try {
		auto appLog    = Logger::instance().get(APP_LIFECYCLE);
		auto configLog = Logger::instance().get(APP_CONFIG);
		auto sourceLog = Logger::instance().get(GATEWAY_SOURCE);

		app::HostOptions opts = app::loadHostOptionsFromEnv(configLog);
		auto parsed = app::parseCommandLine(argc, argv, opts);
		if (!parsed.ok) {
			std::cerr << parsed.error << std::endl;
			printUsage(argv[0]);
			Logger::instance().shutdown();
			return 1;
		}
		if (opts.showHelp || (!opts.area && !opts.point)) {
			printUsage(argv[0]);
			Logger::instance().shutdown();
			return opts.showHelp ? 0 : 1;
		}

		std::shared_ptr<gateway::IMeasurementGateway> source;
		if (opts.gateway == "recorded") {
			auto recorded = std::make_shared<gateway::RecordedMeasurementGateway>(opts.recordingPath);
			if (!recorded->load()) {
				throw common::GatewayUnavailableError("cannot load recording '" + opts.recordingPath + "'");
			}
			source = recorded;
			sourceLog->info("Factory: using RecordedMeasurementGateway file={} readings={}", opts.recordingPath, recorded->getRecordCount());
		} else {
			gateway::SyntheticMeasurementGateway::Config cfg;
			cfg.gatewayId = "synthetic";
			source = std::make_shared<gateway::SyntheticMeasurementGateway>(cfg, sourceLog);
			sourceLog->info("Factory: using SyntheticMeasurementGateway");
		}

		AnalysisEngine engine(source, opts.engine);
		if (opts.area) {
			std::cout << writer.serialize(engine.analyzeArea(*opts.area));
		}
		if (opts.point) {
			PointRequest request;
			request.location = *opts.point;
			request.startYear = opts.startYear;
			request.endYear = opts.endYear;
			request.yearsForward = opts.yearsForward;
			request.scenarios = opts.scenarios;
			std::cout << writer.serialize(engine.analyzePoint(request));
		}
		appLog->info("Analysis complete");
	} catch (const common::AnalysisError& ex) {
		std::cout << writer.serializeError(ex);
		if (auto lg = Logger::instance().tryGet(APP_LIFECYCLE)) lg->error("Analysis failed ({}): {}", ex.kind(), ex.what());
		Logger::instance().shutdown();
		return 1;
	} catch (const std::exception& ex) {
		std::cerr << "Fatal exception: " << ex.what() << std::endl;
		if (auto lg = Logger::instance().tryGet(APP_LIFECYCLE)) lg->critical(std::string("Fatal exception: ") + ex.what());
		Logger::instance().shutdown();
		return 2;
	}

	Logger::instance().shutdown();
	return 0;
}

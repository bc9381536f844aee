#ifndef NOCTURNA_BACKEND_COMMON_LOGGING_NAMES_H
#define NOCTURNA_BACKEND_COMMON_LOGGING_NAMES_H

// Central place for canonical logger name strings.
// Keep names stable for tooling / filtering.
namespace nocturna::backend::logging_names {
// Application / lifecycle
constexpr const char* APP_LIFECYCLE = "App.Lifecycle";
constexpr const char* APP_CONFIG    = "App.Config";

// Area sampling and measurement collection
constexpr const char* SAMPLING_REGION   = "Sampling.Region";
constexpr const char* GATEWAY_COLLECTOR = "Gateway.Collector";
constexpr const char* GATEWAY_SOURCE    = "Gateway.Source";

// Analysis
constexpr const char* ANALYSIS_STATS = "Analysis.Statistics";
constexpr const char* ANALYSIS_TREND = "Analysis.Trend";

// Forecasting
constexpr const char* FORECAST_ENSEMBLE   = "Forecast.Ensemble";
constexpr const char* FORECAST_VALIDATION = "Forecast.Validation";

// Output
constexpr const char* REPORT_WRITER = "Report.Writer";

// Misc
constexpr const char* TEST = "Test";
}

#endif // NOCTURNA_BACKEND_COMMON_LOGGING_NAMES_H

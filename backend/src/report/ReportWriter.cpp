#include "report/ReportWriter.h"

#include <cmath>
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <vector>

namespace nocturna::backend::report {

std::string jsonString(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

namespace {

// Streaming writer that tracks commas and indentation for nested containers.
class JsonOut {
public:
    explicit JsonOut(int precision) { os_ << std::fixed << std::setprecision(precision); }

    JsonOut& open(const char* key, char bracket) {
        prefix(key);
        os_ << bracket;
        first_.push_back(true);
        return *this;
    }
    JsonOut& close(char bracket) {
        const bool empty = first_.back();
        first_.pop_back();
        if (!empty) {
            os_ << "\n";
            indent();
        }
        os_ << bracket;
        return *this;
    }
    JsonOut& object(const char* key = nullptr) { return open(key, '{'); }
    JsonOut& endObject() { return close('}'); }
    JsonOut& array(const char* key = nullptr) { return open(key, '['); }
    JsonOut& endArray() { return close(']'); }

    JsonOut& num(const char* key, double v) {
        prefix(key);
        if (std::isfinite(v)) os_ << v; else os_ << "null";
        return *this;
    }
    JsonOut& count(const char* key, std::size_t v) { prefix(key); os_ << v; return *this; }
    JsonOut& integer(const char* key, long v) { prefix(key); os_ << v; return *this; }
    JsonOut& boolean(const char* key, bool v) { prefix(key); os_ << (v ? "true" : "false"); return *this; }
    JsonOut& str(const char* key, const std::string& v) { prefix(key); os_ << jsonString(v); return *this; }

    std::string text() const { return os_.str() + "\n"; }

private:
    void indent() { for (std::size_t i = 0; i < first_.size(); ++i) os_ << "  "; }
    void prefix(const char* key) {
        if (!first_.empty()) {
            if (!first_.back()) os_ << ",";
            first_.back() = false;
            os_ << "\n";
            indent();
        }
        if (key) os_ << jsonString(key) << ": ";
    }

    std::ostringstream os_;
    std::vector<bool> first_;
};

void writeStatistics(JsonOut& j, const char* key, const analysis::StatisticsResult& s) {
    j.object(key)
        .count("count", s.count)
        .count("totalCount", s.totalCount)
        .count("excludedCount", s.excludedCount)
        .num("mean", s.mean)
        .num("median", s.median)
        .num("variance", s.variance)
        .num("stdDev", s.stdDev)
        .num("min", s.min)
        .num("max", s.max)
        .num("range", s.range)
        .num("percentile25", s.percentile25)
        .num("percentile75", s.percentile75)
        .num("percentile95", s.percentile95)
        .num("skewness", s.skewness)
        .num("kurtosis", s.kurtosis);
    j.object("confidenceInterval")
        .num("lower", s.confidenceInterval.lower)
        .num("upper", s.confidenceInterval.upper)
        .num("margin", s.confidenceInterval.margin)
        .endObject();
    j.object("quality")
        .count("high", s.quality.high)
        .count("medium", s.quality.medium)
        .count("low", s.quality.low)
        .endObject();
    j.endObject();
}

void writeTrend(JsonOut& j, const char* key, const analysis::TrendResult& t) {
    j.object(key)
        .str("direction", analysis::toString(t.direction))
        .num("percentChange", t.percentChange)
        .num("magnitude", t.magnitude)
        .num("volatility", t.volatility)
        .num("firstPeriodAvg", t.firstPeriodAvg)
        .num("recentPeriodAvg", t.recentPeriodAvg)
        .count("periodWindow", t.periodWindow)
        .count("yearCount", t.yearCount)
        .integer("firstYear", t.firstYear)
        .integer("lastYear", t.lastYear);
    const auto& sig = t.significance;
    j.object("significance")
        .num("slope", sig.slope)
        .num("intercept", sig.intercept)
        .num("rSquared", sig.rSquared)
        .num("theilSenSlope", sig.theilSenSlope)
        .integer("mannKendallS", sig.mannKendallS)
        .num("mannKendallZ", sig.mannKendallZ)
        .num("confidence", sig.confidence)
        .endObject();
    j.endObject();
}

void writeModel(JsonOut& j, const char* key, const forecasting::PredictionModel& m) {
    j.object(key)
        .str("name", m.name)
        .str("algorithmKind", forecasting::toString(m.kind));
    j.object("parameters");
    for (const auto& [name, value] : m.parameters) j.num(name.c_str(), value);
    j.endObject();
    j.array("predictions");
    for (const auto& p : m.predictions) {
        j.object().integer("year", p.year).num("value", p.value).num("min", p.min).num("max", p.max).endObject();
    }
    j.endArray();
    j.endObject();
}

void writeForecast(JsonOut& j, const char* key, const forecasting::EnsembleResult& f) {
    j.object(key)
        .count("historyYears", f.historyYears)
        .integer("yearsForward", f.yearsForward);
    j.array("models");
    for (const auto& m : f.models) writeModel(j, nullptr, m);
    j.endArray();
    j.object("validation");
    for (const auto& v : f.validation) {
        j.object(v.modelName.c_str())
            .num("mae", v.mae)
            .str("qualityGrade", forecasting::toString(v.grade))
            .count("trainingSize", v.trainingSize)
            .count("heldOut", v.heldOut)
            .endObject();
    }
    j.endObject();
    writeModel(j, "ensembleModel", f.ensembleModel);
    j.array("uncertainty");
    for (const auto& b : f.uncertainty) {
        j.object().integer("year", b.year).num("lowerBound", b.lowerBound).num("upperBound", b.upperBound).endObject();
    }
    j.endArray();
    j.array("skipped");
    for (const auto& s : f.skipped) {
        j.object().str("name", s.name).str("reason", s.reason).endObject();
    }
    j.endArray();
    j.endObject();
}

} // namespace

std::string ReportWriter::serialize(const analysis::StatisticsResult& stats) const {
    JsonOut j(precision_);
    writeStatistics(j, nullptr, stats);
    return j.text();
}

std::string ReportWriter::serialize(const analysis::TrendResult& trend) const {
    JsonOut j(precision_);
    writeTrend(j, nullptr, trend);
    return j.text();
}

std::string ReportWriter::serialize(const forecasting::EnsembleResult& forecast) const {
    JsonOut j(precision_);
    writeForecast(j, nullptr, forecast);
    return j.text();
}

std::string ReportWriter::serialize(const AreaReport& report) const {
    JsonOut j(precision_);
    j.object();
    j.object("sampling")
        .count("requested", report.sampling.requested)
        .count("generated", report.sampling.locations.size())
        .count("attempts", report.sampling.attempts)
        .boolean("budgetExhausted", report.sampling.budgetExhausted)
        .endObject();
    const auto& c = report.coverage;
    j.object("coverage")
        .count("requested", c.requested)
        .count("resolved", c.resolved)
        .count("absent", c.absent())
        .count("rejected", c.rejected)
        .count("notFound", c.notFound)
        .count("failed", c.failed)
        .count("unavailable", c.unavailable)
        .count("cancelled", c.cancelled)
        .num("ratio", c.ratio())
        .endObject();
    j.boolean("cancelled", report.cancelled);
    writeStatistics(j, "statistics", report.statistics);
    j.endObject();
    return j.text();
}

std::string ReportWriter::serialize(const PointReport& report) const {
    JsonOut j(precision_);
    j.object();
    j.object("location").num("lat", report.location.lat).num("lng", report.location.lng).endObject();
    j.array("series");
    for (const auto& p : report.series.points()) {
        j.object().integer("year", p.year).num("value", p.value).endObject();
    }
    j.endArray();
    writeTrend(j, "trend", report.trend);
    writeForecast(j, "forecast", report.forecast);
    const auto& a = report.anomaly;
    j.object("anomaly")
        .num("value", a.value)
        .num("zScore", a.zScore)
        .boolean("isAnomaly", a.isAnomaly)
        .count("historyCount", a.historyCount)
        .num("historicalMean", a.historicalMean)
        .num("historicalStdDev", a.historicalStdDev)
        .endObject();
    j.array("scenarios");
    for (const auto& s : report.scenarios) {
        j.object()
            .str("name", s.name)
            .num("effectPercent", s.effectPercent)
            .integer("startYear", s.startYear)
            .num("baselineRate", s.baselineRate)
            .num("effectiveRate", s.effectiveRate);
        j.array("values");
        for (const auto& v : s.values) j.object().integer("year", v.year).num("value", v.value).endObject();
        j.endArray();
        j.endObject();
    }
    j.endArray();
    j.endObject();
    return j.text();
}

std::string ReportWriter::serializeError(const common::AnalysisError& error) const {
    JsonOut j(precision_);
    j.object();
    j.object("error")
        .str("kind", error.kind())
        .str("category", common::toString(error.category()))
        .str("message", error.what())
        .endObject();
    j.endObject();
    return j.text();
}

} // namespace nocturna::backend::report

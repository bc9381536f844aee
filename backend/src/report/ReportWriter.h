#ifndef NOCTURNA_BACKEND_REPORT_REPORT_WRITER_H
#define NOCTURNA_BACKEND_REPORT_REPORT_WRITER_H

#include <string>

#include "AnalysisEngine.h"
#include "common/Errors.h"

namespace nocturna::backend::report {

// JSON rendering of engine results for the presentation layer. Field names
// follow the result structs; non-finite numbers are written as null.
class ReportWriter {
public:
    explicit ReportWriter(int precision = 6) : precision_(precision) {}

    std::string serialize(const analysis::StatisticsResult& stats) const;
    std::string serialize(const analysis::TrendResult& trend) const;
    std::string serialize(const forecasting::EnsembleResult& forecast) const;
    std::string serialize(const AreaReport& report) const;
    std::string serialize(const PointReport& report) const;

    // {"error": {"kind": ..., "category": ..., "message": ...}}
    std::string serializeError(const common::AnalysisError& error) const;

private:
    int precision_;
};

// Quotes and escapes a string for JSON output.
std::string jsonString(const std::string& s);

} // namespace nocturna::backend::report

#endif // NOCTURNA_BACKEND_REPORT_REPORT_WRITER_H

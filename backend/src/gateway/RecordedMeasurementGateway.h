#ifndef NOCTURNA_BACKEND_GATEWAY_RECORDED_MEASUREMENT_GATEWAY_H
#define NOCTURNA_BACKEND_GATEWAY_RECORDED_MEASUREMENT_GATEWAY_H

#include "gateway/IMeasurementGateway.h"
#include "common/DataTypes.h"
#include <string>
#include <vector>
#include <memory>
#include <spdlog/spdlog.h>

namespace nocturna::backend::gateway {

/**
 * RecordedMeasurementGateway answers lookups from a CSV recording of
 * station readings.
 *
 * File format (one reading per line, '#' starts a comment, optional header):
 *   lat,lng,year,value,quality,source
 *
 * Lookups snap to the nearest recorded station within the match tolerance.
 * fetchPoint() reports that station's most recent year; fetchSeries() reports
 * its years within the requested range, averaging duplicate readings per year.
 *
 * Usage:
 *   RecordedMeasurementGateway gw("stations.csv");
 *   if (!gw.load()) { ... }
 *   auto m = gw.fetchPoint(40.01, -105.27);
 */
class RecordedMeasurementGateway : public IMeasurementGateway {
public:
    struct Record {
        common::GeoPoint location;
        int year = 0;
        double value = 0.0;
        common::QualityTag quality = common::QualityTag::Medium;
        std::string source;
    };

    explicit RecordedMeasurementGateway(const std::string& dataFile, double matchToleranceDeg = 0.05);

    // Parses the recording; malformed lines are logged and skipped.
    bool load();

    std::optional<Measurement> fetchPoint(double lat, double lng) override;
    YearlySeries fetchSeries(double lat, double lng, int startYear, int endYear) override;
    std::string getGatewayID() const override { return "Recorded_" + data_file_; }

    size_t getRecordCount() const { return records_.size(); }
    size_t getSkippedLineCount() const { return skipped_lines_; }
    bool isDataLoaded() const { return data_loaded_; }

private:
    bool parseLine(const std::string& line, Record& out) const;
    // Location of the nearest station within tolerance, if any.
    std::optional<common::GeoPoint> nearestStation(double lat, double lng) const;

    std::string data_file_;
    double match_tolerance_deg_;
    std::vector<Record> records_;
    size_t skipped_lines_ = 0;
    bool data_loaded_ = false;

    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace nocturna::backend::gateway

#endif // NOCTURNA_BACKEND_GATEWAY_RECORDED_MEASUREMENT_GATEWAY_H

#include "gateway/RecordedMeasurementGateway.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/LoggingNames.h"
#include <filesystem>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

namespace nocturna::backend::gateway {

namespace {
void trim(std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) { s.clear(); return; }
    const auto e = s.find_last_not_of(" \t\r");
    s = s.substr(b, e - b + 1);
}
}

RecordedMeasurementGateway::RecordedMeasurementGateway(const std::string& dataFile, double matchToleranceDeg)
    : data_file_(dataFile), match_tolerance_deg_(matchToleranceDeg) {
    logger_ = common::Logger::instance().tryGet(logging_names::GATEWAY_SOURCE);
}

bool RecordedMeasurementGateway::parseLine(const std::string& line, Record& out) const {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        trim(field);
        fields.push_back(field);
    }
    if (fields.size() < 4) return false;
    try {
        size_t used = 0;
        out.location.lat = std::stod(fields[0], &used);
        if (used != fields[0].size()) return false;
        out.location.lng = std::stod(fields[1], &used);
        if (used != fields[1].size()) return false;
        out.year = std::stoi(fields[2], &used);
        if (used != fields[2].size()) return false;
        out.value = std::stod(fields[3], &used);
        if (used != fields[3].size()) return false;
    } catch (const std::logic_error&) {
        return false;
    }
    out.quality = common::QualityTag::Medium;
    if (fields.size() > 4 && !fields[4].empty()) {
        auto q = common::qualityFromString(fields[4]);
        if (!q) return false;
        out.quality = *q;
    }
    out.source = fields.size() > 5 ? fields[5] : std::string("recorded");
    return true;
}

bool RecordedMeasurementGateway::load() {
    records_.clear();
    skipped_lines_ = 0;
    data_loaded_ = false;

    if (!std::filesystem::exists(data_file_)) {
        if (logger_) logger_->error("Recording does not exist: {}", data_file_);
        return false;
    }
    std::ifstream file(data_file_);
    if (!file.is_open()) {
        if (logger_) logger_->error("Cannot open recording: {}", data_file_);
        return false;
    }

    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (lineNo == 1 && line.rfind("lat", 0) == 0) continue; // header
        Record rec;
        if (!parseLine(line, rec)) {
            ++skipped_lines_;
            if (logger_) logger_->warn("{}:{} malformed reading skipped: '{}'", data_file_, lineNo, line);
            continue;
        }
        records_.push_back(std::move(rec));
    }

    data_loaded_ = true;
    if (logger_) logger_->info("Loaded {} readings from {} ({} skipped)", records_.size(), data_file_, skipped_lines_);
    return true;
}

std::optional<common::GeoPoint> RecordedMeasurementGateway::nearestStation(double lat, double lng) const {
    double best = std::numeric_limits<double>::infinity();
    std::optional<common::GeoPoint> station;
    for (const auto& r : records_) {
        const double dLat = r.location.lat - lat;
        const double dLng = r.location.lng - lng;
        const double d2 = dLat * dLat + dLng * dLng;
        if (d2 < best) {
            best = d2;
            station = r.location;
        }
    }
    if (!station || best > match_tolerance_deg_ * match_tolerance_deg_) return std::nullopt;
    return station;
}

std::optional<Measurement> RecordedMeasurementGateway::fetchPoint(double lat, double lng) {
    if (!data_loaded_) {
        throw common::GatewayUnavailableError("recording not loaded: " + data_file_);
    }
    auto station = nearestStation(lat, lng);
    if (!station) return std::nullopt;

    const Record* latest = nullptr;
    for (const auto& r : records_) {
        if (r.location == *station && (!latest || r.year > latest->year)) latest = &r;
    }
    Measurement m;
    m.location = latest->location;
    m.value = latest->value;
    m.quality = latest->quality;
    m.sourceLabel = latest->source;
    return m;
}

YearlySeries RecordedMeasurementGateway::fetchSeries(double lat, double lng, int startYear, int endYear) {
    if (startYear > endYear) {
        throw common::InvalidRequestError("series start year " + std::to_string(startYear)
            + " after end year " + std::to_string(endYear));
    }
    if (!data_loaded_) {
        throw common::GatewayUnavailableError("recording not loaded: " + data_file_);
    }
    auto station = nearestStation(lat, lng);
    if (!station) return YearlySeries{};

    struct Acc { double sum = 0.0; int n = 0; };
    std::map<int, Acc> byYear;
    for (const auto& r : records_) {
        if (r.location != *station || r.year < startYear || r.year > endYear) continue;
        auto& a = byYear[r.year];
        a.sum += r.value;
        ++a.n;
    }
    std::vector<common::YearValue> pts;
    pts.reserve(byYear.size());
    for (const auto& [year, acc] : byYear) pts.push_back({year, acc.sum / acc.n});
    return YearlySeries(std::move(pts));
}

} // namespace nocturna::backend::gateway

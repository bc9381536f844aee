#include "gateway/SyntheticMeasurementGateway.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <vector>

namespace nocturna::backend::gateway {

namespace {
constexpr double kPi = 3.14159265358979323846;
}

SyntheticMeasurementGateway::SyntheticMeasurementGateway(const Config& cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)) {}

void SyntheticMeasurementGateway::configureFaultInjection(const FaultInjectionConfig& fic) {
    fi_missingEveryN_.store(fic.missingEveryN);
    fi_unavailableEveryN_.store(fic.unavailableEveryN);
    fi_offline_.store(fic.offline);
    if (log_) {
        log_->info("[{}] fault injection: missingEveryN={} unavailableEveryN={} offline={}",
                   cfg_.gatewayId, fic.missingEveryN, fic.unavailableEveryN, fic.offline);
    }
}

double SyntheticMeasurementGateway::radianceAt(double lat, double lng, int year) const {
    const double dLat = lat - cfg_.glowCenter.lat;
    const double dLng = lng - cfg_.glowCenter.lng;
    const double d2 = dLat * dLat + dLng * dLng;
    const double sigma2 = cfg_.glowSigmaDeg * cfg_.glowSigmaDeg;
    const double glow = cfg_.peak * std::exp(-d2 / (2.0 * sigma2));
    const double growth = std::pow(1.0 + cfg_.annualGrowth, year - cfg_.referenceYear);
    double cycle = 0.0;
    if (cfg_.cycleAmplitude != 0.0 && cfg_.cyclePeriod > 0) {
        cycle = cfg_.cycleAmplitude * std::sin(2.0 * kPi * (year - cfg_.referenceYear) / cfg_.cyclePeriod);
    }
    return std::max(0.0, cfg_.background + glow * growth + cycle);
}

common::QualityTag SyntheticMeasurementGateway::qualityAt(double lat, double lng) const {
    const double dLat = lat - cfg_.glowCenter.lat;
    const double dLng = lng - cfg_.glowCenter.lng;
    const double d = std::sqrt(dLat * dLat + dLng * dLng);
    if (d <= cfg_.glowSigmaDeg) return common::QualityTag::High;
    if (d <= 3.0 * cfg_.glowSigmaDeg) return common::QualityTag::Medium;
    return common::QualityTag::Low;
}

std::optional<Measurement> SyntheticMeasurementGateway::fetchPoint(double lat, double lng) {
    const uint64_t call = ++calls_;
    if (fi_offline_.load()) {
        ++unavailable_;
        throw common::GatewayUnavailableError(cfg_.gatewayId + " is offline");
    }
    const uint32_t unavailN = fi_unavailableEveryN_.load();
    if (unavailN > 0 && call % unavailN == 0) {
        ++unavailable_;
        throw common::GatewayUnavailableError(cfg_.gatewayId + " dropped request " + std::to_string(call));
    }
    const uint32_t missingN = fi_missingEveryN_.load();
    if (missingN > 0 && call % missingN == 0) {
        ++missing_;
        return std::nullopt;
    }
    Measurement m;
    m.location = {lat, lng};
    m.value = radianceAt(lat, lng, cfg_.referenceYear);
    m.quality = qualityAt(lat, lng);
    m.sourceLabel = cfg_.gatewayId;
    ++served_;
    return m;
}

YearlySeries SyntheticMeasurementGateway::fetchSeries(double lat, double lng, int startYear, int endYear) {
    if (startYear > endYear) {
        throw common::InvalidRequestError("series start year " + std::to_string(startYear)
            + " after end year " + std::to_string(endYear));
    }
    if (fi_offline_.load()) {
        throw common::GatewayUnavailableError(cfg_.gatewayId + " is offline");
    }
    std::vector<double> values;
    values.reserve(static_cast<size_t>(endYear - startYear + 1));
    for (int y = startYear; y <= endYear; ++y) values.push_back(radianceAt(lat, lng, y));
    if (log_) log_->debug("[{}] series ({:.4f},{:.4f}) {}..{}", cfg_.gatewayId, lat, lng, startYear, endYear);
    return YearlySeries::fromValues(startYear, values);
}

} // namespace nocturna::backend::gateway

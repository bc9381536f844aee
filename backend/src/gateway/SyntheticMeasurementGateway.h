// SyntheticMeasurementGateway.h
// Deterministic in-memory brightness field used by tests and the host's demo mode.

#ifndef NOCTURNA_BACKEND_GATEWAY_SYNTHETIC_MEASUREMENT_GATEWAY_H
#define NOCTURNA_BACKEND_GATEWAY_SYNTHETIC_MEASUREMENT_GATEWAY_H

#include "gateway/IMeasurementGateway.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <spdlog/spdlog.h>

namespace nocturna::backend::gateway {

// Radiance = background + glow(distance to city) * growth^(year-ref) + cycle.
class SyntheticMeasurementGateway : public IMeasurementGateway {
public:
    struct Config {
        std::string gatewayId = "Synthetic_0";
        common::GeoPoint glowCenter{40.0, -105.0};
        double background = 0.5;        // radiance far from the glow
        double peak = 40.0;             // additional radiance at the glow center
        double glowSigmaDeg = 0.25;     // gaussian falloff
        double annualGrowth = 0.03;     // compound growth of the glow per year
        int referenceYear = 2023;       // year whose field fetchPoint() reports
        double cycleAmplitude = 0.0;    // optional periodic component in series
        int cyclePeriod = 4;
    };

    struct FaultInjectionConfig {
        uint32_t missingEveryN = 0;     // every Nth fetchPoint() returns nullopt if >0
        uint32_t unavailableEveryN = 0; // every Nth fetchPoint() throws GatewayUnavailableError if >0
        bool offline = false;           // every call throws GatewayUnavailableError
    };

    explicit SyntheticMeasurementGateway(const Config& cfg, std::shared_ptr<spdlog::logger> log = nullptr);

    std::optional<Measurement> fetchPoint(double lat, double lng) override;
    YearlySeries fetchSeries(double lat, double lng, int startYear, int endYear) override;
    std::string getGatewayID() const override { return cfg_.gatewayId; }

    void configureFaultInjection(const FaultInjectionConfig& fic);

    // Noise-free field value; tests compare gateway output against it.
    double radianceAt(double lat, double lng, int year) const;

    struct Stats { uint64_t calls=0; uint64_t served=0; uint64_t missing=0; uint64_t unavailable=0; };
    Stats stats() const { return Stats{calls_.load(), served_.load(), missing_.load(), unavailable_.load()}; }

private:
    common::QualityTag qualityAt(double lat, double lng) const;

    Config cfg_{};
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<uint32_t> fi_missingEveryN_{0};
    std::atomic<uint32_t> fi_unavailableEveryN_{0};
    std::atomic<bool> fi_offline_{false};
    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> served_{0};
    std::atomic<uint64_t> missing_{0};
    std::atomic<uint64_t> unavailable_{0};
};

} // namespace nocturna::backend::gateway

#endif // NOCTURNA_BACKEND_GATEWAY_SYNTHETIC_MEASUREMENT_GATEWAY_H

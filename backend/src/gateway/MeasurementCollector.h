#ifndef NOCTURNA_BACKEND_GATEWAY_MEASUREMENT_COLLECTOR_H
#define NOCTURNA_BACKEND_GATEWAY_MEASUREMENT_COLLECTOR_H

#include "gateway/IMeasurementGateway.h"
#include "sampling/SampleSet.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace nocturna::backend::gateway {

/**
 * Resolves sample locations against a gateway with a bounded number of
 * concurrent lookups and waits for all of them before returning.
 *
 * Per-location failures are recorded on the sample and never abort the
 * batch. The batch fails with GatewayUnavailableError when every attempted
 * location reported the gateway unreachable, and with InsufficientDataError
 * when fewer than minValidSamples usable values came back.
 */
class MeasurementCollector {
public:
    struct Config {
        unsigned maxInFlight = 8;          // concurrent fetchPoint() calls
        std::size_t minValidSamples = 2;
    };

    MeasurementCollector(std::shared_ptr<IMeasurementGateway> gateway, Config cfg,
                         std::shared_ptr<spdlog::logger> log = nullptr);

    // cancel: optional flag polled before each new request; once set, remaining
    // locations are marked Cancelled and the partial set is returned.
    sampling::SampleSet collect(const sampling::Geometry& geometry,
                                const std::vector<common::GeoPoint>& locations,
                                const std::atomic<bool>* cancel = nullptr) const;

    const Config& config() const { return cfg_; }

private:
    void resolve(sampling::Sample& sample) const;

    std::shared_ptr<IMeasurementGateway> gateway_;
    Config cfg_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace nocturna::backend::gateway

#endif // NOCTURNA_BACKEND_GATEWAY_MEASUREMENT_COLLECTOR_H

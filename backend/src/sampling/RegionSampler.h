#ifndef NOCTURNA_BACKEND_SAMPLING_REGION_SAMPLER_H
#define NOCTURNA_BACKEND_SAMPLING_REGION_SAMPLER_H

#include "sampling/Geometry.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>

namespace nocturna::backend::sampling {

struct SamplerConfig {
    uint32_t seed = 0x5EED;            // mt19937 seed; same seed + geometry => same locations
    uint32_t maxAttemptsPerSample = 64; // rejection budget = this * random points wanted
};

struct SamplingResult {
    std::vector<GeoPoint> locations;
    std::size_t requested = 0;
    std::size_t attempts = 0;        // random candidates drawn
    bool budgetExhausted = false;    // true when fewer than requested were produced
};

/**
 * Turns a region into query locations by rejection sampling inside its
 * bounding box. Point regions always lead with their center. The attempt
 * budget is fixed up front, so pathological slivers end with a short result
 * instead of spinning.
 */
class RegionSampler {
public:
    explicit RegionSampler(SamplerConfig cfg = {}, std::shared_ptr<spdlog::logger> log = nullptr);

    SamplingResult generateSamples(const Geometry& geometry, std::size_t targetCount) const;

    const SamplerConfig& config() const { return cfg_; }

private:
    SamplerConfig cfg_;
    std::shared_ptr<spdlog::logger> log_;
};

} // namespace nocturna::backend::sampling

#endif // NOCTURNA_BACKEND_SAMPLING_REGION_SAMPLER_H

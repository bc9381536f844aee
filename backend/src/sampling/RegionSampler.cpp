#include "sampling/RegionSampler.h"

#include <random>

namespace nocturna::backend::sampling {

RegionSampler::RegionSampler(SamplerConfig cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(std::move(log)) {}

SamplingResult RegionSampler::generateSamples(const Geometry& geometry, std::size_t targetCount) const {
    SamplingResult result;
    result.requested = targetCount;
    if (targetCount == 0) return result;
    result.locations.reserve(targetCount);

    std::size_t randomWanted = targetCount;
    if (geometry.kind() == Geometry::Kind::PointRegion) {
        result.locations.push_back(geometry.center());
        randomWanted = targetCount - 1;
    }

    const BoundingBox box = geometry.boundingBox();
    std::mt19937 rng{cfg_.seed};
    std::uniform_real_distribution<double> latDist(box.minLat, box.maxLat);
    std::uniform_real_distribution<double> lngDist(box.minLng, box.maxLng);

    const std::size_t budget = randomWanted * static_cast<std::size_t>(cfg_.maxAttemptsPerSample);
    std::size_t accepted = 0;
    while (accepted < randomWanted && result.attempts < budget) {
        ++result.attempts;
        GeoPoint candidate{latDist(rng), lngDist(rng)};
        if (geometry.contains(candidate)) {
            result.locations.push_back(candidate);
            ++accepted;
        }
    }

    result.budgetExhausted = result.locations.size() < targetCount;
    if (log_) {
        if (result.budgetExhausted) {
            log_->warn("Sampling budget exhausted: produced {} of {} locations after {} attempts",
                       result.locations.size(), targetCount, result.attempts);
        } else {
            log_->debug("Sampled {} locations ({} attempts)", result.locations.size(), result.attempts);
        }
    }
    return result;
}

} // namespace nocturna::backend::sampling

#ifndef NOCTURNA_BACKEND_SAMPLING_SAMPLE_SET_H
#define NOCTURNA_BACKEND_SAMPLING_SAMPLE_SET_H

#include "common/DataTypes.h"
#include "sampling/Geometry.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace nocturna::backend::sampling {

using common::Measurement;

enum class SampleStatus {
    Resolved,    // gateway returned a usable value
    Rejected,    // gateway returned a value that is NaN, infinite or negative
    NotFound,    // gateway had no reading for the location
    Failed,      // lookup threw (timeout, parse error, ...)
    Unavailable, // gateway reported itself unreachable
    Cancelled    // never requested because the batch was cancelled
};

const char* toString(SampleStatus s);

struct Sample {
    GeoPoint location;
    std::optional<Measurement> measurement; // absent unless Resolved / Rejected
    SampleStatus status = SampleStatus::Cancelled;

    bool usable() const { return status == SampleStatus::Resolved; }
};

struct Coverage {
    std::size_t requested = 0;
    std::size_t resolved = 0;
    std::size_t rejected = 0;
    std::size_t notFound = 0;
    std::size_t failed = 0;
    std::size_t unavailable = 0;
    std::size_t cancelled = 0;

    std::size_t absent() const { return requested - resolved; }
    double ratio() const { return requested ? double(resolved) / double(requested) : 0.0; }
};

// Geometry plus the per-location outcome of one collection run.
class SampleSet {
public:
    SampleSet(Geometry geometry, std::vector<Sample> samples, bool cancelled = false)
        : geometry_(std::move(geometry)), samples_(std::move(samples)), cancelled_(cancelled) {}

    const Geometry& geometry() const { return geometry_; }
    const std::vector<Sample>& samples() const { return samples_; }
    bool cancelled() const { return cancelled_; }

    Coverage coverage() const;

    // Measurements of usable samples in sample order.
    std::vector<Measurement> measurements() const;

private:
    Geometry geometry_;
    std::vector<Sample> samples_;
    bool cancelled_ = false;
};

} // namespace nocturna::backend::sampling

#endif // NOCTURNA_BACKEND_SAMPLING_SAMPLE_SET_H

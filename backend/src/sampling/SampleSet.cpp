#include "sampling/SampleSet.h"

namespace nocturna::backend::sampling {

const char* toString(SampleStatus s) {
    switch (s) {
        case SampleStatus::Resolved: return "resolved";
        case SampleStatus::Rejected: return "rejected";
        case SampleStatus::NotFound: return "not_found";
        case SampleStatus::Failed: return "failed";
        case SampleStatus::Unavailable: return "unavailable";
        case SampleStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

Coverage SampleSet::coverage() const {
    Coverage c;
    c.requested = samples_.size();
    for (const auto& s : samples_) {
        switch (s.status) {
            case SampleStatus::Resolved: ++c.resolved; break;
            case SampleStatus::Rejected: ++c.rejected; break;
            case SampleStatus::NotFound: ++c.notFound; break;
            case SampleStatus::Failed: ++c.failed; break;
            case SampleStatus::Unavailable: ++c.unavailable; break;
            case SampleStatus::Cancelled: ++c.cancelled; break;
        }
    }
    return c;
}

std::vector<Measurement> SampleSet::measurements() const {
    std::vector<Measurement> out;
    out.reserve(samples_.size());
    for (const auto& s : samples_) {
        if (s.usable() && s.measurement) out.push_back(*s.measurement);
    }
    return out;
}

} // namespace nocturna::backend::sampling

#include "gateway/MeasurementCollector.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace nocturna::backend::gateway {

using sampling::Sample;
using sampling::SampleStatus;

namespace {
constexpr std::chrono::milliseconds kOutageWarnPeriod{10000};
}

MeasurementCollector::MeasurementCollector(std::shared_ptr<IMeasurementGateway> gateway, Config cfg,
                                           std::shared_ptr<spdlog::logger> log)
    : gateway_(std::move(gateway)), cfg_(cfg), log_(std::move(log)) {
    if (!gateway_) throw std::invalid_argument("MeasurementCollector requires a gateway");
    if (cfg_.maxInFlight == 0) cfg_.maxInFlight = 1;
}

void MeasurementCollector::resolve(Sample& sample) const {
    auto m = gateway_->fetchPoint(sample.location.lat, sample.location.lng);
    if (!m) {
        sample.status = SampleStatus::NotFound;
        return;
    }
    sample.status = common::isUsableValue(m->value) ? SampleStatus::Resolved : SampleStatus::Rejected;
    sample.measurement = std::move(m);
}

sampling::SampleSet MeasurementCollector::collect(const sampling::Geometry& geometry,
                                                  const std::vector<common::GeoPoint>& locations,
                                                  const std::atomic<bool>* cancel) const {
    const std::size_t n = locations.size();
    std::vector<Sample> samples(n);
    for (std::size_t i = 0; i < n; ++i) samples[i].location = locations[i];

    std::atomic<std::size_t> next{0};
    std::mutex fatalMutex;
    std::exception_ptr fatal;

    // Each worker owns the slot it claimed, so samples needs no lock.
    auto worker = [&]() {
        for (;;) {
            if (cancel && cancel->load()) return;
            const std::size_t i = next.fetch_add(1);
            if (i >= n) return;
            Sample& s = samples[i];
            try {
                resolve(s);
            } catch (const common::GatewayUnavailableError& ex) {
                s.status = SampleStatus::Unavailable;
                if (log_) {
                    log_->debug("Gateway unavailable at ({:.5f},{:.5f}): {}", s.location.lat, s.location.lng, ex.what());
                    // An outage hits every worker at once; report it once per period.
                    common::Logger::instance().warnRateLimited(log_->name(), "gateway_unavailable:" + gateway_->getGatewayID(),
                                                               kOutageWarnPeriod, std::string("Gateway unavailable: ") + ex.what());
                }
            } catch (const std::exception& ex) {
                s.status = SampleStatus::Failed;
                if (log_) log_->warn("Lookup failed at ({:.5f},{:.5f}): {}", s.location.lat, s.location.lng, ex.what());
            } catch (...) {
                s.status = SampleStatus::Failed;
                std::scoped_lock lock(fatalMutex);
                if (!fatal) fatal = std::current_exception();
            }
        }
    };

    const std::size_t workerCount = std::min<std::size_t>(cfg_.maxInFlight, n);
    std::vector<std::thread> pool;
    pool.reserve(workerCount);
    for (std::size_t t = 0; t < workerCount; ++t) {
        try {
            pool.emplace_back(worker);
        } catch (const std::system_error& ex) {
            if (log_) log_->warn("Could only start {} of {} collector workers: {}", pool.size(), workerCount, ex.what());
            break;
        }
    }
    if (pool.empty() && n > 0) worker();
    for (auto& th : pool) th.join();

    if (fatal) std::rethrow_exception(fatal);

    const bool wasCancelled = cancel && cancel->load() &&
        std::any_of(samples.begin(), samples.end(), [](const Sample& s) { return s.status == SampleStatus::Cancelled; });
    sampling::SampleSet set(geometry, std::move(samples), wasCancelled);
    const auto cov = set.coverage();

    if (log_) {
        log_->info("Collected {} locations via {}: resolved={} rejected={} not_found={} failed={} unavailable={} cancelled={}",
                   cov.requested, gateway_->getGatewayID(), cov.resolved, cov.rejected, cov.notFound,
                   cov.failed, cov.unavailable, cov.cancelled);
    }

    const std::size_t attempted = cov.requested - cov.cancelled;
    if (attempted > 0 && cov.unavailable == attempted) {
        throw common::GatewayUnavailableError("gateway " + gateway_->getGatewayID() + " unavailable for all "
            + std::to_string(attempted) + " attempted locations");
    }
    if (cov.resolved < cfg_.minValidSamples) {
        throw common::InsufficientDataError(cov.resolved, cov.requested, cfg_.minValidSamples);
    }
    return set;
}

} // namespace nocturna::backend::gateway

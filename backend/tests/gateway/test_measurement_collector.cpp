#include <gtest/gtest.h>

#include "gateway/MeasurementCollector.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "helpers/ScriptedGateway.h"

#include <chrono>
#include <cmath>
#include <spdlog/sinks/null_sink.h>
#include <stdexcept>

using namespace nocturna::backend;
using gateway::MeasurementCollector;
using sampling::Geometry;
using sampling::SampleStatus;
using tests::ScriptedGateway;
using tests::makeMeasurement;

namespace {
Geometry area() { return Geometry::pointRegion({0.0, 0.0}, 10.0, sampling::RadiusUnit::Degrees); }

// Location i sits at lat == i so scripted answers can key off it.
std::vector<common::GeoPoint> indexedLocations(int n) {
    std::vector<common::GeoPoint> out;
    for (int i = 0; i < n; ++i) out.push_back({static_cast<double>(i), 0.0});
    return out;
}

MeasurementCollector::Config config(unsigned inFlight, std::size_t minValid = 2) {
    MeasurementCollector::Config cfg;
    cfg.maxInFlight = inFlight;
    cfg.minValidSamples = minValid;
    return cfg;
}
}

TEST(MeasurementCollectorTest, ResolvesEveryLocationInOrder) {
    auto gw = std::make_shared<ScriptedGateway>([](double lat, double lng) {
        return std::optional<common::Measurement>(makeMeasurement(lat, lng, lat * 2.0));
    });
    MeasurementCollector collector(gw, config(4));
    auto set = collector.collect(area(), indexedLocations(10));
    ASSERT_EQ(set.samples().size(), 10u);
    for (std::size_t i = 0; i < 10; ++i) {
        const auto& s = set.samples()[i];
        EXPECT_EQ(s.status, SampleStatus::Resolved);
        EXPECT_DOUBLE_EQ(s.location.lat, static_cast<double>(i));
        ASSERT_TRUE(s.measurement.has_value());
        EXPECT_DOUBLE_EQ(s.measurement->value, 2.0 * static_cast<double>(i));
    }
    EXPECT_EQ(set.coverage().resolved, 10u);
    EXPECT_FALSE(set.cancelled());
    EXPECT_EQ(gw->calls(), 10);
}

TEST(MeasurementCollectorTest, PartialFailuresDoNotAbortBatch) {
    auto gw = std::make_shared<ScriptedGateway>([](double lat, double lng) -> std::optional<common::Measurement> {
        const int i = static_cast<int>(lat);
        if (i == 1) throw std::runtime_error("timeout");
        if (i == 2) return std::nullopt;
        if (i == 3) throw common::GatewayUnavailableError("rate limited");
        if (i == 4) return makeMeasurement(lat, lng, -1.0);
        if (i == 5) return makeMeasurement(lat, lng, std::nan(""));
        return makeMeasurement(lat, lng, 5.0);
    });
    MeasurementCollector collector(gw, config(3));
    auto set = collector.collect(area(), indexedLocations(8));
    const auto& s = set.samples();
    EXPECT_EQ(s[0].status, SampleStatus::Resolved);
    EXPECT_EQ(s[1].status, SampleStatus::Failed);
    EXPECT_EQ(s[2].status, SampleStatus::NotFound);
    EXPECT_EQ(s[3].status, SampleStatus::Unavailable);
    EXPECT_EQ(s[4].status, SampleStatus::Rejected);
    EXPECT_EQ(s[5].status, SampleStatus::Rejected);
    EXPECT_EQ(s[6].status, SampleStatus::Resolved);
    auto cov = set.coverage();
    EXPECT_EQ(cov.requested, 8u);
    EXPECT_EQ(cov.resolved, 3u);
    EXPECT_EQ(cov.absent(), 5u);
    EXPECT_EQ(set.measurements().size(), 3u);
}

TEST(MeasurementCollectorTest, AllUnavailableFailsBatch) {
    auto gw = std::make_shared<ScriptedGateway>([](double, double) -> std::optional<common::Measurement> {
        throw common::GatewayUnavailableError("down");
    });
    MeasurementCollector collector(gw, config(2));
    EXPECT_THROW(collector.collect(area(), indexedLocations(5)), common::GatewayUnavailableError);
}

TEST(MeasurementCollectorTest, TooFewUsableValuesFailsBatch) {
    auto gw = std::make_shared<ScriptedGateway>([](double lat, double lng) -> std::optional<common::Measurement> {
        if (lat == 0.0) return makeMeasurement(lat, lng, 1.0);
        return std::nullopt;
    });
    MeasurementCollector collector(gw, config(2));
    try {
        collector.collect(area(), indexedLocations(4));
        FAIL() << "expected InsufficientDataError";
    } catch (const common::InsufficientDataError& e) {
        EXPECT_EQ(e.validCount(), 1u);
        EXPECT_EQ(e.totalCount(), 4u);
    }
}

TEST(MeasurementCollectorTest, ConcurrencyStaysWithinBound) {
    auto gw = std::make_shared<ScriptedGateway>(
        [](double lat, double lng) { return std::optional<common::Measurement>(makeMeasurement(lat, lng, 1.0)); },
        std::chrono::milliseconds(15));
    MeasurementCollector collector(gw, config(3));
    auto set = collector.collect(area(), indexedLocations(12));
    EXPECT_EQ(set.coverage().resolved, 12u);
    EXPECT_LE(gw->peakInFlight(), 3);
    EXPECT_GE(gw->peakInFlight(), 1);
}

TEST(MeasurementCollectorTest, CancellationReturnsPartialSet) {
    std::atomic<bool> cancel{false};
    std::atomic<int> served{0};
    auto gw = std::make_shared<ScriptedGateway>([&](double lat, double lng) {
        if (++served == 3) cancel.store(true);
        return std::optional<common::Measurement>(makeMeasurement(lat, lng, 1.0));
    });
    MeasurementCollector collector(gw, config(1));
    auto set = collector.collect(area(), indexedLocations(10), &cancel);
    EXPECT_TRUE(set.cancelled());
    auto cov = set.coverage();
    EXPECT_EQ(cov.resolved, 3u);
    EXPECT_EQ(cov.cancelled, 7u);
    EXPECT_EQ(set.samples()[3].status, SampleStatus::Cancelled);
}

TEST(MeasurementCollectorTest, EmptyLocationListNeedsNoGateway) {
    auto gw = std::make_shared<ScriptedGateway>([](double, double) { return std::optional<common::Measurement>(); });
    MeasurementCollector collector(gw, config(4, 0));
    auto set = collector.collect(area(), {});
    EXPECT_TRUE(set.samples().empty());
    EXPECT_EQ(gw->calls(), 0);
}

TEST(MeasurementCollectorTest, NonStandardExceptionPropagatesAfterJoin) {
    auto gw = std::make_shared<ScriptedGateway>([](double lat, double lng) -> std::optional<common::Measurement> {
        if (lat == 2.0) throw 42;
        return makeMeasurement(lat, lng, 1.0);
    });
    MeasurementCollector collector(gw, config(2));
    EXPECT_THROW(collector.collect(area(), indexedLocations(6)), int);
}

TEST(MeasurementCollectorTest, NullGatewayRejected) {
    EXPECT_THROW(MeasurementCollector(nullptr, config(1)), std::invalid_argument);
}

TEST(MeasurementCollectorTest, OutageWarningIsRateLimitedAcrossWorkers) {
    auto gw = std::make_shared<ScriptedGateway>([](double, double) -> std::optional<common::Measurement> {
        throw common::GatewayUnavailableError("maintenance window");
    });
    auto log = std::make_shared<spdlog::logger>("Collector.Outage", std::make_shared<spdlog::sinks::null_sink_mt>());
    MeasurementCollector collector(gw, config(4), log);
    EXPECT_THROW(collector.collect(area(), indexedLocations(12)), common::GatewayUnavailableError);
    // The first unavailable lookup already took the slot for this gateway
    EXPECT_FALSE(common::Logger::instance().warnRateLimited("Collector.Outage", "gateway_unavailable:Scripted",
                                                            std::chrono::hours(1), "again"));
}

#include "sampling/Geometry.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace nocturna::backend::sampling {

using common::InsufficientGeometryError;

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kMinArea = 1e-12; // squared degrees

bool finitePoint(const GeoPoint& p) { return std::isfinite(p.lat) && std::isfinite(p.lng); }

bool validCoordinate(const GeoPoint& p) {
    return finitePoint(p) && p.lat >= -90.0 && p.lat <= 90.0 && p.lng >= -180.0 && p.lng <= 180.0;
}

// Longitude degrees covered by one degree of latitude at the given latitude.
double lngScale(double lat) {
    double c = std::cos(lat * kPi / 180.0);
    return c > 1e-9 ? 1.0 / c : 1e9;
}
}

double ringArea(const std::vector<GeoPoint>& ring) {
    if (ring.size() < 3) return 0.0;
    double twice = 0.0;
    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        twice += ring[j].lng * ring[i].lat - ring[i].lng * ring[j].lat;
    }
    return std::fabs(twice) * 0.5;
}

bool ringContains(const std::vector<GeoPoint>& ring, const GeoPoint& p) {
    bool inside = false;
    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        const auto& a = ring[i];
        const auto& b = ring[j];
        if ((a.lat > p.lat) != (b.lat > p.lat)) {
            double crossLng = (b.lng - a.lng) * (p.lat - a.lat) / (b.lat - a.lat) + a.lng;
            if (p.lng < crossLng) inside = !inside;
        }
    }
    return inside;
}

Geometry Geometry::polygon(std::vector<GeoPoint> ring) {
    if (ring.size() < 4) {
        throw InsufficientGeometryError("polygon ring needs at least 3 distinct vertices plus closure, got "
            + std::to_string(ring.size()) + " vertices");
    }
    for (const auto& v : ring) {
        if (!finitePoint(v)) throw InsufficientGeometryError("polygon vertex has non-finite coordinates");
        if (!validCoordinate(v)) throw InsufficientGeometryError("polygon vertex out of range");
    }
    if (ring.front() != ring.back()) {
        throw InsufficientGeometryError("polygon ring is not closed (first vertex != last vertex)");
    }
    ring.pop_back();

    std::vector<GeoPoint> distinct;
    for (const auto& v : ring) {
        if (std::find(distinct.begin(), distinct.end(), v) == distinct.end()) distinct.push_back(v);
    }
    if (distinct.size() < 3) {
        throw InsufficientGeometryError("polygon has " + std::to_string(distinct.size()) + " distinct vertices, need 3");
    }
    if (ringArea(ring) < kMinArea) {
        throw InsufficientGeometryError("polygon has zero area");
    }
    Geometry g;
    g.kind_ = Kind::Polygon;
    g.ring_ = std::move(ring);
    return g;
}

Geometry Geometry::pointRegion(const GeoPoint& center, double radius, RadiusUnit unit) {
    if (!validCoordinate(center)) {
        throw InsufficientGeometryError("point region center out of range");
    }
    if (!std::isfinite(radius) || radius <= 0.0) {
        throw InsufficientGeometryError("point region radius must be > 0, got " + std::to_string(radius));
    }
    Geometry g;
    g.kind_ = Kind::PointRegion;
    g.center_ = center;
    g.radius_ = radius;
    g.unit_ = unit;
    return g;
}

BoundingBox Geometry::boundingBox() const {
    BoundingBox box;
    if (kind_ == Kind::Polygon) {
        box.minLat = box.maxLat = ring_.front().lat;
        box.minLng = box.maxLng = ring_.front().lng;
        for (const auto& v : ring_) {
            box.minLat = std::min(box.minLat, v.lat);
            box.maxLat = std::max(box.maxLat, v.lat);
            box.minLng = std::min(box.minLng, v.lng);
            box.maxLng = std::max(box.maxLng, v.lng);
        }
        return box;
    }
    double latRadius = unit_ == RadiusUnit::Degrees ? radius_ : radius_ / kMetersPerDegree;
    double lngRadius = unit_ == RadiusUnit::Degrees ? radius_ : latRadius * lngScale(center_.lat);
    // Clipped to the coordinate range; near the poles the metric longitude extent explodes.
    box.minLat = std::max(-90.0, center_.lat - latRadius);
    box.maxLat = std::min(90.0, center_.lat + latRadius);
    box.minLng = std::max(-180.0, center_.lng - lngRadius);
    box.maxLng = std::min(180.0, center_.lng + lngRadius);
    return box;
}

bool Geometry::contains(const GeoPoint& p) const {
    if (!validCoordinate(p)) return false;
    if (kind_ == Kind::Polygon) return ringContains(ring_, p);
    double dLat = p.lat - center_.lat;
    double dLng = p.lng - center_.lng;
    if (unit_ == RadiusUnit::Degrees) {
        return dLat * dLat + dLng * dLng <= radius_ * radius_;
    }
    double dy = dLat * kMetersPerDegree;
    double dx = dLng * kMetersPerDegree / lngScale(center_.lat);
    return dx * dx + dy * dy <= radius_ * radius_;
}

double Geometry::area() const {
    if (kind_ == Kind::Polygon) return ringArea(ring_);
    auto box = boundingBox();
    // Ellipse inscribed in the bounding box
    return kPi * 0.25 * (box.maxLat - box.minLat) * (box.maxLng - box.minLng);
}

} // namespace nocturna::backend::sampling

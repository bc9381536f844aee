#ifndef NOCTURNA_BACKEND_SAMPLING_GEOMETRY_H
#define NOCTURNA_BACKEND_SAMPLING_GEOMETRY_H

#include "common/DataTypes.h"

#include <vector>

namespace nocturna::backend::sampling {

using common::GeoPoint;

enum class RadiusUnit { Degrees, Meters };

struct BoundingBox {
    double minLat = 0.0;
    double maxLat = 0.0;
    double minLng = 0.0;
    double maxLng = 0.0;
};

/**
 * Region supplied by the region selector: a closed polygon ring or a
 * center point with a radius. Instances are only obtainable through the
 * validating factories, so a Geometry in hand always satisfies its invariants.
 */
class Geometry {
public:
    enum class Kind { Polygon, PointRegion };

    // Ring vertices in selector order; first vertex must equal the last.
    // Throws InsufficientGeometryError for open rings, <3 distinct vertices,
    // zero area or non-finite coordinates.
    static Geometry polygon(std::vector<GeoPoint> ring);

    // Throws InsufficientGeometryError for non-positive / non-finite radius
    // or a center outside lat [-90,90], lng [-180,180].
    static Geometry pointRegion(const GeoPoint& center, double radius, RadiusUnit unit = RadiusUnit::Meters);

    Kind kind() const { return kind_; }
    // Polygon vertices without the closing duplicate.
    const std::vector<GeoPoint>& ring() const { return ring_; }
    const GeoPoint& center() const { return center_; }
    double radius() const { return radius_; }
    RadiusUnit radiusUnit() const { return unit_; }

    BoundingBox boundingBox() const;
    bool contains(const GeoPoint& p) const;

    // Planar area in squared degrees.
    double area() const;

private:
    Geometry() = default;

    Kind kind_ = Kind::PointRegion;
    std::vector<GeoPoint> ring_;
    GeoPoint center_;
    double radius_ = 0.0;
    RadiusUnit unit_ = RadiusUnit::Meters;
};

// Shoelace area of a closed ring in squared degrees (absolute value).
double ringArea(const std::vector<GeoPoint>& ring);

// Even-odd ray casting along the longitude axis.
bool ringContains(const std::vector<GeoPoint>& ring, const GeoPoint& p);

// Equirectangular approximation, meters per degree of latitude.
constexpr double kMetersPerDegree = 111320.0;

} // namespace nocturna::backend::sampling

#endif // NOCTURNA_BACKEND_SAMPLING_GEOMETRY_H

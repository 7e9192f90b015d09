/**
 * @file geo_types.hpp
 * @brief Coordinate value type and Boost.Geometry adapters.
 */

#pragma once

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace commute {

namespace bg = boost::geometry;

// Planar point in degree space: x = latitude, y = longitude.
using DegreePoint = bg::model::point<double, 2, bg::cs::cartesian>;

/**
 * @brief Geographic position in decimal degrees.
 *
 * Out-of-range values are accepted and kept as given; in_range() only
 * reports whether they pass the |lat| <= 90, |lng| <= 180 sanity check.
 */
struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;

    bool in_range() const {
        return latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }

    DegreePoint to_point() const { return DegreePoint(latitude, longitude); }

    bool operator==(const Coordinate& o) const {
        return latitude == o.latitude && longitude == o.longitude;
    }
    bool operator!=(const Coordinate& o) const { return !(*this == o); }
};

/**
 * @brief Squared Euclidean distance in degrees (not geodesic).
 */
inline double planar_distance_sq(const Coordinate& a, const Coordinate& b) {
    return bg::comparable_distance(a.to_point(), b.to_point());
}

}  // namespace commute

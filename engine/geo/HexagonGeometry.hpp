#pragma once

#include "GeoTypes.hpp"
#include <expected>

namespace GeoHex {
namespace Geo {

/**
 * @brief Geometry precondition failures
 */
enum class GeometryError {
    InvalidRadius,       ///< Radius not strictly positive, not finite, or too small to separate the vertices
    PolarSingularity,    ///< Centre at or extremely near a pole
    InvalidCoordinate    ///< Centre outside [-90,90] x [-180,180] or not finite
};

const char* GeometryErrorToString(GeometryError error);

/// Closed-form area factor for a regular hexagon, 3*sqrt(3)/2 rounded to 2.598.
constexpr double HEXAGON_AREA_FACTOR = 2.598;

/// Centres closer than this many degrees to a pole are rejected.
constexpr double POLAR_LATITUDE_EPSILON = 1e-6;

/**
 * @brief Angle of vertex @p index, in degrees counter-clockwise from east
 */
constexpr double HexagonVertexAngle(int index) { return 60.0 * index - 30.0; }

/**
 * @brief Generate the flat-top hexagon around @p center
 *
 * Offsets use the equirectangular small-distance approximation on a sphere
 * of radius EARTH_RADIUS_METERS:
 *   dLat = r * sin(theta) / R
 *   dLon = r * cos(theta) / (R * cos(lat0))
 * This is accurate for radii up to roughly 10 km and distorts at high
 * latitude. Longitudes are not wrapped at the antimeridian.
 *
 * @param center Centre point
 * @param radiusKm Circumradius in kilometres, must be > 0 and large enough
 *        that the six vertices stay distinct in double precision
 * @return Closed 7-point ring or the violated precondition
 */
std::expected<HexagonPolygon, GeometryError> GenerateHexagon(const GeoPoint& center,
                                                             double radiusKm);

std::expected<HexagonPolygon, GeometryError> GenerateHexagon(const HexagonSpec& spec);

/**
 * @brief Area of a regular hexagon with circumradius @p radiusKm
 *
 * Returns HEXAGON_AREA_FACTOR * r^2. Every displayed area estimate goes
 * through this function so the figures agree for the same radius.
 */
std::expected<double, GeometryError> HexagonAreaSqKm(double radiusKm);

} // namespace Geo
} // namespace GeoHex

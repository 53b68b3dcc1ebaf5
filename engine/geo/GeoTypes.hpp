#pragma once

#include <array>
#include <cmath>
#include <cstddef>

namespace GeoHex {
namespace Geo {

// =============================================================================
// Constants
// =============================================================================

/**
 * @brief Convert degrees to radians
 */
constexpr double DegToRad(double deg) { return deg * 3.14159265358979323846 / 180.0; }

/**
 * @brief Convert radians to degrees
 */
constexpr double RadToDeg(double rad) { return rad * 180.0 / 3.14159265358979323846; }

/**
 * @brief Earth's mean radius in meters (spherical model used by the hexagon generator)
 */
constexpr double EARTH_RADIUS_METERS = 6371000.0;

// =============================================================================
// Geographic Coordinates
// =============================================================================

/**
 * @brief Geographic point (latitude, longitude) in degrees
 */
struct GeoPoint {
    double latitude = 0.0;   // Degrees, -90 to 90
    double longitude = 0.0;  // Degrees, -180 to 180

    constexpr GeoPoint() = default;
    constexpr GeoPoint(double lat, double lon) : latitude(lat), longitude(lon) {}

    bool operator==(const GeoPoint& other) const = default;

    bool IsValid() const {
        return std::isfinite(latitude) && std::isfinite(longitude) &&
               latitude >= -90.0 && latitude <= 90.0 &&
               longitude >= -180.0 && longitude <= 180.0;
    }
};

// =============================================================================
// Hexagon Region
// =============================================================================

/**
 * @brief Analysis region: centre point and circumradius
 */
struct HexagonSpec {
    GeoPoint center;
    double radiusKm = 0.0;

    HexagonSpec() = default;
    HexagonSpec(const GeoPoint& c, double r) : center(c), radiusKm(r) {}

    bool operator==(const HexagonSpec& other) const = default;
};

/// Six distinct vertices plus the first vertex repeated to close the ring.
constexpr std::size_t HEXAGON_RING_SIZE = 7;

/**
 * @brief Closed hexagon ring in geographic coordinates
 *
 * Vertex i sits at bearing 60*i - 30 degrees measured counter-clockwise
 * from east (flat-top orientation); element 6 equals element 0.
 */
using HexagonPolygon = std::array<GeoPoint, HEXAGON_RING_SIZE>;

} // namespace Geo
} // namespace GeoHex

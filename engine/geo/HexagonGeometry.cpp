#include "HexagonGeometry.hpp"
#include "core/Logger.hpp"
#include <glm/glm.hpp>
#include <cmath>

namespace GeoHex {
namespace Geo {

// =============================================================================
// Hexagon Generation
// =============================================================================

const char* GeometryErrorToString(GeometryError error) {
    switch (error) {
        case GeometryError::InvalidRadius:     return "invalid radius";
        case GeometryError::PolarSingularity:  return "polar singularity";
        case GeometryError::InvalidCoordinate: return "invalid coordinate";
    }
    return "unknown";
}

std::expected<HexagonPolygon, GeometryError> GenerateHexagon(const GeoPoint& center,
                                                             double radiusKm) {
    if (!std::isfinite(radiusKm) || radiusKm <= 0.0) {
        GEOHEX_LOG_DEBUG("Rejected hexagon radius {}", radiusKm);
        return std::unexpected(GeometryError::InvalidRadius);
    }
    if (!center.IsValid()) {
        GEOHEX_LOG_DEBUG("Rejected hexagon centre ({}, {})", center.latitude, center.longitude);
        return std::unexpected(GeometryError::InvalidCoordinate);
    }
    if (90.0 - std::abs(center.latitude) < POLAR_LATITUDE_EPSILON) {
        GEOHEX_LOG_DEBUG("Rejected polar hexagon centre latitude {}", center.latitude);
        return std::unexpected(GeometryError::PolarSingularity);
    }

    const double radiusMeters = radiusKm * 1000.0;
    const double cosLat = std::cos(DegToRad(center.latitude));

    HexagonPolygon ring;
    for (int i = 0; i < 6; ++i) {
        const double angle = DegToRad(HexagonVertexAngle(i));
        const glm::dvec2 offset = radiusMeters * glm::dvec2(std::cos(angle), std::sin(angle));

        const double latOffset = offset.y / EARTH_RADIUS_METERS * RadToDeg(1.0);
        const double lonOffset = offset.x / (EARTH_RADIUS_METERS * cosLat) * RadToDeg(1.0);

        ring[i] = GeoPoint(center.latitude + latOffset, center.longitude + lonOffset);
    }

    // Offsets below one ulp of the centre coordinates round away
    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = i + 1; j < 6; ++j) {
            if (ring[i] == ring[j]) {
                GEOHEX_LOG_DEBUG("Hexagon radius {} km collapses vertices {} and {}", radiusKm, i, j);
                return std::unexpected(GeometryError::InvalidRadius);
            }
        }
    }

    // Close the ring
    ring[6] = ring[0];

    return ring;
}

std::expected<HexagonPolygon, GeometryError> GenerateHexagon(const HexagonSpec& spec) {
    return GenerateHexagon(spec.center, spec.radiusKm);
}

std::expected<double, GeometryError> HexagonAreaSqKm(double radiusKm) {
    if (!std::isfinite(radiusKm) || radiusKm < 0.0) {
        return std::unexpected(GeometryError::InvalidRadius);
    }
    return HEXAGON_AREA_FACTOR * radiusKm * radiusKm;
}

} // namespace Geo
} // namespace GeoHex

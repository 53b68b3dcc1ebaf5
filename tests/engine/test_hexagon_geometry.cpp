/**
 * @file test_hexagon_geometry.cpp
 * @brief Unit tests for hexagon generation and area
 */

#include <gtest/gtest.h>

#include "geo/HexagonGeometry.hpp"

#include "utils/TestHelpers.hpp"

#include <cmath>
#include <limits>

using namespace GeoHex;
using namespace GeoHex::Geo;
using namespace GeoHex::Test;

namespace {

// East/north offset in meters of @p p from @p center, same approximation as the generator
void PlanarOffset(const GeoPoint& center, const GeoPoint& p, double& east, double& north) {
    east = DegToRad(p.longitude - center.longitude) * EARTH_RADIUS_METERS *
           std::cos(DegToRad(center.latitude));
    north = DegToRad(p.latitude - center.latitude) * EARTH_RADIUS_METERS;
}

} // namespace

// =============================================================================
// Ring Shape Tests
// =============================================================================

TEST(HexagonGeometryTest, RingHasSevenPointsAndCloses) {
    auto ring = GenerateHexagon(GeoPoint(36.447451, 4.228459), 2.0);
    ASSERT_TRUE(ring.has_value());

    EXPECT_EQ(7u, ring->size());
    EXPECT_EQ((*ring)[0], (*ring)[6]);
}

TEST(HexagonGeometryTest, VerticesAreDistinct) {
    auto ring = GenerateHexagon(GeoPoint(10.0, 20.0), 1.0);
    ASSERT_TRUE(ring.has_value());

    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = i + 1; j < 6; ++j) {
            EXPECT_FALSE((*ring)[i] == (*ring)[j]) << "vertices " << i << " and " << j;
        }
    }
}

TEST(HexagonGeometryTest, CollapsedRadiusRejected) {
    // Offsets of about 1e-17 degrees vanish against a centre near 36 degrees
    auto collapsed = GenerateHexagon(GeoPoint(36.447451, 4.228459), 1e-15);
    ASSERT_FALSE(collapsed.has_value());
    EXPECT_EQ(GeometryError::InvalidRadius, collapsed.error());

    auto tiny = GenerateHexagon(GeoPoint(36.447451, 4.228459), 1e-10);
    ASSERT_TRUE(tiny.has_value());
    for (size_t i = 0; i < 6; ++i) {
        for (size_t j = i + 1; j < 6; ++j) {
            EXPECT_FALSE((*tiny)[i] == (*tiny)[j]) << "vertices " << i << " and " << j;
        }
    }
}

TEST(HexagonGeometryTest, TinyRadiusAtOriginStillDistinct) {
    // Near (0, 0) there is no centre magnitude to absorb the offsets
    auto ring = GenerateHexagon(GeoPoint(0.0, 0.0), 1e-15);
    ASSERT_TRUE(ring.has_value());
    EXPECT_FALSE((*ring)[0] == (*ring)[3]);
}

TEST(HexagonGeometryTest, VerticesEquidistantFromCenter) {
    const GeoPoint centers[] = {
        {0.0, 0.0}, {36.447451, 4.228459}, {-33.8688, 151.2093}, {64.1466, -21.9426}, {-75.0, 0.0}
    };
    const double radii[] = {0.5, 2.0, 10.0};

    for (const auto& center : centers) {
        for (double radiusKm : radii) {
            auto ring = GenerateHexagon(center, radiusKm);
            ASSERT_TRUE(ring.has_value());
            for (size_t i = 0; i < 6; ++i) {
                double east = 0.0;
                double north = 0.0;
                PlanarOffset(center, (*ring)[i], east, north);
                EXPECT_NEAR(radiusKm * 1000.0, std::hypot(east, north), 1e-6)
                    << "centre (" << center.latitude << ", " << center.longitude << ") vertex " << i;
            }
        }
    }
}

TEST(HexagonGeometryTest, VertexAnglesStepSixtyDegreesFromMinusThirty) {
    const GeoPoint center(36.447451, 4.228459);
    auto ring = GenerateHexagon(center, 2.0);
    ASSERT_TRUE(ring.has_value());

    for (int i = 0; i < 6; ++i) {
        double east = 0.0;
        double north = 0.0;
        PlanarOffset(center, (*ring)[i], east, north);
        const double angle = RadToDeg(std::atan2(north, east));

        double expected = HexagonVertexAngle(i);
        if (expected > 180.0) {
            expected -= 360.0;
        }
        EXPECT_NEAR(expected, angle, 1e-9) << "vertex " << i;
    }
}

TEST(HexagonGeometryTest, FlatTopOrientation) {
    const GeoPoint center(0.0, 0.0);
    auto ring = GenerateHexagon(center, 1.0);
    ASSERT_TRUE(ring.has_value());

    // Vertex 0 at -30 degrees is south-east, vertex 2 at 90 degrees due north
    EXPECT_LT((*ring)[0].latitude, center.latitude);
    EXPECT_GT((*ring)[0].longitude, center.longitude);
    EXPECT_GT((*ring)[1].latitude, center.latitude);
    EXPECT_GT((*ring)[1].longitude, center.longitude);
    EXPECT_NEAR(center.longitude, (*ring)[2].longitude, 1e-12);
    EXPECT_GT((*ring)[2].latitude, center.latitude);
}

TEST(HexagonGeometryTest, LongitudeSpanWidensWithLatitude) {
    auto equator = GenerateHexagon(GeoPoint(0.0, 0.0), 2.0);
    auto north = GenerateHexagon(GeoPoint(60.0, 0.0), 2.0);
    ASSERT_TRUE(equator.has_value());
    ASSERT_TRUE(north.has_value());

    // cos(60) = 0.5 doubles the longitude offset
    EXPECT_NEAR(2.0 * (*equator)[0].longitude, (*north)[0].longitude, 1e-12);
    EXPECT_NEAR((*equator)[0].latitude, (*north)[0].latitude - 60.0, 1e-12);
}

TEST(HexagonGeometryTest, GenerationIsIdempotent) {
    const HexagonSpec spec(GeoPoint(48.8566, 2.3522), 3.7);
    auto first = GenerateHexagon(spec);
    auto second = GenerateHexagon(spec);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(HexagonGeometryTest, SpecOverloadMatchesPointOverload) {
    auto fromSpec = GenerateHexagon(SampleSpec());
    auto fromPoint = GenerateHexagon(SampleSpec().center, SampleSpec().radiusKm);
    ASSERT_TRUE(fromSpec.has_value());
    ASSERT_TRUE(fromPoint.has_value());
    EXPECT_EQ(*fromSpec, *fromPoint);
}

TEST(HexagonGeometryTest, LongitudeIsNotWrapped) {
    auto ring = GenerateHexagon(GeoPoint(0.0, 179.99), 5.0);
    ASSERT_TRUE(ring.has_value());
    EXPECT_GT((*ring)[0].longitude, 180.0);
}

// =============================================================================
// Precondition Tests
// =============================================================================

TEST(HexagonGeometryTest, ZeroRadiusIsInvalid) {
    auto ring = GenerateHexagon(GeoPoint(36.447451, 4.228459), 0.0);
    ASSERT_FALSE(ring.has_value());
    EXPECT_EQ(GeometryError::InvalidRadius, ring.error());
}

TEST(HexagonGeometryTest, NegativeAndNonFiniteRadiusAreInvalid) {
    const GeoPoint center(0.0, 0.0);
    EXPECT_EQ(GeometryError::InvalidRadius, GenerateHexagon(center, -1.0).error());
    EXPECT_EQ(GeometryError::InvalidRadius,
              GenerateHexagon(center, std::numeric_limits<double>::quiet_NaN()).error());
    EXPECT_EQ(GeometryError::InvalidRadius,
              GenerateHexagon(center, std::numeric_limits<double>::infinity()).error());
}

TEST(HexagonGeometryTest, PolesAreRejected) {
    EXPECT_EQ(GeometryError::PolarSingularity, GenerateHexagon(GeoPoint(90.0, 0.0), 1.0).error());
    EXPECT_EQ(GeometryError::PolarSingularity, GenerateHexagon(GeoPoint(-90.0, 45.0), 1.0).error());
    EXPECT_EQ(GeometryError::PolarSingularity,
              GenerateHexagon(GeoPoint(90.0 - 1e-8, 0.0), 1.0).error());
    EXPECT_TRUE(GenerateHexagon(GeoPoint(89.9, 0.0), 1.0).has_value());
}

TEST(HexagonGeometryTest, OutOfRangeCenterIsRejected) {
    EXPECT_EQ(GeometryError::InvalidCoordinate, GenerateHexagon(GeoPoint(91.0, 0.0), 1.0).error());
    EXPECT_EQ(GeometryError::InvalidCoordinate, GenerateHexagon(GeoPoint(0.0, 180.5), 1.0).error());
    EXPECT_EQ(GeometryError::InvalidCoordinate,
              GenerateHexagon(GeoPoint(std::numeric_limits<double>::quiet_NaN(), 0.0), 1.0).error());
}

TEST(HexagonGeometryTest, RadiusCheckedBeforeCenter) {
    EXPECT_EQ(GeometryError::InvalidRadius, GenerateHexagon(GeoPoint(95.0, 0.0), 0.0).error());
}

TEST(HexagonGeometryTest, ErrorStrings) {
    EXPECT_STREQ("invalid radius", GeometryErrorToString(GeometryError::InvalidRadius));
    EXPECT_STREQ("polar singularity", GeometryErrorToString(GeometryError::PolarSingularity));
    EXPECT_STREQ("invalid coordinate", GeometryErrorToString(GeometryError::InvalidCoordinate));
}

// =============================================================================
// Area Tests
// =============================================================================

TEST(HexagonAreaTest, DefaultRegionArea) {
    auto area = HexagonAreaSqKm(2.0);
    ASSERT_TRUE(area.has_value());
    EXPECT_NEAR(10.392, *area, 1e-12);
}

TEST(HexagonAreaTest, ZeroRadiusHasZeroArea) {
    auto area = HexagonAreaSqKm(0.0);
    ASSERT_TRUE(area.has_value());
    EXPECT_DOUBLE_EQ(0.0, *area);
}

TEST(HexagonAreaTest, ScalesQuadratically) {
    for (double r : {0.1, 0.5, 1.0, 2.0, 3.3, 10.0}) {
        EXPECT_NEAR(4.0 * *HexagonAreaSqKm(r), *HexagonAreaSqKm(2.0 * r), 1e-9 * r * r) << "r = " << r;
    }
}

TEST(HexagonAreaTest, MonotonicallyIncreasing) {
    double previous = *HexagonAreaSqKm(0.0);
    for (double r = 0.25; r <= 10.0; r += 0.25) {
        const double area = *HexagonAreaSqKm(r);
        EXPECT_GT(area, previous) << "r = " << r;
        previous = area;
    }
}

TEST(HexagonAreaTest, NegativeRadiusIsInvalid) {
    auto area = HexagonAreaSqKm(-0.5);
    ASSERT_FALSE(area.has_value());
    EXPECT_EQ(GeometryError::InvalidRadius, area.error());
}

// =============================================================================
// GeoPoint Tests
// =============================================================================

TEST(GeoPointTest, Validity) {
    EXPECT_TRUE(GeoPoint(0.0, 0.0).IsValid());
    EXPECT_TRUE(GeoPoint(-90.0, 180.0).IsValid());
    EXPECT_FALSE(GeoPoint(90.1, 0.0).IsValid());
    EXPECT_FALSE(GeoPoint(0.0, -180.1).IsValid());
    EXPECT_FALSE(GeoPoint(0.0, std::numeric_limits<double>::infinity()).IsValid());
}

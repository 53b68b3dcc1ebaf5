/**
 * @file TestHelpers.hpp
 * @brief Helper functions and utilities for tests
 */

#pragma once

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "geo/AnalysisResult.hpp"
#include "geo/GeoTypes.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace GeoHex {
namespace Test {

// =============================================================================
// Geographic Comparison Helpers
// =============================================================================

/**
 * @brief Check if two points are within @p epsilon degrees on both axes
 */
inline bool GeoPointNear(const Geo::GeoPoint& a, const Geo::GeoPoint& b, double epsilon = 1e-9) {
    return std::abs(a.latitude - b.latitude) <= epsilon &&
           std::abs(a.longitude - b.longitude) <= epsilon;
}

/**
 * @brief Relative closeness for quantities spanning several magnitudes
 */
inline bool RelativeNear(double expected, double actual, double relativeTolerance) {
    return std::abs(expected - actual) <= relativeTolerance * std::abs(expected);
}

// =============================================================================
// Custom GTest Assertions
// =============================================================================

#define EXPECT_GEOPOINT_NEAR(expected, actual, epsilon) \
    EXPECT_TRUE(GeoHex::Test::GeoPointNear(expected, actual, epsilon)) \
        << "Expected: (" << (expected).latitude << ", " << (expected).longitude << ")\n" \
        << "Actual:   (" << (actual).latitude << ", " << (actual).longitude << ")\n" \
        << "Epsilon:  " << epsilon

#define EXPECT_RELATIVE_NEAR(expected, actual, tolerance) \
    EXPECT_TRUE(GeoHex::Test::RelativeNear(expected, actual, tolerance)) \
        << "Expected: " << (expected) << "\n" \
        << "Actual:   " << (actual) << "\n" \
        << "Relative tolerance: " << (tolerance)

// =============================================================================
// Sample Data
// =============================================================================

/**
 * @brief Analyzer response for a 2 km hexagon with forest/farmland/residential
 */
inline nlohmann::json SampleAnalyzerJson() {
    return {
        {"elevation_min", 412.5},
        {"elevation_mean", 530.25},
        {"elevation_max", 688.0},
        {"total_road_length_m", 15234.7},
        {"building_density", 0.1234},
        {"total_building_area_sq_m", 1282345.0},
        {"water_percentage", 2.5},
        {"water_area_sq_m", 259800.0},
        {"dominant_landuse", "forest"},
        {"dominant_landuse_percentage", 60.0},
        {"landuse_breakdown", {
            {"forest", 600.0},
            {"farmland", 300.0},
            {"residential", 100.0}
        }},
        {"hexagon_area_sq_km", 10.392}
    };
}

/**
 * @brief Parsed form of SampleAnalyzerJson()
 */
inline Geo::AnalysisResult SampleResult() {
    Geo::AnalysisResult result;
    result.elevation = {412.5, 530.25, 688.0};
    result.roads.totalLengthM = 15234.7;
    result.buildings = {0.1234, 1282345.0};
    result.water = {2.5, 259800.0};
    result.landuse = Geo::LandUseSummary::FromBreakdown({
        {"forest", 600.0},
        {"farmland", 300.0},
        {"residential", 100.0}
    });
    result.hexagonAreaSqKm = 10.392;
    return result;
}

/**
 * @brief Default dashboard region used across tests
 */
inline Geo::HexagonSpec SampleSpec() {
    return {Geo::GeoPoint(36.447451, 4.228459), 2.0};
}

// =============================================================================
// Filesystem Utilities
// =============================================================================

/**
 * @brief Unique scratch directory under the system temp dir, removed on scope exit
 */
class ScopedTempDir {
public:
    ScopedTempDir() {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() / ("geohex_test_" + std::to_string(stamp));
        std::filesystem::create_directories(m_path);
    }

    ~ScopedTempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& Path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

} // namespace Test
} // namespace GeoHex

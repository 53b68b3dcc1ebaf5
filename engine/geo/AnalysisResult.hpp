#pragma once

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace GeoHex {
namespace Geo {

/**
 * @brief Elevation statistics over the region, meters
 */
struct ElevationStats {
    double min = 0.0;
    double mean = 0.0;
    double max = 0.0;

    double Range() const { return max - min; }
};

/**
 * @brief Water coverage; percentage is already on a 0-100 scale
 */
struct WaterCoverage {
    double percentage = 0.0;
    double areaSqM = 0.0;
};

/**
 * @brief Building footprint coverage; density is a 0-1 fraction
 */
struct BuildingCoverage {
    double density = 0.0;
    double totalAreaSqM = 0.0;
};

struct RoadNetworkStats {
    double totalLengthM = 0.0;
};

/// Land-use category name -> measured area (one unit across all entries)
using LandUseBreakdown = std::map<std::string, double>;

/**
 * @brief Pick the category with the greatest area
 *
 * Ties go to the lexicographically smallest name. Returns nullopt when the
 * breakdown is empty or its total area is zero.
 */
std::optional<std::string> DominantCategory(const LandUseBreakdown& breakdown);

/**
 * @brief Sum of all breakdown areas
 */
double TotalLandUseArea(const LandUseBreakdown& breakdown);

/**
 * @brief 100 * area / total for every category
 *
 * Every category maps to 0 when the total area is zero.
 */
std::map<std::string, double> LandUsePercentages(const LandUseBreakdown& breakdown);

/**
 * @brief Land-use breakdown with its derived fields
 */
struct LandUseSummary {
    LandUseBreakdown breakdown;
    std::optional<std::string> dominantCategory;  ///< nullopt means "no data"
    double dominantPercentage = 0.0;              ///< 0-100

    /**
     * @brief Derive dominant category and percentage from a breakdown
     */
    static LandUseSummary FromBreakdown(LandUseBreakdown breakdown);

    bool HasData() const { return dominantCategory.has_value(); }
};

/**
 * @brief Per-region summary produced by one analysis request
 *
 * The wire form is the analyzer's flat JSON object (elevation_min,
 * water_percentage, landuse_breakdown, ...).
 */
struct AnalysisResult {
    ElevationStats elevation;
    WaterCoverage water;
    BuildingCoverage buildings;
    RoadNetworkStats roads;
    LandUseSummary landuse;
    double hexagonAreaSqKm = 0.0;

    /**
     * @brief Check the model invariants
     * @return The first violated invariant as a message
     */
    std::expected<void, std::string> Validate() const;

    nlohmann::json ToJson() const;

    /**
     * @brief Parse the analyzer's flat JSON object
     *
     * The elevation triple and hexagon_area_sq_km are required. Other
     * missing numeric fields default to zero; fields of the wrong type are
     * an error. Land-use keys are lower-cased and the dominant category is
     * always re-derived from the breakdown.
     */
    static std::expected<AnalysisResult, std::string> FromJson(const nlohmann::json& j);
};

/**
 * @brief Cross-check the reported hexagon area against HexagonAreaSqKm
 * @param relativeTolerance Allowed |reported - expected| / expected
 */
bool HexagonAreaMatches(const AnalysisResult& result, double radiusKm,
                        double relativeTolerance = 1e-3);

/// Sentinel the analyzer writes for dominant_landuse when there is no data.
constexpr const char* NO_LANDUSE_DATA = "No data";

} // namespace Geo
} // namespace GeoHex

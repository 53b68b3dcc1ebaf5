#include "AnalysisResult.hpp"
#include "HexagonGeometry.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace GeoHex {
namespace Geo {

namespace {

constexpr double BOUND_EPSILON = 1e-9;

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Reads an optional numeric field; absent or null leaves @p out untouched.
std::expected<void, std::string> ReadNumber(const nlohmann::json& j, const char* key, double& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    if (!it->is_number()) {
        return std::unexpected(std::string("field '") + key + "' is not a number");
    }
    out = it->get<double>();
    return {};
}

std::expected<void, std::string> CheckNonNegative(double value, const char* name) {
    if (!std::isfinite(value)) {
        return std::unexpected(std::string(name) + " is not finite");
    }
    if (value < 0.0) {
        return std::unexpected(std::string(name) + " is negative");
    }
    return {};
}

} // namespace

// =============================================================================
// Land Use Derivation
// =============================================================================

double TotalLandUseArea(const LandUseBreakdown& breakdown) {
    double total = 0.0;
    for (const auto& [category, area] : breakdown) {
        total += area;
    }
    return total;
}

std::optional<std::string> DominantCategory(const LandUseBreakdown& breakdown) {
    if (TotalLandUseArea(breakdown) <= 0.0) {
        return std::nullopt;
    }

    // std::map iterates in ascending name order, so keeping the first
    // maximum breaks ties towards the smallest name.
    const std::string* best = nullptr;
    double bestArea = 0.0;
    for (const auto& [category, area] : breakdown) {
        if (!best || area > bestArea) {
            best = &category;
            bestArea = area;
        }
    }
    return *best;
}

std::map<std::string, double> LandUsePercentages(const LandUseBreakdown& breakdown) {
    std::map<std::string, double> percentages;
    const double total = TotalLandUseArea(breakdown);
    for (const auto& [category, area] : breakdown) {
        percentages[category] = total > 0.0 ? 100.0 * area / total : 0.0;
    }
    return percentages;
}

LandUseSummary LandUseSummary::FromBreakdown(LandUseBreakdown breakdown) {
    LandUseSummary summary;
    summary.breakdown = std::move(breakdown);
    summary.dominantCategory = DominantCategory(summary.breakdown);
    if (summary.dominantCategory) {
        summary.dominantPercentage =
            100.0 * summary.breakdown.at(*summary.dominantCategory) / TotalLandUseArea(summary.breakdown);
    }
    return summary;
}

// =============================================================================
// AnalysisResult
// =============================================================================

std::expected<void, std::string> AnalysisResult::Validate() const {
    if (!std::isfinite(elevation.min) || !std::isfinite(elevation.mean) ||
        !std::isfinite(elevation.max)) {
        return std::unexpected("elevation statistics are not finite");
    }
    if (elevation.min > elevation.mean || elevation.mean > elevation.max) {
        return std::unexpected("elevation statistics are not ordered min <= mean <= max");
    }

    if (auto ok = CheckNonNegative(water.percentage, "water percentage"); !ok) return ok;
    if (water.percentage > 100.0 + BOUND_EPSILON) {
        return std::unexpected("water percentage exceeds 100");
    }
    if (auto ok = CheckNonNegative(water.areaSqM, "water area"); !ok) return ok;

    if (auto ok = CheckNonNegative(buildings.density, "building density"); !ok) return ok;
    if (buildings.density > 1.0 + BOUND_EPSILON) {
        return std::unexpected("building density exceeds 1");
    }
    if (auto ok = CheckNonNegative(buildings.totalAreaSqM, "building area"); !ok) return ok;

    if (auto ok = CheckNonNegative(roads.totalLengthM, "road length"); !ok) return ok;

    for (const auto& [category, area] : landuse.breakdown) {
        if (!std::isfinite(area) || area < 0.0) {
            return std::unexpected("land-use area for '" + category + "' is invalid");
        }
    }
    if (landuse.dominantCategory && !landuse.breakdown.contains(*landuse.dominantCategory)) {
        return std::unexpected("dominant land use is not part of the breakdown");
    }

    if (auto ok = CheckNonNegative(hexagonAreaSqKm, "hexagon area"); !ok) return ok;

    return {};
}

nlohmann::json AnalysisResult::ToJson() const {
    nlohmann::json j;
    j["elevation_min"] = elevation.min;
    j["elevation_mean"] = elevation.mean;
    j["elevation_max"] = elevation.max;
    j["total_road_length_m"] = roads.totalLengthM;
    j["building_density"] = buildings.density;
    j["total_building_area_sq_m"] = buildings.totalAreaSqM;
    j["water_percentage"] = water.percentage;
    j["water_area_sq_m"] = water.areaSqM;
    j["dominant_landuse"] = landuse.dominantCategory.value_or(NO_LANDUSE_DATA);
    j["dominant_landuse_percentage"] = landuse.dominantPercentage;

    nlohmann::json breakdown = nlohmann::json::object();
    for (const auto& [category, area] : landuse.breakdown) {
        breakdown[category] = area;
    }
    j["landuse_breakdown"] = breakdown;
    j["hexagon_area_sq_km"] = hexagonAreaSqKm;
    return j;
}

std::expected<AnalysisResult, std::string> AnalysisResult::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::unexpected("analysis result must be a JSON object");
    }

    AnalysisResult result;

    // A run that stopped before measuring anything (e.g. the elevation
    // raster could not be opened) omits these, unlike an all-zero result.
    for (const char* key : {"elevation_min", "elevation_mean", "elevation_max", "hexagon_area_sq_km"}) {
        if (auto it = j.find(key); it == j.end() || it->is_null()) {
            return std::unexpected(std::string("analysis result is missing '") + key + "'");
        }
    }

    const std::pair<const char*, double*> numericFields[] = {
        {"elevation_min", &result.elevation.min},
        {"elevation_mean", &result.elevation.mean},
        {"elevation_max", &result.elevation.max},
        {"total_road_length_m", &result.roads.totalLengthM},
        {"building_density", &result.buildings.density},
        {"total_building_area_sq_m", &result.buildings.totalAreaSqM},
        {"water_percentage", &result.water.percentage},
        {"water_area_sq_m", &result.water.areaSqM},
        {"hexagon_area_sq_km", &result.hexagonAreaSqKm},
    };
    for (const auto& [key, target] : numericFields) {
        if (auto ok = ReadNumber(j, key, *target); !ok) {
            return std::unexpected(ok.error());
        }
    }

    LandUseBreakdown breakdown;
    if (auto it = j.find("landuse_breakdown"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            return std::unexpected("field 'landuse_breakdown' is not an object");
        }
        for (const auto& [category, area] : it->items()) {
            if (!area.is_number()) {
                return std::unexpected("land-use area for '" + category + "' is not a number");
            }
            breakdown[ToLower(category)] += area.get<double>();
        }
    }
    result.landuse = LandUseSummary::FromBreakdown(std::move(breakdown));

    if (auto it = j.find("dominant_landuse"); it != j.end() && it->is_string()) {
        const std::string reported = ToLower(it->get<std::string>());
        const std::string derived = result.landuse.dominantCategory.value_or(ToLower(NO_LANDUSE_DATA));
        if (reported != derived) {
            GEOHEX_LOG_DEBUG("Analyzer reported dominant land use '{}', derived '{}'",
                             it->get<std::string>(), derived);
        }
    }

    return result;
}

bool HexagonAreaMatches(const AnalysisResult& result, double radiusKm, double relativeTolerance) {
    auto expected = HexagonAreaSqKm(radiusKm);
    if (!expected) {
        return false;
    }
    if (*expected == 0.0) {
        return result.hexagonAreaSqKm == 0.0;
    }
    return std::abs(result.hexagonAreaSqKm - *expected) / *expected <= relativeTolerance;
}

} // namespace Geo
} // namespace GeoHex

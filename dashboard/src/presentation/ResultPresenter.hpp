#pragma once

#include "geo/AnalysisResult.hpp"
#include "geo/GeoTypes.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief Built-up character of the region, from building density
 */
enum class DevelopmentClass {
    Rural,        ///< density < 0.05
    PeriUrban,    ///< density < 0.15
    Residential,  ///< density < 0.30
    DenseUrban
};

const char* DevelopmentClassToString(DevelopmentClass development);

/**
 * @brief Hydrological character of the region, from water percentage
 */
enum class WaterClass {
    Dry,       ///< < 1 %
    Sparse,    ///< < 5 %
    Wet,       ///< < 10 %
    VeryWet
};

const char* WaterClassToString(WaterClass water);

/**
 * @brief Display helpers for an AnalysisResult
 *
 * Unit conversions for display (fraction to percent, m to km, m2 to ha)
 * happen here and never inside the result model.
 */
class ResultPresenter {
public:
    /**
     * @brief At most two fraction digits, trailing zeros removed
     */
    static std::string FormatNumber(double value);

    static double BuildingDensityPercent(const Geo::BuildingCoverage& buildings) {
        return buildings.density * 100.0;
    }

    static double RoadLengthKm(const Geo::RoadNetworkStats& roads) {
        return roads.totalLengthM / 1000.0;
    }

    static double HectaresFromSqM(double areaSqM) { return areaSqM / 10000.0; }

    static DevelopmentClass ClassifyBuildingDensity(double density);
    static WaterClass ClassifyWaterCoverage(double waterPercentage);

    /**
     * @brief Hex colour for a land-use category (grey when unknown)
     */
    static std::string LandUseColor(std::string_view category);

    /**
     * @brief Display name of the dominant category, "N/A" without data
     */
    static std::string DominantLandUseLabel(const Geo::LandUseSummary& landuse);

    /**
     * @brief Human-readable summary for the terminal
     */
    static std::vector<std::string> SummaryLines(const Geo::HexagonSpec& spec,
                                                 const Geo::AnalysisResult& result);
};

} // namespace Dashboard
} // namespace GeoHex

#include "ResultPresenter.hpp"
#include "geo/HexagonGeometry.hpp"
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace GeoHex {
namespace Dashboard {

namespace {

std::string FormatCoordinate(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << value;
    return out.str();
}

} // namespace

const char* DevelopmentClassToString(DevelopmentClass development) {
    switch (development) {
        case DevelopmentClass::Rural:       return "rural/agricultural";
        case DevelopmentClass::PeriUrban:   return "peri-urban";
        case DevelopmentClass::Residential: return "residential";
        case DevelopmentClass::DenseUrban:  return "dense urban";
    }
    return "unknown";
}

const char* WaterClassToString(WaterClass water) {
    switch (water) {
        case WaterClass::Dry:     return "dry";
        case WaterClass::Sparse:  return "sparse water";
        case WaterClass::Wet:     return "wet";
        case WaterClass::VeryWet: return "very wet";
    }
    return "unknown";
}

std::string ResultPresenter::FormatNumber(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << value;
    std::string text = out.str();

    if (text.find('.') != std::string::npos) {
        while (text.back() == '0') {
            text.pop_back();
        }
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

DevelopmentClass ResultPresenter::ClassifyBuildingDensity(double density) {
    if (density < 0.05) return DevelopmentClass::Rural;
    if (density < 0.15) return DevelopmentClass::PeriUrban;
    if (density < 0.30) return DevelopmentClass::Residential;
    return DevelopmentClass::DenseUrban;
}

WaterClass ResultPresenter::ClassifyWaterCoverage(double waterPercentage) {
    if (waterPercentage < 1.0) return WaterClass::Dry;
    if (waterPercentage < 5.0) return WaterClass::Sparse;
    if (waterPercentage < 10.0) return WaterClass::Wet;
    return WaterClass::VeryWet;
}

std::string ResultPresenter::LandUseColor(std::string_view category) {
    static const std::unordered_map<std::string_view, const char*> colors = {
        {"forest", "#22c55e"},
        {"residential", "#f59e0b"},
        {"farmland", "#fbbf24"},
        {"commercial", "#ef4444"},
        {"industrial", "#6366f1"}
    };
    auto it = colors.find(category);
    return it != colors.end() ? it->second : "#94a3b8";
}

std::string ResultPresenter::DominantLandUseLabel(const Geo::LandUseSummary& landuse) {
    return landuse.dominantCategory.value_or("N/A");
}

std::vector<std::string> ResultPresenter::SummaryLines(const Geo::HexagonSpec& spec,
                                                       const Geo::AnalysisResult& result) {
    std::vector<std::string> lines;

    lines.push_back("Centre: " + FormatCoordinate(spec.center.latitude) + ", " +
                    FormatCoordinate(spec.center.longitude));
    lines.push_back("Radius: " + FormatNumber(spec.radiusKm) + " km");
    if (auto area = Geo::HexagonAreaSqKm(spec.radiusKm)) {
        lines.push_back("Area: " + FormatNumber(*area) + " km2");
    }

    const auto& elevation = result.elevation;
    lines.push_back("Elevation: min " + FormatNumber(elevation.min) + " m, mean " +
                    FormatNumber(elevation.mean) + " m, max " + FormatNumber(elevation.max) +
                    " m (range " + FormatNumber(elevation.Range()) + " m)");

    lines.push_back("Water: " + FormatNumber(result.water.percentage) + "% (" +
                    FormatNumber(HectaresFromSqM(result.water.areaSqM)) + " ha), " +
                    WaterClassToString(ClassifyWaterCoverage(result.water.percentage)));

    lines.push_back("Buildings: " + FormatNumber(BuildingDensityPercent(result.buildings)) +
                    "% density (" + FormatNumber(HectaresFromSqM(result.buildings.totalAreaSqM)) +
                    " ha), " + DevelopmentClassToString(ClassifyBuildingDensity(result.buildings.density)));

    lines.push_back("Roads: " + FormatNumber(RoadLengthKm(result.roads)) + " km");

    if (result.landuse.HasData()) {
        lines.push_back("Dominant land use: " + DominantLandUseLabel(result.landuse) + " (" +
                        FormatNumber(result.landuse.dominantPercentage) + "%)");
        for (const auto& [category, percentage] : Geo::LandUsePercentages(result.landuse.breakdown)) {
            lines.push_back("  " + category + ": " + FormatNumber(percentage) + "%");
        }
    } else {
        lines.push_back("Dominant land use: N/A");
    }

    return lines;
}

} // namespace Dashboard
} // namespace GeoHex

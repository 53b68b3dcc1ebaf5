#include "MapOverlay.hpp"
#include "ResultPresenter.hpp"
#include "export/ResultExport.hpp"
#include <iomanip>
#include <sstream>

namespace GeoHex {
namespace Dashboard {

MapOverlayBuilder::MapOverlayBuilder(MarkerStyle style)
    : m_style(std::move(style)) {
}

std::vector<std::string> MapOverlayBuilder::PopupLines(const Geo::HexagonSpec& spec,
                                                       const Geo::AnalysisResult* result) const {
    std::vector<std::string> lines;
    lines.push_back("Radius: " + ResultPresenter::FormatNumber(spec.radiusKm) + " km");

    // Popup area always shows two decimals
    if (auto area = Geo::HexagonAreaSqKm(spec.radiusKm)) {
        std::ostringstream text;
        text << std::fixed << std::setprecision(2) << *area;
        lines.push_back("Area: " + text.str() + " km2");
    }

    if (result) {
        lines.push_back("Mean elevation: " + ResultPresenter::FormatNumber(result->elevation.mean) + " m");
        lines.push_back("Min elevation: " + ResultPresenter::FormatNumber(result->elevation.min) + " m");
        lines.push_back("Max elevation: " + ResultPresenter::FormatNumber(result->elevation.max) + " m");
        lines.push_back("Water: " + ResultPresenter::FormatNumber(result->water.percentage) + "%");
        lines.push_back("Building density: " +
                        ResultPresenter::FormatNumber(ResultPresenter::BuildingDensityPercent(result->buildings)) + "%");
        lines.push_back("Roads: " +
                        ResultPresenter::FormatNumber(ResultPresenter::RoadLengthKm(result->roads)) + " km");
        lines.push_back("Dominant land use: " + ResultPresenter::DominantLandUseLabel(result->landuse));
    }
    return lines;
}

std::expected<nlohmann::json, Geo::GeometryError> MapOverlayBuilder::Build(const Geo::HexagonSpec& spec,
                                                                           const Geo::AnalysisResult* result) const {
    auto ring = Geo::GenerateHexagon(spec);
    if (!ring) {
        return std::unexpected(ring.error());
    }

    nlohmann::json overlay = ResultExport::HexagonToGeoJson(spec, *ring);
    auto& hexagonFeature = overlay["features"][0];
    hexagonFeature["properties"]["role"] = "analysis_region";
    hexagonFeature["properties"]["popup"] = PopupLines(spec, result);
    if (result && result->landuse.HasData()) {
        hexagonFeature["properties"]["fill"] =
            ResultPresenter::LandUseColor(*result->landuse.dominantCategory);
    }

    nlohmann::json marker = {
        {"type", "Feature"},
        {"properties", {
            {"role", "center_marker"},
            {"marker", m_style.ToJson()}
        }},
        {"geometry", {
            {"type", "Point"},
            {"coordinates", {spec.center.longitude, spec.center.latitude}}
        }}
    };
    overlay["features"].push_back(marker);

    return overlay;
}

} // namespace Dashboard
} // namespace GeoHex

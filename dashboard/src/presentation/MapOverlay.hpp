#pragma once

#include "MarkerStyle.hpp"
#include "geo/AnalysisResult.hpp"
#include "geo/HexagonGeometry.hpp"
#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief Builds the map overlay for a region: hexagon, centre marker, popup
 *
 * The marker appearance is fixed at construction; each map view owns its
 * builder and therefore its style.
 */
class MapOverlayBuilder {
public:
    explicit MapOverlayBuilder(MarkerStyle style);

    /**
     * @brief GeoJSON FeatureCollection with the hexagon and the marker
     * @param result Latest analysis, or nullptr before the first success
     */
    std::expected<nlohmann::json, Geo::GeometryError> Build(const Geo::HexagonSpec& spec,
                                                            const Geo::AnalysisResult* result = nullptr) const;

    /**
     * @brief Lines shown in the hexagon popup
     */
    std::vector<std::string> PopupLines(const Geo::HexagonSpec& spec,
                                        const Geo::AnalysisResult* result = nullptr) const;

    const MarkerStyle& GetMarkerStyle() const { return m_style; }

private:
    const MarkerStyle m_style;
};

} // namespace Dashboard
} // namespace GeoHex

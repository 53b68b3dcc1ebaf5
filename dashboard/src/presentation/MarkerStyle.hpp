#pragma once

#include <string>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief Appearance of the centre marker, sizes in pixels
 *
 * Passed by value to whatever renders the map; there is no global default.
 */
struct MarkerStyle {
    std::string iconUrl = "images/marker-icon.png";
    std::string iconRetinaUrl = "images/marker-icon-2x.png";
    std::string shadowUrl = "images/marker-shadow.png";
    glm::ivec2 iconSize{25, 41};
    glm::ivec2 iconAnchor{12, 41};
    glm::ivec2 popupAnchor{1, -34};
    glm::ivec2 shadowSize{41, 41};

    bool operator==(const MarkerStyle& other) const = default;

    nlohmann::json ToJson() const {
        return {
            {"icon_url", iconUrl},
            {"icon_retina_url", iconRetinaUrl},
            {"shadow_url", shadowUrl},
            {"icon_size", {iconSize.x, iconSize.y}},
            {"icon_anchor", {iconAnchor.x, iconAnchor.y}},
            {"popup_anchor", {popupAnchor.x, popupAnchor.y}},
            {"shadow_size", {shadowSize.x, shadowSize.y}}
        };
    }
};

} // namespace Dashboard
} // namespace GeoHex

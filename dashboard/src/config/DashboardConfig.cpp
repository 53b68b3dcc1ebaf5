#include "DashboardConfig.hpp"
#include "core/Logger.hpp"

namespace GeoHex {
namespace Dashboard {

DashboardConfig DashboardConfig::FromConfig(const Config& config) {
    DashboardConfig result;

    auto& analyzer = result.analyzer;
    analyzer.baseUrl = config.Get<std::string>("analyzer.base_url", analyzer.baseUrl);
    analyzer.timeoutSeconds = config.Get<int>("analyzer.timeout_seconds", analyzer.timeoutSeconds);
    analyzer.userAgent = config.Get<std::string>("analyzer.user_agent", analyzer.userAgent);
    if (analyzer.timeoutSeconds <= 0) {
        GEOHEX_LOG_WARN("[Config] analyzer.timeout_seconds must be positive, using 30");
        analyzer.timeoutSeconds = 30;
    }

    auto& region = result.region;
    region.center.latitude = config.Get<double>("region.default_latitude", region.center.latitude);
    region.center.longitude = config.Get<double>("region.default_longitude", region.center.longitude);
    region.radiusKm = config.Get<double>("region.default_radius_km", region.radiusKm);
    region.minRadiusKm = config.Get<double>("region.min_radius_km", region.minRadiusKm);
    region.maxRadiusKm = config.Get<double>("region.max_radius_km", region.maxRadiusKm);
    if (!(region.minRadiusKm > 0.0) || region.maxRadiusKm < region.minRadiusKm) {
        GEOHEX_LOG_WARN("[Config] Invalid radius range [{}, {}], using [0.5, 10]",
                        region.minRadiusKm, region.maxRadiusKm);
        region.minRadiusKm = 0.5;
        region.maxRadiusKm = 10.0;
    }

    auto& marker = result.marker;
    marker.iconUrl = config.Get<std::string>("marker.icon_url", marker.iconUrl);
    marker.iconRetinaUrl = config.Get<std::string>("marker.icon_retina_url", marker.iconRetinaUrl);
    marker.shadowUrl = config.Get<std::string>("marker.shadow_url", marker.shadowUrl);
    marker.iconSize = config.Get<glm::ivec2>("marker.icon_size", marker.iconSize);
    marker.iconAnchor = config.Get<glm::ivec2>("marker.icon_anchor", marker.iconAnchor);
    marker.popupAnchor = config.Get<glm::ivec2>("marker.popup_anchor", marker.popupAnchor);
    marker.shadowSize = config.Get<glm::ivec2>("marker.shadow_size", marker.shadowSize);

    result.logFile = config.Get<std::string>("logging.file", result.logFile);
    result.logLevel = config.Get<std::string>("logging.level", result.logLevel);

    return result;
}

} // namespace Dashboard
} // namespace GeoHex

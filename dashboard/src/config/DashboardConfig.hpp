#pragma once

#include "config/Config.hpp"
#include "geo/GeoTypes.hpp"
#include "networking/AnalyzerClient.hpp"
#include "presentation/MarkerStyle.hpp"
#include <string>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief Initial region and the radius range the dashboard offers
 *
 * The range only constrains user input; geometry accepts any positive radius.
 */
struct RegionDefaults {
    Geo::GeoPoint center{36.447451, 4.228459};
    double radiusKm = 2.0;
    double minRadiusKm = 0.5;
    double maxRadiusKm = 10.0;

    bool AcceptsRadius(double radiusKm) const {
        return radiusKm >= minRadiusKm && radiusKm <= maxRadiusKm;
    }

    Geo::HexagonSpec DefaultSpec() const { return {center, radiusKm}; }
};

/**
 * @brief Typed view of the dashboard settings held by Config
 */
struct DashboardConfig {
    Net::AnalyzerEndpoint analyzer;
    RegionDefaults region;
    MarkerStyle marker;
    std::string logFile;
    std::string logLevel = "info";

    /**
     * @brief Read every dashboard key, falling back to built-in defaults
     */
    static DashboardConfig FromConfig(const Config& config);
};

} // namespace Dashboard
} // namespace GeoHex

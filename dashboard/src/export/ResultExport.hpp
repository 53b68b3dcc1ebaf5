#pragma once

#include "geo/AnalysisResult.hpp"
#include "geo/GeoTypes.hpp"
#include <expected>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace GeoHex {
namespace Dashboard {

/**
 * @brief One flattened (metric, value, unit) row of an analysis result
 */
struct TableRow {
    std::string metric;
    std::string value;
    std::string unit;
};

/**
 * @brief Tabular and GeoJSON exports of analysis data
 */
class ResultExport {
public:
    /**
     * @brief Flatten a result into rows
     *
     * Fixed metrics come first, followed by one row per land-use category.
     * Values keep full precision; building density stays a fraction.
     */
    static std::vector<TableRow> ToTable(const Geo::AnalysisResult& result);

    /**
     * @brief Render rows as CSV with a "Metric,Value,Unit" header
     */
    static std::string ToCsv(const std::vector<TableRow>& rows);

    static std::expected<void, std::string> WriteCsv(const std::filesystem::path& path,
                                                     const Geo::AnalysisResult& result);

    /**
     * @brief Write GeoJSON unchanged, indented by two spaces
     */
    static std::expected<void, std::string> WriteGeoJson(const std::filesystem::path& path,
                                                         const nlohmann::json& geojson);

    /**
     * @brief FeatureCollection holding the hexagon as one Polygon feature
     *
     * Coordinates are [longitude, latitude] in ring order.
     */
    static nlohmann::json HexagonToGeoJson(const Geo::HexagonSpec& spec,
                                           const Geo::HexagonPolygon& ring);

private:
    static std::string EscapeCsvField(const std::string& field);
    static std::expected<void, std::string> WriteText(const std::filesystem::path& path,
                                                      const std::string& text);
};

} // namespace Dashboard
} // namespace GeoHex

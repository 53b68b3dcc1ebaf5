#include "ResultExport.hpp"
#include "geo/HexagonGeometry.hpp"
#include "core/Logger.hpp"
#include <fstream>

namespace GeoHex {
namespace Dashboard {

namespace {

// Shortest text that reads back to the same double.
std::string NumberText(double value) {
    return nlohmann::json(value).dump();
}

} // namespace

std::vector<TableRow> ResultExport::ToTable(const Geo::AnalysisResult& result) {
    std::vector<TableRow> rows = {
        {"Elevation Min", NumberText(result.elevation.min), "m"},
        {"Elevation Mean", NumberText(result.elevation.mean), "m"},
        {"Elevation Max", NumberText(result.elevation.max), "m"},
        {"Road Length", NumberText(result.roads.totalLengthM), "m"},
        {"Building Density", NumberText(result.buildings.density), ""},
        {"Building Area", NumberText(result.buildings.totalAreaSqM), "m2"},
        {"Water Percentage", NumberText(result.water.percentage), "%"},
        {"Water Area", NumberText(result.water.areaSqM), "m2"},
        {"Dominant Land Use", result.landuse.dominantCategory.value_or(Geo::NO_LANDUSE_DATA), ""},
        {"Dominant Land Use Percentage", NumberText(result.landuse.dominantPercentage), "%"},
        {"Hexagon Area", NumberText(result.hexagonAreaSqKm), "km2"},
    };

    for (const auto& [category, area] : result.landuse.breakdown) {
        rows.push_back({"Land Use: " + category, NumberText(area), "m2"});
    }
    return rows;
}

std::string ResultExport::EscapeCsvField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

std::string ResultExport::ToCsv(const std::vector<TableRow>& rows) {
    std::string csv = "Metric,Value,Unit\n";
    for (const auto& row : rows) {
        csv += EscapeCsvField(row.metric) + "," + EscapeCsvField(row.value) + "," +
               EscapeCsvField(row.unit) + "\n";
    }
    return csv;
}

std::expected<void, std::string> ResultExport::WriteText(const std::filesystem::path& path,
                                                         const std::string& text) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected("cannot create " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::unexpected("cannot open " + path.string() + " for writing");
    }
    file << text;
    if (!file) {
        return std::unexpected("failed writing " + path.string());
    }
    GEOHEX_LOG_INFO("[Export] Wrote {} ({} bytes)", path.string(), text.size());
    return {};
}

std::expected<void, std::string> ResultExport::WriteCsv(const std::filesystem::path& path,
                                                        const Geo::AnalysisResult& result) {
    return WriteText(path, ToCsv(ToTable(result)));
}

std::expected<void, std::string> ResultExport::WriteGeoJson(const std::filesystem::path& path,
                                                            const nlohmann::json& geojson) {
    return WriteText(path, geojson.dump(2) + "\n");
}

nlohmann::json ResultExport::HexagonToGeoJson(const Geo::HexagonSpec& spec,
                                              const Geo::HexagonPolygon& ring) {
    nlohmann::json coordinates = nlohmann::json::array();
    for (const auto& vertex : ring) {
        coordinates.push_back({vertex.longitude, vertex.latitude});
    }

    nlohmann::json properties = {
        {"center_lat", spec.center.latitude},
        {"center_lon", spec.center.longitude},
        {"radius_km", spec.radiusKm}
    };
    if (auto area = Geo::HexagonAreaSqKm(spec.radiusKm)) {
        properties["area_sq_km"] = *area;
    }

    nlohmann::json feature = {
        {"type", "Feature"},
        {"properties", properties},
        {"geometry", {
            {"type", "Polygon"},
            {"coordinates", nlohmann::json::array({coordinates})}
        }}
    };

    return {
        {"type", "FeatureCollection"},
        {"features", nlohmann::json::array({feature})}
    };
}

} // namespace Dashboard
} // namespace GeoHex

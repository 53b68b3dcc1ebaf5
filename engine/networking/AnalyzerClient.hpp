#pragma once

#include "HttpClient.hpp"
#include "geo/AnalysisResult.hpp"
#include "geo/GeoTypes.hpp"
#include <expected>
#include <string>
#include <nlohmann/json.hpp>

namespace GeoHex {
namespace Net {

/**
 * @brief Failure categories at the analyzer boundary
 */
enum class AnalyzerErrorKind {
    Unreachable,      ///< Transport failure, failed health check or HTTP 503
    InvalidRequest,   ///< Rejected before sending, or HTTP 400
    ServerError,      ///< Any other non-200 status
    InvalidResponse   ///< 200 with a body that is not a valid result
};

const char* AnalyzerErrorKindToString(AnalyzerErrorKind kind);

/**
 * @brief Boundary error reported by the analyzer client
 */
struct AnalyzerFailure {
    AnalyzerErrorKind kind = AnalyzerErrorKind::Unreachable;
    std::string message;
    int httpStatus = 0;   ///< 0 when no response was received
};

/// Message used for every Unreachable failure.
constexpr const char* ANALYZER_UNAVAILABLE_MESSAGE = "analyzer unavailable";

/**
 * @brief Where the analyzer lives and how to talk to it
 */
struct AnalyzerEndpoint {
    std::string baseUrl = "http://localhost:5000";
    int timeoutSeconds = 30;
    std::string userAgent = "GeoHex-Dashboard/1.0";
};

/**
 * @brief Client for the remote analysis service
 *
 * Endpoints:
 * - GET  /api/health
 * - POST /api/analyze {latitude, longitude, radius_km}
 * - GET  /api/hexagon-geojson?lat=&lon=&radius=
 *
 * The client never retries; every failure is returned to the caller.
 */
class AnalyzerClient {
public:
    AnalyzerClient(HttpClient& http, AnalyzerEndpoint endpoint = {});

    /**
     * @brief True only when /api/health answers 200
     */
    bool CheckHealth();

    /**
     * @brief Request a full analysis of the region
     */
    std::expected<Geo::AnalysisResult, AnalyzerFailure> Analyze(const Geo::HexagonSpec& spec);

    /**
     * @brief Fetch the analyzer's GeoJSON rendition of the region
     */
    std::expected<nlohmann::json, AnalyzerFailure> FetchHexagonGeoJson(const Geo::HexagonSpec& spec);

    const AnalyzerEndpoint& GetEndpoint() const { return m_endpoint; }

    /**
     * @brief Join base URL and path, tolerating a trailing slash on the base
     */
    static std::string JoinUrl(const std::string& baseUrl, const std::string& path);

private:
    AnalyzerFailure FailureFromResponse(const HttpResponse& response) const;

    HttpClient& m_http;
    AnalyzerEndpoint m_endpoint;
};

} // namespace Net
} // namespace GeoHex

#include "AnalyzerClient.hpp"
#include "core/Logger.hpp"
#include <iomanip>
#include <sstream>

namespace GeoHex {
namespace Net {

namespace {

constexpr int HTTP_OK = 200;
constexpr int HTTP_BAD_REQUEST = 400;
constexpr int HTTP_SERVICE_UNAVAILABLE = 503;

AnalyzerFailure MakeFailure(AnalyzerErrorKind kind, std::string message, int status = 0) {
    AnalyzerFailure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    failure.httpStatus = status;
    return failure;
}

std::string FormatCoordinate(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(6) << value;
    return out.str();
}

} // namespace

const char* AnalyzerErrorKindToString(AnalyzerErrorKind kind) {
    switch (kind) {
        case AnalyzerErrorKind::Unreachable:     return "unreachable";
        case AnalyzerErrorKind::InvalidRequest:  return "invalid request";
        case AnalyzerErrorKind::ServerError:     return "server error";
        case AnalyzerErrorKind::InvalidResponse: return "invalid response";
    }
    return "unknown";
}

AnalyzerClient::AnalyzerClient(HttpClient& http, AnalyzerEndpoint endpoint)
    : m_http(http)
    , m_endpoint(std::move(endpoint)) {
    m_http.SetTimeout(m_endpoint.timeoutSeconds);
    m_http.SetUserAgent(m_endpoint.userAgent);
}

std::string AnalyzerClient::JoinUrl(const std::string& baseUrl, const std::string& path) {
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url + path;
}

bool AnalyzerClient::CheckHealth() {
    HttpResponse response = m_http.Get(JoinUrl(m_endpoint.baseUrl, "/api/health"));
    if (response.statusCode != HTTP_OK) {
        GEOHEX_LOG_WARN("[Analyzer] Health check failed ({})",
                        response.IsTransportError() ? response.error
                                                    : "HTTP " + std::to_string(response.statusCode));
        return false;
    }
    return true;
}

std::expected<Geo::AnalysisResult, AnalyzerFailure> AnalyzerClient::Analyze(const Geo::HexagonSpec& spec) {
    if (!spec.center.IsValid()) {
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidRequest, "invalid centre coordinate"));
    }
    if (!(spec.radiusKm > 0.0)) {
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidRequest, "radius must be positive"));
    }

    nlohmann::json request = {
        {"latitude", spec.center.latitude},
        {"longitude", spec.center.longitude},
        {"radius_km", spec.radiusKm}
    };

    GEOHEX_LOG_INFO("[Analyzer] Requesting analysis at ({:.6f}, {:.6f}) radius {} km",
                    spec.center.latitude, spec.center.longitude, spec.radiusKm);

    HttpResponse response = m_http.Post(JoinUrl(m_endpoint.baseUrl, "/api/analyze"), request.dump());
    if (response.statusCode != HTTP_OK) {
        return std::unexpected(FailureFromResponse(response));
    }

    nlohmann::json body;
    try {
        body = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        GEOHEX_LOG_ERROR("[Analyzer] Malformed analysis response: {}", e.what());
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse,
                                           std::string("malformed JSON: ") + e.what(), response.statusCode));
    }

    auto result = Geo::AnalysisResult::FromJson(body);
    if (!result) {
        GEOHEX_LOG_ERROR("[Analyzer] Unusable analysis response: {}", result.error());
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse, result.error(),
                                           response.statusCode));
    }
    if (auto valid = result->Validate(); !valid) {
        GEOHEX_LOG_ERROR("[Analyzer] Analysis result violates invariants: {}", valid.error());
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse, valid.error(),
                                           response.statusCode));
    }
    if (!(result->hexagonAreaSqKm > 0.0)) {
        GEOHEX_LOG_ERROR("[Analyzer] Analysis result has no hexagon area for radius {} km", spec.radiusKm);
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse,
                                           "analysis result has zero hexagon area", response.statusCode));
    }
    if (!Geo::HexagonAreaMatches(*result, spec.radiusKm)) {
        GEOHEX_LOG_WARN("[Analyzer] Reported hexagon area {} km2 differs from expected for radius {} km",
                        result->hexagonAreaSqKm, spec.radiusKm);
    }

    return std::move(*result);
}

std::expected<nlohmann::json, AnalyzerFailure> AnalyzerClient::FetchHexagonGeoJson(const Geo::HexagonSpec& spec) {
    std::string url = JoinUrl(m_endpoint.baseUrl, "/api/hexagon-geojson") +
                      "?lat=" + FormatCoordinate(spec.center.latitude) +
                      "&lon=" + FormatCoordinate(spec.center.longitude) +
                      "&radius=" + FormatCoordinate(spec.radiusKm);

    HttpResponse response = m_http.Get(url);
    if (response.statusCode != HTTP_OK) {
        return std::unexpected(FailureFromResponse(response));
    }

    try {
        nlohmann::json geojson = nlohmann::json::parse(response.body);
        if (!geojson.is_object()) {
            return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse,
                                               "hexagon geometry is empty", response.statusCode));
        }
        return geojson;
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(MakeFailure(AnalyzerErrorKind::InvalidResponse,
                                           std::string("malformed JSON: ") + e.what(), response.statusCode));
    }
}

AnalyzerFailure AnalyzerClient::FailureFromResponse(const HttpResponse& response) const {
    if (response.IsTransportError() || response.statusCode == HTTP_SERVICE_UNAVAILABLE) {
        GEOHEX_LOG_WARN("[Analyzer] Unreachable: {}",
                        response.IsTransportError() ? response.error : "HTTP 503");
        return MakeFailure(AnalyzerErrorKind::Unreachable, ANALYZER_UNAVAILABLE_MESSAGE, response.statusCode);
    }

    std::string message = "HTTP " + std::to_string(response.statusCode);
    try {
        auto body = nlohmann::json::parse(response.body);
        if (body.is_object() && body.contains("error") && body["error"].is_string()) {
            message = body["error"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // Body without a JSON error object keeps the status text
    }

    GEOHEX_LOG_ERROR("[Analyzer] Request failed with HTTP {}: {}", response.statusCode, message);
    const auto kind = response.statusCode == HTTP_BAD_REQUEST ? AnalyzerErrorKind::InvalidRequest
                                                              : AnalyzerErrorKind::ServerError;
    return MakeFailure(kind, message, response.statusCode);
}

} // namespace Net
} // namespace GeoHex

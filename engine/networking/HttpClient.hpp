#pragma once

#include <string>
#include <unordered_map>

namespace GeoHex {
namespace Net {

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * @brief HTTP response
 *
 * statusCode stays 0 and error is set when the transport failed.
 * Header names are lower-cased.
 */
struct HttpResponse {
    int statusCode = 0;
    std::string body;
    HttpHeaders headers;
    std::string error;
    size_t downloadSize = 0;
    double downloadTime = 0.0;

    bool IsSuccess() const { return statusCode >= 200 && statusCode < 300; }
    bool IsTransportError() const { return statusCode == 0; }
};

/**
 * @brief HTTP client interface
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform GET request
     */
    virtual HttpResponse Get(const std::string& url,
                             const HttpHeaders& headers = {}) = 0;

    /**
     * @brief Perform POST request
     */
    virtual HttpResponse Post(const std::string& url,
                              const std::string& body,
                              const std::string& contentType = "application/json",
                              const HttpHeaders& headers = {}) = 0;

    virtual void SetTimeout(int timeoutSeconds) = 0;

    virtual void SetUserAgent(const std::string& userAgent) = 0;
};

/**
 * @brief libcurl-based HTTP client
 */
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse Get(const std::string& url,
                     const HttpHeaders& headers = {}) override;

    HttpResponse Post(const std::string& url,
                      const std::string& body,
                      const std::string& contentType = "application/json",
                      const HttpHeaders& headers = {}) override;

    void SetTimeout(int timeoutSeconds) override { m_timeout = timeoutSeconds; }
    void SetUserAgent(const std::string& userAgent) override { m_userAgent = userAgent; }

private:
    HttpResponse Perform(const std::string& url,
                         const std::string* body,
                         const HttpHeaders& headers);

    int m_timeout = 30;
    std::string m_userAgent = "GeoHex-Dashboard/1.0";
};

} // namespace Net
} // namespace GeoHex

#include "HttpClient.hpp"
#include "core/Logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace GeoHex {
namespace Net {

namespace {

constexpr long CONNECT_TIMEOUT_SECONDS = 10;

// libcurl global state lives for the whole process once any client exists
void EnsureCurlGlobalInit() {
    struct CurlGlobal {
        CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
        ~CurlGlobal() { curl_global_cleanup(); }
    };
    static CurlGlobal global;
}

struct EasyHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

// "Name: value\r\n" -> {"name", "value"}; status lines and blanks yield nothing
std::optional<std::pair<std::string, std::string>> ParseHeaderLine(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }

    std::string name(Trim(line.substr(0, colon)));
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::make_pair(std::move(name), std::string(Trim(line.substr(colon + 1))));
}

size_t AppendBody(char* data, size_t size, size_t count, void* userdata) {
    const size_t bytes = size * count;
    static_cast<std::string*>(userdata)->append(data, bytes);
    return bytes;
}

size_t CollectHeader(char* data, size_t size, size_t count, void* userdata) {
    const size_t bytes = size * count;
    if (auto header = ParseHeaderLine(std::string_view(data, bytes))) {
        (*static_cast<HttpHeaders*>(userdata))[header->first] = std::move(header->second);
    }
    return bytes;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
    EnsureCurlGlobalInit();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::Get(const std::string& url, const HttpHeaders& headers) {
    return Perform(url, nullptr, headers);
}

HttpResponse CurlHttpClient::Post(const std::string& url,
                                  const std::string& body,
                                  const std::string& contentType,
                                  const HttpHeaders& headers) {
    HttpHeaders requestHeaders = headers;
    requestHeaders["Content-Type"] = contentType;
    return Perform(url, &body, requestHeaders);
}

HttpResponse CurlHttpClient::Perform(const std::string& url,
                                     const std::string* body,
                                     const HttpHeaders& headers) {
    const char* method = body ? "POST" : "GET";
    HttpResponse response;

    EasyHandle handle(curl_easy_init());
    if (!handle) {
        response.error = "curl_easy_init failed";
        GEOHEX_LOG_ERROR("[HTTP] {} {}: {}", method, url, response.error);
        return response;
    }
    CURL* curl = handle.get();

    HeaderList requestHeaders;
    for (const auto& [name, value] : headers) {
        const std::string line = name + ": " + value;
        curl_slist* extended = curl_slist_append(requestHeaders.get(), line.c_str());
        if (!extended) {
            response.error = "out of memory building request headers";
            GEOHEX_LOG_ERROR("[HTTP] {} {}: {}", method, url, response.error);
            return response;
        }
        requestHeaders.release();
        requestHeaders.reset(extended);
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, m_userAgent.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_timeout));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(CONNECT_TIMEOUT_SECONDS, static_cast<long>(m_timeout)));
    // Requests run on worker threads; signals must stay out of timeouts
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, CollectHeader);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    if (requestHeaders) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, requestHeaders.get());
    }
    if (body) {
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    }

    const auto started = std::chrono::steady_clock::now();
    const CURLcode code = curl_easy_perform(curl);
    response.downloadTime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    if (code != CURLE_OK) {
        response.error = curl_easy_strerror(code);
        GEOHEX_LOG_WARN("[HTTP] {} {} failed after {:.3f}s: {}", method, url, response.downloadTime,
                        response.error);
        return response;
    }

    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.statusCode = static_cast<int>(status);
    response.downloadSize = response.body.size();
    GEOHEX_LOG_DEBUG("[HTTP] {} {} -> {} ({} bytes, {:.3f}s)", method, url, response.statusCode,
                     response.downloadSize, response.downloadTime);
    return response;
}

} // namespace Net
} // namespace GeoHex

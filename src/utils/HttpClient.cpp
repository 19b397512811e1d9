/**
 * HttpClient.cpp
 *
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

namespace craftkit::utils {

// -- CurlGlobalInit --

bool CurlGlobalInit::s_initialized = false;

void CurlGlobalInit::init() {
    if (!s_initialized) {
        curl_global_init(CURL_GLOBAL_ALL);
        s_initialized = true;
    }
}

// -- HttpClient --

HttpClient::HttpClient() {
    CurlGlobalInit::init();
}

HttpClient::HttpClient(HttpOptions defaults) : m_defaults(std::move(defaults)) {
    CurlGlobalInit::init();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    return performRequest("GET", url, "", options);
}

HttpResponse HttpClient::postForm(const std::string& url, const FormFields& form, const HttpOptions& options) {
    HttpOptions opts = options;
    opts.headers["Content-Type"] = "application/x-www-form-urlencoded";
    return performRequest("POST", url, buildQueryString(form), opts);
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& json, const HttpOptions& options) {
    HttpOptions opts = options;
    opts.headers["Content-Type"] = "application/json";
    return performRequest("POST", url, json, opts);
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result(output ? output : "");
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string HttpClient::urlDecode(const std::string& str) {
    // Form encoding uses '+' for spaces; curl only handles %XX
    std::string plusDecoded = str;
    for (char& c : plusDecoded) {
        if (c == '+') c = ' ';
    }

    CURL* curl = curl_easy_init();
    if (!curl) return plusDecoded;
    int outLen = 0;
    char* output = curl_easy_unescape(curl, plusDecoded.c_str(),
                                      static_cast<int>(plusDecoded.size()), &outLen);
    std::string result(output ? std::string(output, outLen) : plusDecoded);
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string HttpClient::buildQueryString(const FormFields& params) {
    std::string result;
    for (const auto& [key, value] : params) {
        if (!result.empty()) result += "&";
        result += urlEncode(key) + "=" + urlEncode(value);
    }
    return result;
}

std::map<std::string, std::string> HttpClient::parseQueryString(const std::string& query) {
    std::map<std::string, std::string> params;

    std::string q = query;
    if (!q.empty() && q.front() == '?') q.erase(0, 1);

    size_t start = 0;
    while (start <= q.size()) {
        size_t end = q.find('&', start);
        if (end == std::string::npos) end = q.size();

        std::string pair = q.substr(start, end - start);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = urlDecode(pair.substr(0, eq));
            std::string value = eq == std::string::npos ? "" : urlDecode(pair.substr(eq + 1));
            // First occurrence wins
            params.emplace(std::move(key), std::move(value));
        }
        start = end + 1;
    }

    return params;
}

HttpResponse HttpClient::performRequest(const std::string& method, const std::string& url,
                                        const std::string& body, const HttpOptions& options) {
    HttpResponse result;

    try {
        cpr::Header headers;
        for (const auto& [key, value] : m_defaults.headers) headers[key] = value;
        for (const auto& [key, value] : options.headers) headers[key] = value;

        std::string ua = options.userAgent.empty() ? m_defaults.userAgent : options.userAgent;
        if (ua.empty()) ua = "Craftkit/1.0";

        int timeout = options.timeoutSeconds > 0 ? options.timeoutSeconds : m_defaults.timeoutSeconds;
        if (timeout <= 0) timeout = 30;

        cpr::Response response;

        if (method == "GET") {
            response = cpr::Get(cpr::Url{url}, headers, cpr::Timeout{timeout * 1000}, cpr::UserAgent{ua});
        } else if (method == "POST") {
            response = cpr::Post(cpr::Url{url}, headers, cpr::Body{body}, cpr::Timeout{timeout * 1000}, cpr::UserAgent{ua});
        } else {
            result.error = "Unsupported method: " + method;
            return result;
        }

        result.statusCode = static_cast<int>(response.status_code);
        result.body = response.text;
        result.error = response.error.message;
        for (const auto& [key, value] : response.header) result.headers[key] = value;

    } catch (const std::exception& e) {
        result.statusCode = 0;
        result.error = e.what();
    }

    return result;
}

} // namespace craftkit::utils

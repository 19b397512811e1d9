// Craftkit - HTTP Client
// Blocking HTTP client over cpr/libcurl

#pragma once

#include <string>
#include <map>
#include <vector>
#include <utility>

namespace craftkit::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::map<std::string, std::string> headers;
    std::string error;

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    bool isUnauthorized() const { return statusCode == 401; }
    bool isServerError() const { return statusCode >= 500; }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutSeconds{30};
    std::string userAgent{"Craftkit/1.0"};
};

/**
 * @brief Ordered url-encoded form fields
 */
using FormFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Transport seam used by the token exchanges
 *
 * A status of 0 in the returned response means the request never got an
 * HTTP answer; `error` then holds the transport message.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResponse postForm(const std::string& url, const FormFields& form,
                                  const HttpOptions& options = {}) = 0;
    virtual HttpResponse postJson(const std::string& url, const std::string& json,
                                  const HttpOptions& options = {}) = 0;
};

/**
 * @brief cpr-backed transport
 */
class HttpClient : public HttpTransport {
public:
    HttpClient();
    explicit HttpClient(HttpOptions defaults);
    ~HttpClient() override;

    // Disable copy
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url, const HttpOptions& options = {});
    HttpResponse postForm(const std::string& url, const FormFields& form,
                          const HttpOptions& options = {}) override;
    HttpResponse postJson(const std::string& url, const std::string& json,
                          const HttpOptions& options = {}) override;

    // URL utilities
    static std::string urlEncode(const std::string& str);
    static std::string urlDecode(const std::string& str);
    static std::string buildQueryString(const FormFields& params);
    static std::map<std::string, std::string> parseQueryString(const std::string& query);

private:
    HttpResponse performRequest(const std::string& method, const std::string& url,
                                const std::string& body, const HttpOptions& options);

    HttpOptions m_defaults;
};

/**
 * @brief Global CURL initialization
 */
class CurlGlobalInit {
public:
    static void init();

private:
    static bool s_initialized;
};

} // namespace craftkit::utils

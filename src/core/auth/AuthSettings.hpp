#pragma once

/**
 * AuthSettings.hpp
 *
 * Parameters of one Microsoft login, read from Config.
 */

#include "../Config.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <string>

namespace craftkit::core::auth {

struct AuthSettings {
    std::string clientId;
    std::string redirectUri{"http://127.0.0.1:8080/callback"};
    std::string cacheFile{"msa-auth.json"};
    std::chrono::seconds loginTimeout{300};
    utils::HttpOptions http;

    static AuthSettings fromConfig(const Config& config) {
        AuthSettings settings;
        settings.clientId = config.get<std::string>("auth.clientId", "");
        settings.redirectUri = config.get<std::string>("auth.redirectUri", settings.redirectUri);
        settings.cacheFile = config.get<std::string>("auth.cacheFile", settings.cacheFile);
        settings.loginTimeout = std::chrono::seconds(config.get<int>("auth.loginTimeoutSeconds", 300));
        settings.http.timeoutSeconds = config.get<int>("http.timeoutSeconds", 30);
        settings.http.userAgent = config.get<std::string>("http.userAgent", settings.http.userAgent);
        return settings;
    }
};

} // namespace craftkit::core::auth

#pragma once

/**
 * MinecraftTokenExchange.hpp
 *
 * Last hop: trades the XSTS identity for a Minecraft services bearer token.
 */

#include "AuthModels.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>
#include <string>

namespace craftkit::core::auth {

class MinecraftTokenExchange {
public:
    static constexpr const char* LOGIN_URL = "https://api.minecraftservices.com/authentication/login_with_xbox";

    explicit MinecraftTokenExchange(utils::HttpTransport& http, utils::HttpOptions options = {})
        : m_http(http), m_options(std::move(options)) {}

    /**
     * @return Bearer token, or nullopt if a success response carries none
     * @throws MinecraftBearerException on a non-success response
     */
    std::optional<std::string> login(const XboxLiveAuthResponse& xboxLiveAuth, const std::string& xstsToken);

    static std::string identityToken(const std::string& userHash, const std::string& xstsToken) {
        return "XBL3.0 x=" + userHash + ";" + xstsToken;
    }

private:
    utils::HttpTransport& m_http;
    utils::HttpOptions m_options;
};

} // namespace craftkit::core::auth

#pragma once

/**
 * XSTSExchange.hpp
 *
 * Exchanges an Xbox Live user token for an XSTS token scoped to
 * Minecraft services.
 */

#include "AuthModels.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>
#include <string>

namespace craftkit::core::auth {

class XSTSExchange {
public:
    static constexpr const char* AUTHORIZE_URL = "https://xsts.auth.xboxlive.com/xsts/authorize";
    static constexpr const char* RELYING_PARTY = "rp://api.minecraftservices.com/";

    explicit XSTSExchange(utils::HttpTransport& http, utils::HttpOptions options = {})
        : m_http(http), m_options(std::move(options)) {}

    /**
     * @return XSTS token, or nullopt if a success response carries none
     * @throws XSTSException on a non-success response
     */
    std::optional<std::string> authorize(const XboxLiveAuthResponse& xboxLiveAuth);

private:
    utils::HttpTransport& m_http;
    utils::HttpOptions m_options;
};

} // namespace craftkit::core::auth

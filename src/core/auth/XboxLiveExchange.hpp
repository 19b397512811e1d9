#pragma once

/**
 * XboxLiveExchange.hpp
 *
 * Exchanges a Microsoft access token for an Xbox Live user token.
 */

#include "AuthModels.hpp"
#include "../../utils/HttpClient.hpp"

#include <optional>

namespace craftkit::core::auth {

class XboxLiveExchange {
public:
    static constexpr const char* AUTHENTICATE_URL = "https://user.auth.xboxlive.com/user/authenticate";
    static constexpr const char* RELYING_PARTY = "http://auth.xboxlive.com";

    explicit XboxLiveExchange(utils::HttpTransport& http, utils::HttpOptions options = {})
        : m_http(http), m_options(std::move(options)) {}

    /**
     * @throws XboxLiveAuthenticationException on a non-success response
     */
    std::optional<XboxLiveAuthResponse> authenticate(const MicrosoftToken& token);

private:
    utils::HttpTransport& m_http;
    utils::HttpOptions m_options;
};

} // namespace craftkit::core::auth

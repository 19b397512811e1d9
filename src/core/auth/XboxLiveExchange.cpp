#include "XboxLiveExchange.hpp"
#include "AuthErrors.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>

namespace craftkit::core::auth {

using json = nlohmann::json;

std::optional<XboxLiveAuthResponse> XboxLiveExchange::authenticate(const MicrosoftToken& token) {
    json requestBody = {
        {"Properties", {
            {"AuthMethod", "RPS"},
            {"SiteName", "user.auth.xboxlive.com"},
            {"RpsTicket", "d=" + token.accessToken}
        }},
        {"RelyingParty", RELYING_PARTY},
        {"TokenType", "JWT"}
    };

    utils::HttpOptions options = m_options;
    options.headers["Accept"] = "application/json";

    LOG_DEBUG("Authenticating with Xbox Live");
    auto response = m_http.postJson(AUTHENTICATE_URL, requestBody.dump(), options);

    if (!response.isSuccess()) {
        LOG_ERROR("Xbox Live authentication failed: HTTP {}", response.statusCode);
        throw XboxLiveAuthenticationException(token, response.statusCode, response.body);
    }

    auto auth = XboxLiveAuthResponse::parse(response.body);
    LOG_INFO("Xbox Live token acquired ({} xui claims)", auth.displayClaims.xui.size());
    return auth;
}

} // namespace craftkit::core::auth

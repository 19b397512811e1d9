#include "XSTSExchange.hpp"
#include "AuthErrors.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>

namespace craftkit::core::auth {

using json = nlohmann::json;

std::optional<std::string> XSTSExchange::authorize(const XboxLiveAuthResponse& xboxLiveAuth) {
    json requestBody = {
        {"Properties", {
            {"SandboxId", "RETAIL"},
            {"UserTokens", json::array({xboxLiveAuth.token})}
        }},
        {"RelyingParty", RELYING_PARTY},
        {"TokenType", "JWT"}
    };

    utils::HttpOptions options = m_options;
    options.headers["Accept"] = "application/json";

    LOG_DEBUG("Requesting XSTS token");
    auto response = m_http.postJson(AUTHORIZE_URL, requestBody.dump(), options);

    if (!response.isSuccess()) {
        XSTSException error(xboxLiveAuth, response.statusCode, response.body);
        if (!error.reason().empty()) {
            LOG_ERROR("XSTS authorization failed: {} (XErr {})", error.reason(), error.xerr());
        } else {
            LOG_ERROR("XSTS authorization failed: HTTP {}", response.statusCode);
        }
        throw error;
    }

    auto body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw TokenFormatException("XSTS: response is not a JSON object");
    }

    auto token = body.find("Token");
    if (token == body.end() || !token->is_string()) {
        LOG_WARN("XSTS response carried no token");
        return std::nullopt;
    }

    LOG_INFO("XSTS token acquired");
    return token->get<std::string>();
}

} // namespace craftkit::core::auth

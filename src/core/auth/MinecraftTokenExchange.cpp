#include "MinecraftTokenExchange.hpp"
#include "AuthErrors.hpp"
#include "../Logger.hpp"

#include <nlohmann/json.hpp>

namespace craftkit::core::auth {

using json = nlohmann::json;

std::optional<std::string> MinecraftTokenExchange::login(const XboxLiveAuthResponse& xboxLiveAuth,
                                                         const std::string& xstsToken) {
    json requestBody = {
        {"identityToken", identityToken(xboxLiveAuth.userHash(), xstsToken)},
        {"ensureLegacyEnabled", true}
    };

    LOG_DEBUG("Logging in to Minecraft services");
    auto response = m_http.postJson(LOGIN_URL, requestBody.dump(), m_options);

    if (!response.isSuccess()) {
        LOG_ERROR("Minecraft login failed: HTTP {}", response.statusCode);
        throw MinecraftBearerException(xstsToken, response.statusCode, response.body);
    }

    auto body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw TokenFormatException("Minecraft login: response is not a JSON object");
    }

    auto token = body.find("access_token");
    if (token == body.end() || !token->is_string()) {
        LOG_WARN("Minecraft login response carried no access_token");
        return std::nullopt;
    }

    LOG_INFO("Minecraft bearer token acquired (length {})", token->get_ref<const std::string&>().size());
    return token->get<std::string>();
}

} // namespace craftkit::core::auth

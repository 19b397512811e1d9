/**
 * AuthModels.cpp
 *
 * Schema parsing for authentication responses.
 */

#include "AuthModels.hpp"
#include "AuthErrors.hpp"

namespace craftkit::core::auth {

using json = nlohmann::json;

namespace {

json parseObject(const std::string& body, const char* what) {
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw TokenFormatException(std::string(what) + ": response is not a JSON object");
    }
    return j;
}

std::string requireString(const json& j, const char* key, const char* what) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw TokenFormatException(std::string(what) + ": missing field '" + key + "'");
    }
    return it->get<std::string>();
}

std::string optionalString(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

} // namespace

// -- MicrosoftToken --

json MicrosoftToken::toJson() const {
    return {
        {"token_type", tokenType},
        {"scope", scope},
        {"expires_in", expiresIn},
        {"access_token", accessToken},
        {"refresh_token", refreshToken},
        {"user_id", userId}
    };
}

MicrosoftToken MicrosoftToken::fromJson(const json& j) {
    MicrosoftToken token;
    token.accessToken = requireString(j, "access_token", "Microsoft token");
    token.refreshToken = optionalString(j, "refresh_token");
    token.tokenType = optionalString(j, "token_type");
    token.scope = optionalString(j, "scope");
    token.userId = optionalString(j, "user_id");

    auto it = j.find("expires_in");
    if (it != j.end() && it->is_number_integer()) {
        token.expiresIn = it->get<int>();
    }
    return token;
}

MicrosoftToken MicrosoftToken::parse(const std::string& body) {
    MicrosoftToken token = fromJson(parseObject(body, "Microsoft token"));
    token.raw = body;
    return token;
}

// -- XboxLiveAuthResponse --

const std::string& XboxLiveAuthResponse::userHash() const {
    if (displayClaims.xui.empty()) {
        throw TokenFormatException("Xbox Live response has no xui display claims");
    }
    return displayClaims.xui.front().uhs;
}

XboxLiveAuthResponse XboxLiveAuthResponse::parse(const std::string& body) {
    json j = parseObject(body, "Xbox Live");

    XboxLiveAuthResponse response;
    response.token = requireString(j, "Token", "Xbox Live");
    response.issueInstant = optionalString(j, "IssueInstant");
    response.notAfter = optionalString(j, "NotAfter");

    auto claims = j.find("DisplayClaims");
    if (claims != j.end() && claims->is_object()) {
        auto xui = claims->find("xui");
        if (xui != claims->end() && xui->is_array()) {
            for (const auto& entry : *xui) {
                if (!entry.is_object()) continue;
                response.displayClaims.xui.push_back({optionalString(entry, "uhs")});
            }
        }
    }

    return response;
}

} // namespace craftkit::core::auth

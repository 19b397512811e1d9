#pragma once

/**
 * AuthModels.hpp
 *
 * Typed schemas for the token endpoint, Xbox Live and XSTS responses.
 * Every parser checks its required fields and throws TokenFormatException.
 */

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace craftkit::core::auth {

/**
 * PKCE verifier/challenge pair, regenerated for every login attempt
 */
struct PkcePair {
    std::string codeVerifier;
    std::string codeChallenge;
};

/**
 * Microsoft identity platform token response
 */
struct MicrosoftToken {
    std::string tokenType;
    std::string scope;
    int expiresIn{0};
    std::string accessToken;
    std::string refreshToken;
    std::string userId;

    // Response body exactly as received; this is what gets cached
    std::string raw;

    nlohmann::json toJson() const;
    static MicrosoftToken fromJson(const nlohmann::json& j);
    static MicrosoftToken parse(const std::string& body);
};

struct XuiClaim {
    std::string uhs;
};

struct DisplayClaims {
    std::vector<XuiClaim> xui;
};

/**
 * Xbox Live user.authenticate response
 */
struct XboxLiveAuthResponse {
    std::string issueInstant;
    std::string notAfter;
    std::string token;
    DisplayClaims displayClaims;

    // UHS of the first xui claim; throws if there is none
    const std::string& userHash() const;

    static XboxLiveAuthResponse parse(const std::string& body);
};

} // namespace craftkit::core::auth

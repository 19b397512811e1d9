#pragma once

/**
 * MicrosoftTokenExchange.hpp
 *
 * First hop of the chain: obtains a Microsoft OAuth token, either silently
 * from the cached refresh token or through the browser with PKCE.
 */

#include "AuthModels.hpp"
#include "AuthSettings.hpp"
#include "RedirectCapture.hpp"
#include "TokenCache.hpp"
#include "../../utils/HttpClient.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace craftkit::core::auth {

class MicrosoftTokenExchange {
public:
    static constexpr const char* AUTHORIZE_URL = "https://login.live.com/oauth20_authorize.srf";
    static constexpr const char* TOKEN_URL = "https://login.live.com/oauth20_token.srf";
    static constexpr const char* SCOPE = "XboxLive.signin offline_access";
    static constexpr const char* COBRAND_ID = "8058f65d-ce06-4c30-9559-473c9275a65d";

    MicrosoftTokenExchange(utils::HttpTransport& http,
                           BrowserLauncher& browser,
                           RedirectListener& listener,
                           AuthSettings settings);

    /**
     * Get a Microsoft token, refreshing the cached one when possible
     * and falling back to interactive login otherwise.
     * @throws MicrosoftAuthenticationException if the code exchange is rejected
     * @throws NoAuthorizationCodeException if the browser flow yields no code
     */
    std::optional<MicrosoftToken> acquire(const CancellationToken& cancel = {});

    /**
     * Redeem the cached refresh token
     * @return nullopt when nothing is cached or the endpoint refuses
     */
    std::optional<MicrosoftToken> refresh();

    std::string authorizeUrl(const PkcePair& pkce) const;

    const TokenCache& cache() const { return m_cache; }

    void setPollInterval(std::chrono::milliseconds interval) { m_pollInterval = interval; }

private:
    std::string requestAuthorizationCode(const PkcePair& pkce, const CancellationToken& cancel);
    MicrosoftToken redeemAuthorizationCode(const std::string& code, const PkcePair& pkce);

    utils::HttpTransport& m_http;
    BrowserLauncher& m_browser;
    RedirectListener& m_listener;
    AuthSettings m_settings;
    TokenCache m_cache;
    std::chrono::milliseconds m_pollInterval{100};
};

} // namespace craftkit::core::auth

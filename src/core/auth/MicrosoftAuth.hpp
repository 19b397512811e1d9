#pragma once

/**
 * MicrosoftAuth.hpp
 *
 * Microsoft OAuth2 authentication flow for Minecraft accounts.
 */

#include "AuthSettings.hpp"
#include "MicrosoftTokenExchange.hpp"
#include "MinecraftTokenExchange.hpp"
#include "RedirectCapture.hpp"
#include "XSTSExchange.hpp"
#include "XboxLiveExchange.hpp"
#include "../../utils/HttpClient.hpp"

#include <atomic>
#include <functional>
#include <future>
#include <optional>
#include <string>

namespace craftkit::core::auth {

/**
 * Progress callback: status text and completion fraction in [0, 1]
 */
using AuthProgressCallback = std::function<void(const std::string& status, float progress)>;

/**
 * MicrosoftAuth - Microsoft account to Minecraft bearer token
 *
 * Authentication flow:
 * 1. Microsoft OAuth token (cached refresh token, else browser + PKCE)
 * 2. Xbox Live user token
 * 3. XSTS token for the Minecraft relying party
 * 4. Minecraft services bearer token
 *
 * Each step needs the previous result, so they run strictly in order.
 * A stage that yields nothing ends the chain with nullopt; a stage that is
 * refused throws its typed exception. Nothing is retried.
 */
class MicrosoftAuth {
public:
    /**
     * @param http Transport for every exchange; the caller scopes its lifetime
     * @param browser Opens the authorize URL
     * @param listener Captures the redirect back to settings.redirectUri
     */
    MicrosoftAuth(utils::HttpTransport& http,
                  BrowserLauncher& browser,
                  RedirectListener& listener,
                  AuthSettings settings);

    ~MicrosoftAuth();

    MicrosoftAuth(const MicrosoftAuth&) = delete;
    MicrosoftAuth& operator=(const MicrosoftAuth&) = delete;

    /**
     * Run the whole chain on the calling thread
     * @param cancel Cancels a pending browser login
     * @return Minecraft bearer token, or nullopt if a stage produced nothing
     */
    std::optional<std::string> getMinecraftBearerAccessToken(const CancellationToken& cancel = {});

    /**
     * Run the chain on a worker thread. Stage exceptions surface from get().
     * @param onProgress Progress callback
     */
    std::future<std::optional<std::string>> authenticateAsync(AuthProgressCallback onProgress = nullptr);

    /**
     * Cancel the login started by authenticateAsync
     */
    void cancelAuthentication();

    bool isAuthenticating() const { return m_authenticating; }

    MicrosoftTokenExchange& microsoftExchange() { return m_microsoft; }

private:
    std::optional<std::string> runChain(const CancellationToken& cancel, const AuthProgressCallback& onProgress);

    MicrosoftTokenExchange m_microsoft;
    XboxLiveExchange m_xboxLive;
    XSTSExchange m_xsts;
    MinecraftTokenExchange m_minecraft;

    std::atomic<bool> m_authenticating{false};
    CancellationToken m_cancel;
};

} // namespace craftkit::core::auth

/**
 * MicrosoftAuth.cpp
 *
 * Implementation of the Microsoft -> Xbox Live -> XSTS -> Minecraft chain.
 */

#include "MicrosoftAuth.hpp"
#include "../Logger.hpp"

namespace craftkit::core::auth {

namespace {

// Clears the in-progress flag however the chain exits
class AuthenticatingScope {
public:
    explicit AuthenticatingScope(std::atomic<bool>& flag) : m_flag(flag) { m_flag = true; }
    ~AuthenticatingScope() { m_flag = false; }

private:
    std::atomic<bool>& m_flag;
};

} // namespace

MicrosoftAuth::MicrosoftAuth(utils::HttpTransport& http,
                             BrowserLauncher& browser,
                             RedirectListener& listener,
                             AuthSettings settings)
    : m_microsoft(http, browser, listener, settings)
    , m_xboxLive(http, settings.http)
    , m_xsts(http, settings.http)
    , m_minecraft(http, settings.http) {}

MicrosoftAuth::~MicrosoftAuth() {
    cancelAuthentication();
}

std::optional<std::string> MicrosoftAuth::getMinecraftBearerAccessToken(const CancellationToken& cancel) {
    AuthenticatingScope scope(m_authenticating);
    return runChain(cancel, nullptr);
}

std::future<std::optional<std::string>> MicrosoftAuth::authenticateAsync(AuthProgressCallback onProgress) {
    m_cancel.reset();
    return std::async(std::launch::async, [this, onProgress]() -> std::optional<std::string> {
        AuthenticatingScope scope(m_authenticating);
        try {
            return runChain(m_cancel, onProgress);
        } catch (const std::exception& e) {
            LOG_ERROR("Authentication error: {}", e.what());
            throw;
        }
    });
}

void MicrosoftAuth::cancelAuthentication() {
    m_cancel.cancel();
}

std::optional<std::string> MicrosoftAuth::runChain(const CancellationToken& cancel,
                                                   const AuthProgressCallback& onProgress) {
    // Step 1: Microsoft token
    if (onProgress) onProgress("Signing in with Microsoft...", 0.0f);
    auto microsoftToken = m_microsoft.acquire(cancel);
    if (!microsoftToken) {
        return std::nullopt;
    }

    // Step 2: Xbox Live
    if (onProgress) onProgress("Authenticating with Xbox Live...", 0.4f);
    auto xboxLiveAuth = m_xboxLive.authenticate(*microsoftToken);
    if (!xboxLiveAuth) {
        return std::nullopt;
    }

    // Step 3: XSTS
    if (onProgress) onProgress("Getting XSTS token...", 0.6f);
    auto xstsToken = m_xsts.authorize(*xboxLiveAuth);
    if (!xstsToken) {
        return std::nullopt;
    }

    // Step 4: Minecraft
    if (onProgress) onProgress("Authenticating with Minecraft...", 0.8f);
    auto bearer = m_minecraft.login(*xboxLiveAuth, *xstsToken);
    if (!bearer) {
        return std::nullopt;
    }

    if (onProgress) onProgress("Authentication complete!", 1.0f);
    return bearer;
}

} // namespace craftkit::core::auth

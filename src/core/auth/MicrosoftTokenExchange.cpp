/**
 * MicrosoftTokenExchange.cpp
 */

#include "MicrosoftTokenExchange.hpp"
#include "AuthErrors.hpp"
#include "Pkce.hpp"
#include "../Logger.hpp"

namespace craftkit::core::auth {

using utils::HttpClient;

namespace {

// Stops the listener on every exit path
class ListenerGuard {
public:
    explicit ListenerGuard(RedirectListener& listener) : m_listener(listener) {}
    ~ListenerGuard() { m_listener.stop(); }

    ListenerGuard(const ListenerGuard&) = delete;
    ListenerGuard& operator=(const ListenerGuard&) = delete;

private:
    RedirectListener& m_listener;
};

} // namespace

MicrosoftTokenExchange::MicrosoftTokenExchange(utils::HttpTransport& http,
                                               BrowserLauncher& browser,
                                               RedirectListener& listener,
                                               AuthSettings settings)
    : m_http(http)
    , m_browser(browser)
    , m_listener(listener)
    , m_settings(std::move(settings))
    , m_cache(m_settings.cacheFile) {}

std::optional<MicrosoftToken> MicrosoftTokenExchange::acquire(const CancellationToken& cancel) {
    PkcePair pkce = Pkce::generate();

    if (m_cache.exists()) {
        try {
            auto token = refresh();
            if (token) {
                return token;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Cached Microsoft token unusable, falling back to browser login: {}", e.what());
        }
    }

    std::string code = requestAuthorizationCode(pkce, cancel);
    return redeemAuthorizationCode(code, pkce);
}

std::optional<MicrosoftToken> MicrosoftTokenExchange::refresh() {
    auto cached = m_cache.load();
    if (!cached) {
        return std::nullopt;
    }
    if (cached->refreshToken.empty()) {
        LOG_WARN("Cached Microsoft token has no refresh token");
        return std::nullopt;
    }

    LOG_DEBUG("Refreshing Microsoft token");
    auto response = m_http.postForm(TOKEN_URL, {
        {"client_id", m_settings.clientId},
        {"refresh_token", cached->refreshToken},
        {"grant_type", "refresh_token"},
        {"redirect_uri", m_settings.redirectUri}
    }, m_settings.http);

    if (!response.isSuccess()) {
        LOG_WARN("Microsoft token refresh rejected: HTTP {}", response.statusCode);
        return std::nullopt;
    }

    MicrosoftToken token = MicrosoftToken::parse(response.body);
    m_cache.store(token);
    LOG_INFO("Microsoft token refreshed (access token length {})", token.accessToken.size());
    return token;
}

std::string MicrosoftTokenExchange::authorizeUrl(const PkcePair& pkce) const {
    return std::string(AUTHORIZE_URL) + "?" + HttpClient::buildQueryString({
        {"client_id", m_settings.clientId},
        {"response_type", "code"},
        {"redirect_uri", m_settings.redirectUri},
        {"scope", SCOPE},
        {"state", "NOT_NEEDED"},
        {"cobrandid", COBRAND_ID},
        {"prompt", "select_account"},
        {"code_challenge", pkce.codeChallenge},
        {"code_challenge_method", "S256"}
    });
}

std::string MicrosoftTokenExchange::requestAuthorizationCode(const PkcePair& pkce,
                                                             const CancellationToken& cancel) {
    auto future = m_listener.start(m_settings.redirectUri);
    ListenerGuard guard(m_listener);

    if (!m_browser.open(authorizeUrl(pkce))) {
        throw NoAuthorizationCodeException(NoAuthorizationCodeException::Reason::BrowserLaunchFailed);
    }

    LOG_INFO("Waiting for the Microsoft sign-in redirect on {}", m_settings.redirectUri);

    const bool bounded = m_settings.loginTimeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + m_settings.loginTimeout;

    while (future.wait_for(m_pollInterval) != std::future_status::ready) {
        if (cancel.isCancelled()) {
            throw NoAuthorizationCodeException(NoAuthorizationCodeException::Reason::Cancelled);
        }
        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            throw NoAuthorizationCodeException(NoAuthorizationCodeException::Reason::TimedOut,
                                               std::to_string(m_settings.loginTimeout.count()) + "s");
        }
    }

    std::optional<std::string> query = future.get();
    if (!query || query->empty()) {
        throw NoAuthorizationCodeException(NoAuthorizationCodeException::Reason::NoQueryString);
    }

    auto params = HttpClient::parseQueryString(*query);
    auto code = params.find("code");
    if (code == params.end() || code->second.empty()) {
        std::string detail;
        if (auto it = params.find("error_description"); it != params.end()) detail = it->second;
        else if (auto it2 = params.find("error"); it2 != params.end()) detail = it2->second;
        throw NoAuthorizationCodeException(NoAuthorizationCodeException::Reason::MissingCode, detail);
    }

    LOG_DEBUG("Received authorization code");
    return code->second;
}

MicrosoftToken MicrosoftTokenExchange::redeemAuthorizationCode(const std::string& code, const PkcePair& pkce) {
    auto response = m_http.postForm(TOKEN_URL, {
        {"client_id", m_settings.clientId},
        {"code", code},
        {"code_verifier", pkce.codeVerifier},
        {"grant_type", "authorization_code"},
        {"redirect_uri", m_settings.redirectUri}
    }, m_settings.http);

    if (!response.isSuccess()) {
        LOG_ERROR("Microsoft token exchange failed: HTTP {}", response.statusCode);
        throw MicrosoftAuthenticationException(m_settings.clientId, code,
                                               response.statusCode, response.body);
    }

    MicrosoftToken token = MicrosoftToken::parse(response.body);
    m_cache.store(token);
    LOG_INFO("Microsoft sign-in complete (access token length {})", token.accessToken.size());
    return token;
}

} // namespace craftkit::core::auth

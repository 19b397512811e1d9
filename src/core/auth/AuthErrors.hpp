#pragma once

/**
 * AuthErrors.hpp
 *
 * Error types raised by the authentication chain. Each stage error carries
 * the payload handed to that stage and the raw body of the failed response.
 */

#include "AuthModels.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace craftkit::core::auth {

/**
 * A response or cache body did not match its schema
 */
class TokenFormatException : public std::runtime_error {
public:
    explicit TokenFormatException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Base for every stage failure
 */
class AuthenticationException : public std::runtime_error {
public:
    AuthenticationException(const std::string& message, int statusCode, std::string responseBody)
        : std::runtime_error(message + " (HTTP " + std::to_string(statusCode) + ")\nResponse Body:\n" + responseBody)
        , m_statusCode(statusCode)
        , m_responseBody(std::move(responseBody)) {}

    int statusCode() const { return m_statusCode; }
    const std::string& responseBody() const { return m_responseBody; }

private:
    int m_statusCode;
    std::string m_responseBody;
};

/**
 * Authorization code exchange rejected by the token endpoint
 */
class MicrosoftAuthenticationException : public AuthenticationException {
public:
    MicrosoftAuthenticationException(std::string clientId, std::string code,
                                     int statusCode, std::string responseBody)
        : AuthenticationException("Unable to get the Microsoft access token for client '" + clientId + "'",
                                  statusCode, std::move(responseBody))
        , m_clientId(std::move(clientId))
        , m_code(std::move(code)) {}

    const std::string& clientId() const { return m_clientId; }
    const std::string& code() const { return m_code; }

private:
    std::string m_clientId;
    std::string m_code;
};

/**
 * Xbox Live user.authenticate rejected the Microsoft token
 */
class XboxLiveAuthenticationException : public AuthenticationException {
public:
    XboxLiveAuthenticationException(MicrosoftToken token, int statusCode, std::string responseBody)
        : AuthenticationException("Unable to authenticate with Xbox Live", statusCode, std::move(responseBody))
        , m_token(std::move(token)) {}

    const MicrosoftToken& microsoftToken() const { return m_token; }

private:
    MicrosoftToken m_token;
};

/**
 * XSTS authorize refused the Xbox Live token
 */
class XSTSException : public AuthenticationException {
public:
    XSTSException(XboxLiveAuthResponse auth, int statusCode, std::string responseBody);

    const XboxLiveAuthResponse& xboxLiveAuth() const { return m_auth; }

    // XErr from the response body, 0 when absent
    uint64_t xerr() const { return m_xerr; }

    // Human-readable reason for known XErr codes, empty otherwise
    const std::string& reason() const { return m_reason; }

    static std::string describeXErr(uint64_t xerr);

private:
    XboxLiveAuthResponse m_auth;
    uint64_t m_xerr{0};
    std::string m_reason;
};

/**
 * login_with_xbox rejected the XSTS identity
 */
class MinecraftBearerException : public AuthenticationException {
public:
    MinecraftBearerException(std::string xstsToken, int statusCode, std::string responseBody)
        : AuthenticationException("Unable to get the Minecraft bearer token", statusCode, std::move(responseBody))
        , m_xstsToken(std::move(xstsToken)) {}

    const std::string& xstsToken() const { return m_xstsToken; }

private:
    std::string m_xstsToken;
};

/**
 * The browser round-trip produced no authorization code
 */
class NoAuthorizationCodeException : public std::runtime_error {
public:
    enum class Reason {
        NoQueryString,
        MissingCode,
        TimedOut,
        Cancelled,
        BrowserLaunchFailed
    };

    NoAuthorizationCodeException(Reason reason, const std::string& detail = "")
        : std::runtime_error(describe(reason) + (detail.empty() ? "" : ": " + detail))
        , m_reason(reason) {}

    Reason reason() const { return m_reason; }

    static std::string describe(Reason reason) {
        switch (reason) {
            case Reason::NoQueryString:       return "Redirect carried no query string";
            case Reason::MissingCode:         return "Redirect carried no authorization code";
            case Reason::TimedOut:            return "Timed out waiting for the browser redirect";
            case Reason::Cancelled:           return "Login cancelled";
            case Reason::BrowserLaunchFailed: return "Could not open the system browser";
        }
        return "No authorization code";
    }

private:
    Reason m_reason;
};

} // namespace craftkit::core::auth

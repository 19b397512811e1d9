#include "core/auth/AuthErrors.hpp"
#include "core/auth/MicrosoftTokenExchange.hpp"
#include "core/auth/Pkce.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

using namespace craftkit::core::auth;
using craftkit::test::FakeBrowser;
using craftkit::test::FakeListener;
using craftkit::test::FakeTransport;
using craftkit::test::TempDir;
using craftkit::test::readFile;
using craftkit::test::writeFile;
using craftkit::utils::HttpClient;

namespace {

const std::string TOKEN_BODY =
    R"({"token_type":"bearer","scope":"XboxLive.signin offline_access","expires_in":3600,)"
    R"("access_token":"ms-access","refresh_token":"ms-refresh","user_id":"u1"})";

class MicrosoftExchangeTest : public ::testing::Test {
protected:
    MicrosoftExchangeTest() {
        settings.clientId = "client-123";
        settings.cacheFile = (dir / "msa-auth.json").string();
    }

    MicrosoftTokenExchange makeExchange() {
        MicrosoftTokenExchange exchange(http, browser, listener, settings);
        exchange.setPollInterval(std::chrono::milliseconds(5));
        return exchange;
    }

    NoAuthorizationCodeException::Reason expectNoCode(const CancellationToken& cancel = {}) {
        auto exchange = makeExchange();
        try {
            exchange.acquire(cancel);
        } catch (const NoAuthorizationCodeException& e) {
            return e.reason();
        }
        ADD_FAILURE() << "acquire() did not throw NoAuthorizationCodeException";
        return NoAuthorizationCodeException::Reason::MissingCode;
    }

    TempDir dir;
    FakeTransport http;
    FakeBrowser browser;
    FakeListener listener;
    AuthSettings settings;
};

} // namespace

TEST_F(MicrosoftExchangeTest, InteractiveLoginRedeemsCodeWithVerifier) {
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 200, TOKEN_BODY);
    auto exchange = makeExchange();

    auto token = exchange.acquire();

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->accessToken, "ms-access");
    EXPECT_EQ(listener.starts, 1);
    EXPECT_GE(listener.stops, 1);
    EXPECT_EQ(listener.lastRedirectUri, settings.redirectUri);
    ASSERT_EQ(browser.opened.size(), 1u);

    auto redeem = http.requestsTo(MicrosoftTokenExchange::TOKEN_URL);
    ASSERT_EQ(redeem.size(), 1u);
    EXPECT_EQ(redeem[0].field("grant_type"), "authorization_code");
    EXPECT_EQ(redeem[0].field("code"), "test-code");
    EXPECT_EQ(redeem[0].field("client_id"), "client-123");
    EXPECT_EQ(redeem[0].field("redirect_uri"), settings.redirectUri);

    // The challenge sent to the browser belongs to the verifier sent to the token endpoint
    auto url = browser.opened[0];
    auto params = HttpClient::parseQueryString(url.substr(url.find('?')));
    EXPECT_EQ(params["code_challenge"], Pkce::computeCodeChallenge(redeem[0].field("code_verifier")));
    EXPECT_EQ(params["code_challenge_method"], "S256");
}

TEST_F(MicrosoftExchangeTest, SuccessfulExchangeOverwritesCacheWithRawBody) {
    writeFile(settings.cacheFile, R"({"access_token":"stale"})");
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 200, TOKEN_BODY);
    auto exchange = makeExchange();

    exchange.acquire();

    EXPECT_EQ(readFile(settings.cacheFile), TOKEN_BODY);
}

TEST_F(MicrosoftExchangeTest, CachedRefreshTokenSkipsBrowser) {
    writeFile(settings.cacheFile, TOKEN_BODY);
    const std::string refreshed = R"({"access_token":"ms-access-2","refresh_token":"ms-refresh-2"})";
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 200, refreshed);
    auto exchange = makeExchange();

    auto token = exchange.acquire();

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(token->accessToken, "ms-access-2");
    EXPECT_TRUE(browser.opened.empty());
    EXPECT_EQ(listener.starts, 0);

    auto requests = http.requestsTo(MicrosoftTokenExchange::TOKEN_URL);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].field("grant_type"), "refresh_token");
    EXPECT_EQ(requests[0].field("refresh_token"), "ms-refresh");
    EXPECT_EQ(readFile(settings.cacheFile), refreshed);
}

TEST_F(MicrosoftExchangeTest, RejectedRefreshFallsBackToOneInteractiveLogin) {
    writeFile(settings.cacheFile, TOKEN_BODY);
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 400, R"({"error":"invalid_grant"})");
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 200, TOKEN_BODY);
    auto exchange = makeExchange();

    auto token = exchange.acquire();

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(browser.opened.size(), 1u);
    EXPECT_EQ(listener.starts, 1);

    auto requests = http.requestsTo(MicrosoftTokenExchange::TOKEN_URL);
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].field("grant_type"), "refresh_token");
    EXPECT_EQ(requests[1].field("grant_type"), "authorization_code");
}

TEST_F(MicrosoftExchangeTest, UnreadableCacheFallsBackToInteractiveLogin) {
    writeFile(settings.cacheFile, "garbage");
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 200, TOKEN_BODY);
    auto exchange = makeExchange();

    auto token = exchange.acquire();

    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(listener.starts, 1);
    EXPECT_EQ(http.callsTo(MicrosoftTokenExchange::TOKEN_URL), 1u);
}

TEST_F(MicrosoftExchangeTest, RefreshWithoutRefreshTokenReturnsNothing) {
    writeFile(settings.cacheFile, R"({"access_token":"at"})");
    auto exchange = makeExchange();

    EXPECT_FALSE(exchange.refresh().has_value());
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(MicrosoftExchangeTest, RejectedCodeExchangeThrows) {
    http.respond(MicrosoftTokenExchange::TOKEN_URL, 400, R"({"error":"invalid_request"})");
    auto exchange = makeExchange();

    try {
        exchange.acquire();
        FAIL() << "expected MicrosoftAuthenticationException";
    } catch (const MicrosoftAuthenticationException& e) {
        EXPECT_EQ(e.statusCode(), 400);
        EXPECT_EQ(e.clientId(), "client-123");
        EXPECT_EQ(e.code(), "test-code");
        EXPECT_EQ(e.responseBody(), R"({"error":"invalid_request"})");
    }
    EXPECT_FALSE(std::filesystem::exists(settings.cacheFile));
}

TEST_F(MicrosoftExchangeTest, RedirectWithoutQueryThrows) {
    listener.query = std::nullopt;
    EXPECT_EQ(expectNoCode(), NoAuthorizationCodeException::Reason::NoQueryString);
    EXPECT_GE(listener.stops, 1);

    listener.query = std::string();
    EXPECT_EQ(expectNoCode(), NoAuthorizationCodeException::Reason::NoQueryString);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(MicrosoftExchangeTest, RedirectWithErrorThrowsMissingCode) {
    listener.query = "error=access_denied&error_description=The+user+declined";
    auto exchange = makeExchange();

    try {
        exchange.acquire();
        FAIL() << "expected NoAuthorizationCodeException";
    } catch (const NoAuthorizationCodeException& e) {
        EXPECT_EQ(e.reason(), NoAuthorizationCodeException::Reason::MissingCode);
        EXPECT_NE(std::string(e.what()).find("The user declined"), std::string::npos);
    }
    EXPECT_GE(listener.stops, 1);
    EXPECT_TRUE(http.requests.empty());
}

TEST_F(MicrosoftExchangeTest, WaitingPastDeadlineTimesOut) {
    listener.pending = true;
    settings.loginTimeout = std::chrono::seconds(1);

    EXPECT_EQ(expectNoCode(), NoAuthorizationCodeException::Reason::TimedOut);
    EXPECT_GE(listener.stops, 1);
}

TEST_F(MicrosoftExchangeTest, CancellationAbortsWait) {
    listener.pending = true;
    CancellationToken cancel;
    cancel.cancel();

    EXPECT_EQ(expectNoCode(cancel), NoAuthorizationCodeException::Reason::Cancelled);
    EXPECT_GE(listener.stops, 1);
}

TEST_F(MicrosoftExchangeTest, BrowserFailureStopsListener) {
    browser.succeed = false;

    EXPECT_EQ(expectNoCode(), NoAuthorizationCodeException::Reason::BrowserLaunchFailed);
    EXPECT_EQ(listener.starts, 1);
    EXPECT_GE(listener.stops, 1);
}

TEST_F(MicrosoftExchangeTest, AuthorizeUrlCarriesRequiredParameters) {
    auto exchange = makeExchange();
    PkcePair pkce{"verifier", "challenge"};

    std::string url = exchange.authorizeUrl(pkce);
    ASSERT_EQ(url.rfind(MicrosoftTokenExchange::AUTHORIZE_URL, 0), 0u);

    auto params = HttpClient::parseQueryString(url.substr(url.find('?')));
    EXPECT_EQ(params["client_id"], "client-123");
    EXPECT_EQ(params["response_type"], "code");
    EXPECT_EQ(params["redirect_uri"], settings.redirectUri);
    EXPECT_EQ(params["scope"], "XboxLive.signin offline_access");
    EXPECT_EQ(params["prompt"], "select_account");
    EXPECT_EQ(params["cobrandid"], MicrosoftTokenExchange::COBRAND_ID);
    EXPECT_EQ(params["code_challenge"], "challenge");
    EXPECT_EQ(params["code_challenge_method"], "S256");
    EXPECT_EQ(params.count("code_verifier"), 0u);
}

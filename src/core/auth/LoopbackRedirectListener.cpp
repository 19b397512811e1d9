/**
 * LoopbackRedirectListener.cpp
 *
 * cpp-httplib server bound to the redirect URI for one request.
 */

#include "LoopbackRedirectListener.hpp"
#include "../Logger.hpp"
#include "../../utils/HttpClient.hpp"

#include <httplib.h>

#include <mutex>
#include <stdexcept>
#include <thread>

namespace craftkit::core::auth {

namespace {

constexpr const char* RESPONSE_PAGE =
    "<!DOCTYPE html><html><head><title>Craftkit</title></head>"
    "<body><h3>Sign-in complete.</h3><p>You can close this window.</p></body></html>";

} // namespace

class LoopbackRedirectListener::Impl {
public:
    std::unique_ptr<httplib::Server> server;
    std::thread thread;
    std::promise<std::optional<std::string>> promise;
    std::atomic<bool> captured{false};
    std::mutex mutex;
};

LoopbackRedirectListener::LoopbackRedirectListener() : m_impl(std::make_unique<Impl>()) {}

LoopbackRedirectListener::~LoopbackRedirectListener() {
    stop();
}

LoopbackRedirectListener::Endpoint LoopbackRedirectListener::parseRedirectUri(const std::string& redirectUri) {
    const std::string scheme = "http://";
    if (redirectUri.compare(0, scheme.size(), scheme) != 0) {
        throw std::invalid_argument("Redirect URI must use http://: " + redirectUri);
    }

    std::string rest = redirectUri.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);

    Endpoint endpoint;
    endpoint.path = slash == std::string::npos ? "/" : rest.substr(slash);
    auto query = endpoint.path.find_first_of("?#");
    if (query != std::string::npos) endpoint.path.erase(query);
    if (endpoint.path.empty()) endpoint.path = "/";

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        endpoint.host = authority.substr(0, colon);
        try {
            endpoint.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid port in redirect URI: " + redirectUri);
        }
    } else {
        endpoint.host = authority;
    }

    if (endpoint.host.empty() || endpoint.port <= 0 || endpoint.port > 65535) {
        throw std::invalid_argument("Invalid redirect URI: " + redirectUri);
    }
    return endpoint;
}

std::future<std::optional<std::string>> LoopbackRedirectListener::start(const std::string& redirectUri) {
    std::lock_guard<std::mutex> lock(m_impl->mutex);

    if (m_impl->server) {
        throw std::logic_error("Redirect listener is already running");
    }

    Endpoint endpoint = parseRedirectUri(redirectUri);

    m_impl->promise = std::promise<std::optional<std::string>>();
    m_impl->captured = false;
    auto future = m_impl->promise.get_future();

    auto server = std::make_unique<httplib::Server>();
    Impl* impl = m_impl.get();
    server->Get(endpoint.path, [impl](const httplib::Request& req, httplib::Response& res) {
        res.set_content(std::string(RESPONSE_PAGE), "text/html");
        if (impl->captured.exchange(true)) {
            return;
        }

        std::optional<std::string> query;
        if (!req.params.empty()) {
            utils::FormFields fields(req.params.begin(), req.params.end());
            query = utils::HttpClient::buildQueryString(fields);
        }
        impl->promise.set_value(std::move(query));
    });

    if (!server->bind_to_port(endpoint.host, endpoint.port)) {
        throw std::runtime_error("Cannot listen on " + endpoint.host + ":" + std::to_string(endpoint.port));
    }

    httplib::Server* raw = server.get();
    m_impl->server = std::move(server);
    m_impl->thread = std::thread([raw]() { raw->listen_after_bind(); });
    // stop() is a no-op until the accept loop runs; do not hand out a listener it could miss
    raw->wait_until_ready();

    LOG_DEBUG("Listening for OAuth redirect on {}:{}{}", endpoint.host, endpoint.port, endpoint.path);
    return future;
}

void LoopbackRedirectListener::stop() {
    std::lock_guard<std::mutex> lock(m_impl->mutex);

    if (!m_impl->server) {
        return;
    }

    m_impl->server->stop();
    if (m_impl->thread.joinable()) {
        m_impl->thread.join();
    }
    m_impl->server.reset();

    LOG_DEBUG("Redirect listener stopped");
}

bool LoopbackRedirectListener::isRunning() const {
    std::lock_guard<std::mutex> lock(m_impl->mutex);
    return m_impl->server != nullptr;
}

} // namespace craftkit::core::auth

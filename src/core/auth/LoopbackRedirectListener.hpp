#pragma once

/**
 * LoopbackRedirectListener.hpp
 *
 * Local HTTP listener that captures the OAuth redirect.
 */

#include "RedirectCapture.hpp"

#include <memory>
#include <string>

namespace craftkit::core::auth {

class LoopbackRedirectListener : public RedirectListener {
public:
    struct Endpoint {
        std::string host;
        int port{80};
        std::string path{"/"};
    };

    LoopbackRedirectListener();
    ~LoopbackRedirectListener() override;

    LoopbackRedirectListener(const LoopbackRedirectListener&) = delete;
    LoopbackRedirectListener& operator=(const LoopbackRedirectListener&) = delete;

    std::future<std::optional<std::string>> start(const std::string& redirectUri) override;
    void stop() override;

    bool isRunning() const;

    /**
     * Split an http:// redirect URI into host, port and path
     * @throws std::invalid_argument for anything that is not plain http
     */
    static Endpoint parseRedirectUri(const std::string& redirectUri);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace craftkit::core::auth

#pragma once

/**
 * RedirectCapture.hpp
 *
 * Collaborators for the interactive half of the OAuth flow: something that
 * opens the authorize URL, and something that waits for the redirect back
 * to redirectUri.
 */

#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace craftkit::core::auth {

/**
 * Shared cancellation flag; copies observe the same state
 */
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }
    void reset() const { m_flag->store(false); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * Opens a URL for the user
 */
class BrowserLauncher {
public:
    virtual ~BrowserLauncher() = default;
    virtual bool open(const std::string& url) = 0;
};

/**
 * Single-shot capture of the OAuth redirect
 */
class RedirectListener {
public:
    virtual ~RedirectListener() = default;

    /**
     * Start listening on redirectUri
     * @return Future holding the query string of the first request,
     *         or nullopt if that request had none
     */
    virtual std::future<std::optional<std::string>> start(const std::string& redirectUri) = 0;

    /**
     * Stop listening. Safe to call more than once.
     */
    virtual void stop() = 0;
};

/**
 * Opens the URL with the desktop's default browser
 */
class SystemBrowserLauncher : public BrowserLauncher {
public:
    bool open(const std::string& url) override;
};

} // namespace craftkit::core::auth

#pragma once

/**
 * TestSupport.hpp
 *
 * Fakes for the auth collaborators and a scratch directory helper.
 */

#include "core/auth/RedirectCapture.hpp"
#include "utils/HttpClient.hpp"
#include "utils/StringUtils.hpp"

#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <string>
#include <vector>

namespace craftkit::test {

/**
 * Per-test scratch directory, removed on destruction
 */
class TempDir {
public:
    TempDir()
        : m_path(std::filesystem::temp_directory_path() /
                 ("craftkit-test-" + utils::StringUtils::generateUUID())) {
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::filesystem::path operator/(const std::string& name) const { return m_path / name; }

private:
    std::filesystem::path m_path;
};

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

/**
 * Transport that replays scripted responses per URL and records requests.
 * An unscripted URL answers with status 0, like a connection failure.
 */
class FakeTransport : public utils::HttpTransport {
public:
    struct Request {
        std::string url;
        utils::FormFields form;
        std::string json;
        utils::HttpOptions options;

        std::string field(const std::string& name) const {
            for (const auto& [key, value] : form) {
                if (key == name) return value;
            }
            return "";
        }
    };

    void respond(const std::string& url, int status, const std::string& body) {
        utils::HttpResponse response;
        response.statusCode = status;
        response.body = body;
        m_scripts[url].push_back(response);
    }

    utils::HttpResponse postForm(const std::string& url, const utils::FormFields& form,
                                 const utils::HttpOptions& options) override {
        requests.push_back({url, form, "", options});
        return next(url);
    }

    utils::HttpResponse postJson(const std::string& url, const std::string& json,
                                 const utils::HttpOptions& options) override {
        requests.push_back({url, {}, json, options});
        return next(url);
    }

    size_t callsTo(const std::string& url) const {
        size_t count = 0;
        for (const auto& request : requests) {
            if (request.url == url) ++count;
        }
        return count;
    }

    std::vector<Request> requestsTo(const std::string& url) const {
        std::vector<Request> matches;
        for (const auto& request : requests) {
            if (request.url == url) matches.push_back(request);
        }
        return matches;
    }

    std::vector<Request> requests;

private:
    utils::HttpResponse next(const std::string& url) {
        auto it = m_scripts.find(url);
        if (it == m_scripts.end() || it->second.empty()) {
            utils::HttpResponse failure;
            failure.error = "No scripted response for " + url;
            return failure;
        }
        utils::HttpResponse response = it->second.front();
        it->second.pop_front();
        return response;
    }

    std::map<std::string, std::deque<utils::HttpResponse>> m_scripts;
};

class FakeBrowser : public core::auth::BrowserLauncher {
public:
    bool open(const std::string& url) override {
        opened.push_back(url);
        return succeed;
    }

    bool succeed{true};
    std::vector<std::string> opened;
};

/**
 * Redirect listener whose capture is scripted up front.
 * With `pending` set the future never becomes ready.
 */
class FakeListener : public core::auth::RedirectListener {
public:
    std::future<std::optional<std::string>> start(const std::string& redirectUri) override {
        ++starts;
        lastRedirectUri = redirectUri;
        m_promise = std::promise<std::optional<std::string>>();
        auto future = m_promise.get_future();
        if (!pending) {
            m_promise.set_value(query);
        }
        return future;
    }

    void stop() override { ++stops; }

    std::optional<std::string> query{"code=test-code&state=NOT_NEEDED"};
    bool pending{false};

    int starts{0};
    int stops{0};
    std::string lastRedirectUri;

private:
    std::promise<std::optional<std::string>> m_promise;
};

} // namespace craftkit::test

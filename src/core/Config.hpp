#pragma once

/**
 * Config.hpp
 *
 * JSON settings document addressed with dotted keys ("auth.clientId").
 */

#include <nlohmann/json.hpp>
#include <string>
#include <fstream>
#include <filesystem>

namespace craftkit::core {

using json = nlohmann::json;

/**
 * Config - built-in defaults overlaid with an optional settings file
 *
 * Not a singleton: build one, load it, then pass it to whatever needs
 * settings (AuthSettings::fromConfig, Logger::initialize, the CLI).
 */
class Config {
public:
    Config() : m_config(defaults()) {}

    static json defaults() {
        return {
            {"auth", {
                {"clientId", ""},
                {"redirectUri", "http://127.0.0.1:8080/callback"},
                {"cacheFile", "msa-auth.json"},
                {"loginTimeoutSeconds", 300}
            }},
            {"http", {
                {"timeoutSeconds", 30},
                {"userAgent", "Craftkit/1.0"}
            }},
            {"instances", {
                {"root", "instances"}
            }},
            {"log", {
                {"level", "info"},
                {"directory", "logs"}
            }}
        };
    }

    /**
     * Merge a settings file over the current values (RFC 7386 merge patch)
     * @return false if the file is missing or is not valid JSON; the
     *         current values are left as they were
     */
    bool load(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }

        json overlay = json::parse(file, nullptr, false);
        if (overlay.is_discarded() || !overlay.is_object()) {
            return false;
        }

        m_config.merge_patch(overlay);
        m_path = path;
        return true;
    }

    /**
     * Write every value, defaults included
     * @param path Destination; the loaded file when empty
     */
    bool save(const std::filesystem::path& path = {}) const {
        const std::filesystem::path target = path.empty() ? m_path : path;
        if (target.empty()) {
            return false;
        }

        std::error_code ec;
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path(), ec);
        }

        std::ofstream file(target, std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }
        file << m_config.dump(4);
        return static_cast<bool>(file);
    }

    /**
     * @return the value at key, or fallback if it is absent or not a T
     */
    template<typename T>
    T get(const std::string& key, const T& fallback = T{}) const {
        const auto ptr = pointer(key);
        if (!m_config.contains(ptr)) {
            return fallback;
        }
        try {
            return m_config.at(ptr).get<T>();
        } catch (const json::type_error&) {
            return fallback;
        }
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        m_config[pointer(key)] = value;
    }

    bool has(const std::string& key) const { return m_config.contains(pointer(key)); }

    void merge(const json& overlay) { m_config.merge_patch(overlay); }

    const json& getAll() const { return m_config; }
    const std::filesystem::path& path() const { return m_path; }

private:
    // "a.b.c" -> "/a/b/c"; '~' and '/' in a segment are escaped per RFC 6901
    static json::json_pointer pointer(const std::string& key) {
        std::string result = "/";
        for (char c : key) {
            switch (c) {
                case '.': result += '/'; break;
                case '~': result += "~0"; break;
                case '/': result += "~1"; break;
                default:  result += c; break;
            }
        }
        return json::json_pointer(result);
    }

    json m_config;
    std::filesystem::path m_path;
};

} // namespace craftkit::core

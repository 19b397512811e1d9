#pragma once

/**
 * TokenCache.hpp
 *
 * Single-record on-disk cache of the last Microsoft token response.
 */

#include "AuthModels.hpp"

#include <filesystem>
#include <optional>

namespace craftkit::core::auth {

class TokenCache {
public:
    explicit TokenCache(std::filesystem::path path);

    /**
     * Read the cached token
     * @return nullopt if no cache file exists
     * @throws TokenFormatException if the file does not hold a token
     */
    std::optional<MicrosoftToken> load() const;

    /**
     * Overwrite the cache with the token's raw response body
     * @throws std::runtime_error on write failure
     */
    void store(const MicrosoftToken& token) const;

    bool exists() const;
    bool remove() const;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // namespace craftkit::core::auth

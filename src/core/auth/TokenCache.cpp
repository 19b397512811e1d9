/**
 * TokenCache.cpp
 */

#include "TokenCache.hpp"
#include "../Logger.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace craftkit::core::auth {

TokenCache::TokenCache(std::filesystem::path path) : m_path(std::move(path)) {}

std::optional<MicrosoftToken> TokenCache::load() const {
    if (!exists()) {
        return std::nullopt;
    }

    std::ifstream file(m_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open token cache: " + m_path.string());
    }

    std::string body((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    LOG_DEBUG("Loaded token cache {} ({} bytes)", m_path.string(), body.size());
    return MicrosoftToken::parse(body);
}

void TokenCache::store(const MicrosoftToken& token) const {
    auto parent = m_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream file(m_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write token cache: " + m_path.string());
    }

    file << (token.raw.empty() ? token.toJson().dump() : token.raw);
    if (!file) {
        throw std::runtime_error("Failed writing token cache: " + m_path.string());
    }

    LOG_DEBUG("Stored token cache {}", m_path.string());
}

bool TokenCache::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(m_path, ec);
}

bool TokenCache::remove() const {
    std::error_code ec;
    return std::filesystem::remove(m_path, ec);
}

} // namespace craftkit::core::auth

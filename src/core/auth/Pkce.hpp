#pragma once

/**
 * Pkce.hpp
 *
 * Proof Key for Code Exchange (RFC 7636), S256 method.
 */

#include "AuthModels.hpp"

#include <string>

namespace craftkit::core::auth {

class Pkce {
public:
    static constexpr size_t VERIFIER_LENGTH = 128;
    static constexpr const char* VERIFIER_ALPHABET =
        "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789-._~";

    /**
     * Generate a fresh verifier and its S256 challenge
     */
    static PkcePair generate();

    static std::string generateCodeVerifier();

    /**
     * base64url(SHA256(verifier)) without padding
     */
    static std::string computeCodeChallenge(const std::string& codeVerifier);
};

} // namespace craftkit::core::auth

#include "Pkce.hpp"
#include "../../utils/HashUtils.hpp"

#include <cstring>

namespace craftkit::core::auth {

using utils::HashUtils;

PkcePair Pkce::generate() {
    PkcePair pair;
    pair.codeVerifier = generateCodeVerifier();
    pair.codeChallenge = computeCodeChallenge(pair.codeVerifier);
    return pair;
}

std::string Pkce::generateCodeVerifier() {
    const size_t alphabetSize = std::strlen(VERIFIER_ALPHABET);
    // Largest multiple of the alphabet size that fits in a byte; bytes above it are redrawn
    const size_t limit = 256 - (256 % alphabetSize);

    std::string verifier;
    verifier.reserve(VERIFIER_LENGTH);

    while (verifier.size() < VERIFIER_LENGTH) {
        for (uint8_t byte : HashUtils::randomBytes(VERIFIER_LENGTH)) {
            if (byte >= limit) continue;
            verifier += VERIFIER_ALPHABET[byte % alphabetSize];
            if (verifier.size() == VERIFIER_LENGTH) break;
        }
    }

    return verifier;
}

std::string Pkce::computeCodeChallenge(const std::string& codeVerifier) {
    return HashUtils::base64UrlEncode(HashUtils::sha256(codeVerifier));
}

} // namespace craftkit::core::auth

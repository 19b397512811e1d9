#include "core/auth/Pkce.hpp"

#include <gtest/gtest.h>

#include <string>

using craftkit::core::auth::Pkce;

TEST(PkceTest, ChallengeMatchesRfc7636Vector) {
    // Appendix B of RFC 7636
    EXPECT_EQ(Pkce::computeCodeChallenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk"),
              "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");
}

TEST(PkceTest, VerifierHasFullLengthAndUnreservedAlphabet) {
    std::string verifier = Pkce::generateCodeVerifier();
    const std::string alphabet = Pkce::VERIFIER_ALPHABET;

    ASSERT_EQ(verifier.size(), Pkce::VERIFIER_LENGTH);
    EXPECT_GE(verifier.size(), 43u);
    EXPECT_LE(verifier.size(), 128u);
    for (char c : verifier) {
        EXPECT_NE(alphabet.find(c), std::string::npos) << "unexpected character '" << c << "'";
    }
}

TEST(PkceTest, GeneratedPairIsConsistentAndFresh) {
    auto first = Pkce::generate();
    auto second = Pkce::generate();

    EXPECT_EQ(first.codeChallenge, Pkce::computeCodeChallenge(first.codeVerifier));
    EXPECT_NE(first.codeVerifier, second.codeVerifier);

    // base64url without padding
    EXPECT_EQ(first.codeChallenge.size(), 43u);
    EXPECT_EQ(first.codeChallenge.find_first_of("+/="), std::string::npos);
}

#include "devauth/core/AssertionSigner.hpp"
#include "devauth/core/Jwt.hpp"
#include "devauth/core/Pkce.hpp"
#include "devauth/crypto/KeyCustodyErrors.hpp"
#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <set>

namespace
{

namespace pkce = devauth::core::pkce;
namespace jwt = devauth::core::jwt;

TEST(PkceTest, ChallengeMatchesRfc7636Example)
{
    EXPECT_EQ(pkce::codeChallenge("dBjftJeZ4CVP-mJ0kzyFoNRd9jVW08FYx3I3L9TiGpZkgM"),
              "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWW2hvHVvOcKs");
}

TEST(PkceTest, VerifierIsUnreservedAndWithinBounds)
{
    const auto verifier{ pkce::newCodeVerifier() };
    const auto view{ devauth::security::asStringView(verifier) };
    EXPECT_EQ(view.size(), pkce::g_verifierLength);
    EXPECT_TRUE(pkce::isValidVerifier(view));
}

TEST(PkceTest, VerifiersAreUnique)
{
    std::set<std::string> seen;
    constexpr int kTrials{ 16 };
    for (int i{}; i < kTrials; ++i)
    {
        seen.emplace(devauth::security::asStringView(pkce::newCodeVerifier()));
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kTrials));
}

TEST(PkceTest, ValidatesVerifierShape)
{
    EXPECT_FALSE(pkce::isValidVerifier(std::string(42, 'a')));
    EXPECT_TRUE(pkce::isValidVerifier(std::string(43, 'a')));
    EXPECT_TRUE(pkce::isValidVerifier(std::string(128, '~')));
    EXPECT_FALSE(pkce::isValidVerifier(std::string(129, 'a')));
    EXPECT_FALSE(pkce::isValidVerifier(std::string(50, 'a') + "+"));
}

TEST(PkceTest, StatesAreUnique)
{
    EXPECT_NE(pkce::newState(), pkce::newState());
}

TEST(JwtTest, DecodesClaimsOfCompactToken)
{
    const auto iat{ devauth::test_utils::makeIat(2'000'000'000) };
    const auto claims{ jwt::decodeClaims(iat) };
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ((*claims)["exp"].get<std::int64_t>(), 2'000'000'000);
    const auto header{ jwt::decodeHeader(iat) };
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ((*header)["alg"], "RS256");
}

TEST(JwtTest, RejectsMalformedTokens)
{
    EXPECT_FALSE(jwt::decodeClaims("").has_value());
    EXPECT_FALSE(jwt::decodeClaims("abc").has_value());
    EXPECT_FALSE(jwt::decodeClaims("a.b").has_value());
    EXPECT_FALSE(jwt::decodeClaims("a.b.c.d").has_value());
    EXPECT_FALSE(jwt::decodeClaims("eyJhIjoxfQ..sig").has_value());
    // Payload is valid base64url but not a JSON object.
    EXPECT_FALSE(jwt::decodeClaims("eyJhIjoxfQ.WzFd.sig").has_value());
}

TEST(JwtTest, ExpiryIsStrict)
{
    const nlohmann::json claims{ { "exp", 100 } };
    EXPECT_TRUE(jwt::isUnexpired(claims, 99));
    EXPECT_FALSE(jwt::isUnexpired(claims, 100));
    EXPECT_FALSE(jwt::isUnexpired(claims, 101));
}

TEST(JwtTest, MissingOrNonNumericExpIsExpired)
{
    EXPECT_FALSE(jwt::isUnexpired(nlohmann::json{ { "sub", "x" } }, 0));
    EXPECT_FALSE(jwt::isUnexpired(nlohmann::json{ { "exp", "later" } }, 0));
}

TEST(JwtTest, SignCompactSignsHeaderDotClaims)
{
    std::string signedInput;
    const auto token{ jwt::signCompact(nlohmann::json{ { "alg", "RS256" } }, nlohmann::json{ { "sub", "c" } },
                                       [&signedInput](std::span<const std::byte> input) {
                                           signedInput.assign(reinterpret_cast<const char*>(input.data()),
                                                              input.size());
                                           return std::vector<std::uint8_t>{ 0x01U, 0x02U };
                                       }) };
    EXPECT_EQ(token, signedInput + ".AQI");
}

class AssertionSignerTest : public ::testing::Test
{
protected:
    devauth::test_utils::FakeKeyCustody m_custody; // NOLINT
};

TEST_F(AssertionSignerTest, BuildsPrivateKeyJwtClaims)
{
    const auto keyId{ m_custody.generateKeyPair() };
    const devauth::core::AssertionSigner signer{ m_custody };
    constexpr std::int64_t kNow{ 1'700'000'000 };

    const auto assertion{ signer.buildClientAssertion("client_abc", "https://srv/oauth2/token", keyId, kNow) };

    const auto header{ jwt::decodeHeader(assertion) };
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ((*header)["alg"], "RS256");
    EXPECT_EQ((*header)["typ"], "JWT");
    EXPECT_EQ((*header)["kid"], keyId);

    const auto claims{ jwt::decodeClaims(assertion) };
    ASSERT_TRUE(claims.has_value());
    EXPECT_EQ((*claims)["iss"], "client_abc");
    EXPECT_EQ((*claims)["sub"], "client_abc");
    EXPECT_EQ((*claims)["aud"], "https://srv/oauth2/token");
    EXPECT_EQ((*claims)["iat"].get<std::int64_t>(), kNow);
    EXPECT_EQ((*claims)["exp"].get<std::int64_t>(), kNow + 60);
    EXPECT_FALSE((*claims)["jti"].get<std::string>().empty());
    EXPECT_EQ(m_custody.signCount.load(), 1U);
}

TEST_F(AssertionSignerTest, JtiIsFreshPerAssertion)
{
    const auto keyId{ m_custody.generateKeyPair() };
    const devauth::core::AssertionSigner signer{ m_custody };
    const auto a{ jwt::decodeClaims(signer.buildClientAssertion("c", "aud", keyId, 1)) };
    const auto b{ jwt::decodeClaims(signer.buildClientAssertion("c", "aud", keyId, 1)) };
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE((*a)["jti"], (*b)["jti"]);
}

TEST_F(AssertionSignerTest, MissingKeyPropagatesKeyNotFound)
{
    const devauth::core::AssertionSigner signer{ m_custody };
    EXPECT_THROW((void)signer.buildClientAssertion("c", "aud", "gone", 1), devauth::crypto::KeyNotFound);
}

} // namespace

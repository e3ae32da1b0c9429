#include "devauth/core/Pkce.hpp"
#include "devauth/crypto/Encoding.hpp"
#include "devauth/security/ScopeWipe.hpp"
#include "devauth/security/SecureRandom.hpp"
#include <array>
#include <stdexcept>

namespace devauth::core::pkce
{

devauth::security::SecureString newCodeVerifier()
{
    std::array<std::uint8_t, g_verifierEntropyBytes> entropy{};
    if (!devauth::security::secureRandomFill(entropy))
    {
        throw std::runtime_error("pkce: CSPRNG failure");
    }
    auto wipeEntropy{ devauth::security::scopeWipe(entropy) };
    auto encoded{ devauth::crypto::base64UrlEncode(entropy) };
    auto wipeEncoded{ devauth::security::scopeWipe(encoded) };
    return devauth::security::secureStringFrom(encoded);
}

std::string codeChallenge(std::string_view verifier)
{
    const auto digest{ devauth::crypto::sha256(devauth::security::asBytes(verifier)) };
    return devauth::crypto::base64UrlEncode(digest);
}

std::string newState()
{
    auto state{ devauth::security::secureRandomUuid() };
    if (!state)
    {
        throw std::runtime_error("pkce: CSPRNG failure");
    }
    return *state;
}

bool isValidVerifier(std::string_view verifier) noexcept
{
    if (verifier.size() < g_minVerifierLength || verifier.size() > g_maxVerifierLength)
    {
        return false;
    }
    for (const char c : verifier)
    {
        const bool alnum{ (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') };
        if (!alnum && c != '-' && c != '.' && c != '_' && c != '~')
        {
            return false;
        }
    }
    return true;
}

} // namespace devauth::core::pkce

#include "devauth/core/AssertionSigner.hpp"
#include "devauth/core/Jwt.hpp"
#include "devauth/security/SecureRandom.hpp"
#include <stdexcept>

namespace devauth::core
{

AssertionSigner::AssertionSigner(const devauth::crypto::IKeyCustody& custody) noexcept : m_custody(&custody)
{
}

std::string AssertionSigner::buildClientAssertion(std::string_view clientId, std::string_view tokenEndpointUrl,
                                                  std::string_view keyId, std::int64_t nowEpochSeconds,
                                                  std::chrono::seconds ttl) const
{
    const auto jti{ devauth::security::secureRandomUuid() };
    if (!jti)
    {
        throw std::runtime_error("assertion: CSPRNG failure");
    }

    const nlohmann::json header{ { "alg", std::string{ devauth::crypto::g_signingAlgorithm } },
                                 { "typ", "JWT" },
                                 { "kid", std::string{ keyId } } };
    const nlohmann::json claims{ { "iss", std::string{ clientId } },
                                 { "sub", std::string{ clientId } },
                                 { "aud", std::string{ tokenEndpointUrl } },
                                 { "iat", nowEpochSeconds },
                                 { "exp", nowEpochSeconds + ttl.count() },
                                 { "jti", *jti } };

    const std::string kid{ keyId };
    return jwt::signCompact(header, claims, [this, &kid](std::span<const std::byte> signingInput) {
        return m_custody->sign(kid, signingInput);
    });
}

} // namespace devauth::core

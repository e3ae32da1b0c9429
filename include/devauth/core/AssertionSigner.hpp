#ifndef INCLUDE_DEVAUTH_CORE_ASSERTIONSIGNER_HPP
#define INCLUDE_DEVAUTH_CORE_ASSERTIONSIGNER_HPP

#include "devauth/crypto/IKeyCustody.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace devauth::core
{

constexpr std::chrono::seconds g_defaultAssertionTtl{ 60 };

// Mints private_key_jwt client assertions (RFC 7523 §2.2). Every call produces a new `jti` and
// new timestamps; nothing is cached.
class AssertionSigner final
{
public:
    explicit AssertionSigner(const devauth::crypto::IKeyCustody& custody) noexcept;

    // Throws KeyNotFound / KeyStoreUnavailable from the custody, std::runtime_error on CSPRNG failure.
    [[nodiscard]] std::string buildClientAssertion(std::string_view clientId, std::string_view tokenEndpointUrl,
                                                   std::string_view keyId, std::int64_t nowEpochSeconds,
                                                   std::chrono::seconds ttl = g_defaultAssertionTtl) const;

private:
    const devauth::crypto::IKeyCustody* m_custody{ nullptr };
};

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_ASSERTIONSIGNER_HPP

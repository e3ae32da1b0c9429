#ifndef INCLUDE_DEVAUTH_CRYPTO_IKEYCUSTODY_HPP
#define INCLUDE_DEVAUTH_CRYPTO_IKEYCUSTODY_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace devauth::crypto
{

constexpr std::size_t g_signingKeyBits{ 2048 };
constexpr std::string_view g_signingAlgorithm{ "RS256" };

// Public view of a custody key. Private material is addressed only by keyId and never leaves
// the custody implementation.
struct KeyMaterial final
{
    std::string keyId;
    std::string publicJwk;
    bool hardwareBacked{ false };
};

// Secure key store capability. Implementations own every private key; callers only ever see
// key ids, public JWKs and signatures.
//
// Failures are reported by the exceptions in KeyCustodyErrors.hpp.
class IKeyCustody
{
public:
    IKeyCustody() = default;
    IKeyCustody(const IKeyCustody&) = delete;
    IKeyCustody& operator=(const IKeyCustody&) = delete;
    IKeyCustody(IKeyCustody&&) = delete;
    IKeyCustody& operator=(IKeyCustody&&) = delete;
    virtual ~IKeyCustody() = default;

    // Creates an RSA-2048 signing pair and returns its fresh random id (used as JWT `kid`).
    // Throws KeyGenerationFailed or KeyStoreUnavailable.
    [[nodiscard]] virtual std::string generateKeyPair() = 0;

    [[nodiscard]] virtual bool hasKey(std::string_view keyId) const = 0;

    // No-op if the key does not exist.
    virtual void deleteKey(std::string_view keyId) = 0;

    virtual void deleteAllManagedKeys() = 0;

    // Single-entry JWKS document ({"keys":[...]}) with only the public half, tagged kid=keyId.
    // Throws KeyNotFound.
    [[nodiscard]] virtual std::string exportPublicJwks(std::string_view keyId) const = 0;

    [[nodiscard]] virtual KeyMaterial describeKey(std::string_view keyId) const = 0;

    // RS256 (RSASSA-PKCS1-v1_5 over SHA-256). Throws KeyNotFound.
    [[nodiscard]] virtual std::vector<std::uint8_t> sign(std::string_view keyId,
                                                         std::span<const std::byte> signingInput) const = 0;
};

} // namespace devauth::crypto

#endif // INCLUDE_DEVAUTH_CRYPTO_IKEYCUSTODY_HPP

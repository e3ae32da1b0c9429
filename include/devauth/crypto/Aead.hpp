#ifndef INCLUDE_DEVAUTH_CRYPTO_AEAD_HPP
#define INCLUDE_DEVAUTH_CRYPTO_AEAD_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace devauth::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

struct AeadBox final
{
    std::array<std::uint8_t, g_aeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_aeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// ChaCha20-Poly1305 (IETF, 12-byte random nonce). Used for everything persisted at rest.
// Contract violations (wrong key size, oversized input) throw std::invalid_argument;
// OpenSSL or CSPRNG failures throw std::runtime_error.
[[nodiscard]] AeadBox aeadSeal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                               std::span<const std::byte> associatedData);

// Returns std::nullopt on authentication failure.
[[nodiscard]] std::optional<devauth::security::SecureBuffer> aeadOpen(std::span<const std::uint8_t> key,
                                                                      const AeadBox& box,
                                                                      std::span<const std::byte> associatedData);

} // namespace devauth::crypto

#endif // INCLUDE_DEVAUTH_CRYPTO_AEAD_HPP

#ifndef INCLUDE_DEVAUTH_CRYPTO_ENCODING_HPP
#define INCLUDE_DEVAUTH_CRYPTO_ENCODING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace devauth::crypto
{

constexpr std::size_t g_sha256Bytes{ 32 };

using Sha256Digest = std::array<std::uint8_t, g_sha256Bytes>;

// base64url (RFC 4648 §5) without '=' padding, as used by JWS, JWK and PKCE.
[[nodiscard]] std::string base64UrlEncode(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::string base64UrlEncode(std::string_view text);

// Accepts unpadded or padded input; returns std::nullopt on any character outside the alphabet
// or an impossible length.
[[nodiscard]] std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text);

// Throws std::runtime_error if OpenSSL cannot compute the digest.
[[nodiscard]] Sha256Digest sha256(std::span<const std::byte> data);

} // namespace devauth::crypto

#endif // INCLUDE_DEVAUTH_CRYPTO_ENCODING_HPP

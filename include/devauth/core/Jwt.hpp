#ifndef INCLUDE_DEVAUTH_CORE_JWT_HPP
#define INCLUDE_DEVAUTH_CORE_JWT_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Compact JWS helpers (RFC 7515 §7.1). Signature verification is out of scope: the device only
// mints its own assertions and inspects the claims of server-issued tokens.
namespace devauth::core::jwt
{

using SignFn = std::function<std::vector<std::uint8_t>(std::span<const std::byte> signingInput)>;

[[nodiscard]] std::string encodeSegment(const nlohmann::json& value);

// std::nullopt unless the segment is base64url of a JSON object.
[[nodiscard]] std::optional<nlohmann::json> decodeSegment(std::string_view segment);

// header.claims.signature, where signature = sign("header.claims").
[[nodiscard]] std::string signCompact(const nlohmann::json& header, const nlohmann::json& claims,
                                      const SignFn& sign);

// Claims of a three-segment compact token, without checking the signature.
[[nodiscard]] std::optional<nlohmann::json> decodeClaims(std::string_view token);
[[nodiscard]] std::optional<nlohmann::json> decodeHeader(std::string_view token);

// `exp` must be present, numeric and strictly after `nowEpochSeconds`.
[[nodiscard]] bool isUnexpired(const nlohmann::json& claims, std::int64_t nowEpochSeconds) noexcept;

} // namespace devauth::core::jwt

#endif // INCLUDE_DEVAUTH_CORE_JWT_HPP

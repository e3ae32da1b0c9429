#ifndef INCLUDE_DEVAUTH_CORE_PKCE_HPP
#define INCLUDE_DEVAUTH_CORE_PKCE_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace devauth::core::pkce
{

constexpr std::size_t g_verifierEntropyBytes{ 48 };
constexpr std::size_t g_verifierLength{ 64 };
constexpr std::size_t g_minVerifierLength{ 43 };
constexpr std::size_t g_maxVerifierLength{ 128 };
constexpr std::string_view g_challengeMethod{ "S256" };

// 48 CSPRNG bytes, base64url without padding. Throws std::runtime_error if the CSPRNG fails.
[[nodiscard]] devauth::security::SecureString newCodeVerifier();

// S256: base64url(SHA-256(verifier)), no padding.
[[nodiscard]] std::string codeChallenge(std::string_view verifier);

// Opaque CSRF token with UUID entropy. Throws std::runtime_error if the CSPRNG fails.
[[nodiscard]] std::string newState();

// RFC 7636 §4.1: 43..128 characters of [A-Za-z0-9-._~].
[[nodiscard]] bool isValidVerifier(std::string_view verifier) noexcept;

} // namespace devauth::core::pkce

#endif // INCLUDE_DEVAUTH_CORE_PKCE_HPP

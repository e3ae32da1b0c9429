#ifndef INCLUDE_DEVAUTH_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_DEVAUTH_SECURITY_SECUREBUFFER_HPP

#include "devauth/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace devauth::security
{

// Raw secret bytes: wrapping keys, unwrapped PKCS#8 blobs, AEAD plaintexts.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

// Secret text: IATs, access/refresh tokens, PKCE verifiers.
using SecureString = std::basic_string<char, std::char_traits<char>, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // Parentheses select the (pointer, count) constructor, not the initializer_list one.
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.data(), s.size());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureBuffer& b) noexcept
{
    return std::as_bytes(std::span{ b });
}

[[nodiscard]] inline std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

[[nodiscard]] inline SecureBuffer toSecureBuffer(std::string_view s)
{
    SecureBuffer out{};
    out.reserve(s.size());
    for (const char c : s)
    {
        out.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c)));
    }
    return out;
}

[[nodiscard]] inline SecureString toSecureString(std::span<const std::uint8_t> bytes)
{
    SecureString out{};
    out.reserve(bytes.size());
    for (const std::uint8_t b : bytes)
    {
        out.push_back(static_cast<char>(b));
    }
    return out;
}

inline void secureRelease(SecureBuffer& b) noexcept
{
    secureWipe(std::as_writable_bytes(std::span{ b }));
    SecureBuffer temp{};
    b.swap(temp);
}

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(std::span<char>{ s.data(), s.size() });
    s.clear();
    s.shrink_to_fit();
}

// Constant-time comparison. Length is not treated as secret.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= (std::to_integer<unsigned char>(a[i]) ^ std::to_integer<unsigned char>(b[i]));
    }
    return (diff == 0);
}

[[nodiscard]] inline bool secureEquals(std::string_view a, std::string_view b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace devauth::security

#endif // INCLUDE_DEVAUTH_SECURITY_SECUREBUFFER_HPP

#ifndef INCLUDE_DEVAUTH_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_DEVAUTH_SECURITY_SCOPEWIPE_HPP

#include "devauth/security/SecureMemory.hpp"
#include <cstdint>
#include <span>
#include <string>

namespace devauth::security
{

// Wipes a byte range when the scope ends. For secrets that have to pass through ordinary
// std::string storage (HTTP bodies, intermediate encodings).
class [[nodiscard]] ScopeWipe final
{
public:
    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    explicit ScopeWipe(std::span<std::byte> b) noexcept : m_bytes{ b }
    {
    }

    ScopeWipe(ScopeWipe&& sw) noexcept : m_bytes{ sw.m_bytes }, m_active{ sw.m_active }
    {
        sw.release();
    }

    ~ScopeWipe() noexcept
    {
        if (m_active && !m_bytes.empty())
        {
            secureWipe(m_bytes);
        }
    }

    void release() noexcept
    {
        m_active = false;
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
    bool m_active{ true };
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> b) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(b) };
}

// The string must not be resized while the guard is alive.
[[nodiscard]] inline ScopeWipe scopeWipe(std::string& s) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(std::span<char>{ s.data(), s.size() }) };
}

} // namespace devauth::security

#endif // INCLUDE_DEVAUTH_SECURITY_SCOPEWIPE_HPP

#ifndef INCLUDE_DEVAUTH_STORAGE_CREDENTIALRECORDS_HPP
#define INCLUDE_DEVAUTH_STORAGE_CREDENTIALRECORDS_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devauth::storage
{

// Result of a successful dynamic client registration. clientId and keyId are persisted and
// cleared together; a store never returns one without the other.
struct DeviceRegistration final
{
    std::string serverUrl;
    std::string clientId;
    std::string keyId;
    std::int64_t registeredAtEpochMs{ 0 };
};

struct TokenSet final
{
    devauth::security::SecureString accessToken;
    std::optional<devauth::security::SecureString> refreshToken;
    std::int64_t expiresAtEpochMs{ 0 };
};

enum class FlowKind : std::uint8_t
{
    Enrollment,
    Login,
};

[[nodiscard]] constexpr std::string_view flowKindName(FlowKind kind) noexcept
{
    switch (kind)
    {
    case FlowKind::Enrollment:
        return "enrollment";
    case FlowKind::Login:
        return "login";
    }
    return "unknown";
}

// In-flight enrollment or login attempt. Consumed exactly once by the matching callback.
struct PendingFlowState final
{
    std::string state;
    std::optional<devauth::security::SecureString> codeVerifier;
    std::optional<std::string> serverUrl;
};

} // namespace devauth::storage

#endif // INCLUDE_DEVAUTH_STORAGE_CREDENTIALRECORDS_HPP

#ifndef INCLUDE_DEVAUTH_CORE_AUTHFLOW_HPP
#define INCLUDE_DEVAUTH_CORE_AUTHFLOW_HPP

#include "devauth/core/ApiResult.hpp"
#include "devauth/core/RegistrationEngine.hpp"
#include "devauth/core/TokenEngine.hpp"
#include "devauth/storage/ICredentialStore.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace devauth::core
{

enum class CallbackKind : std::uint8_t
{
    Error,
    Enrollment,
    Login,
    Unknown,
};

[[nodiscard]] constexpr std::string_view callbackKindName(CallbackKind kind) noexcept
{
    switch (kind)
    {
    case CallbackKind::Error:
        return "error";
    case CallbackKind::Enrollment:
        return "enrollment";
    case CallbackKind::Login:
        return "login";
    case CallbackKind::Unknown:
        return "unknown";
    }
    return "unknown";
}

struct CallbackOutcome final
{
    CallbackKind kind{ CallbackKind::Unknown };
    // Set for a completed enrollment.
    std::optional<std::string> clientId;
};

// Starts enrollment and login attempts and completes them from the redirect callback.
// Owns the CSRF state and PKCE verifier of each attempt through the credential store; a pending
// entry is consumed exactly once, and a second attempt of the same kind replaces the first.
class AuthFlow final
{
public:
    AuthFlow(RegistrationEngine& registration, TokenEngine& tokens, devauth::storage::ICredentialStore& store) noexcept;

    // Returns the enrollment URL to open in the user-agent.
    [[nodiscard]] ApiResult<std::string> beginEnrollment(std::string_view serverUrl) noexcept;

    // Requires a registered device. Returns the authorization URL to open in the user-agent.
    [[nodiscard]] ApiResult<std::string> beginLogin() noexcept;

    // Pure: `error` first, then `iat`, then `code` (non-empty values only).
    [[nodiscard]] static CallbackKind routeCallback(std::string_view uri) noexcept;

    // Verifies `state` against the pending entry of the routed kind and, on a match, finishes
    // the flow. A mismatch clears the pending entry and nothing else happens.
    [[nodiscard]] ApiResult<CallbackOutcome> handleCallback(std::string_view uri) noexcept;

    [[nodiscard]] ApiResult<Unit> abandon(devauth::storage::FlowKind kind) noexcept;

private:
    RegistrationEngine* m_registration{ nullptr };
    TokenEngine* m_tokens{ nullptr };
    devauth::storage::ICredentialStore* m_store{ nullptr };

    // Loads and removes the pending entry of `kind`; std::nullopt unless `state` matches it.
    [[nodiscard]] std::optional<devauth::storage::PendingFlowState>
    consumePending(devauth::storage::FlowKind kind, const std::optional<std::string>& state);
};

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_AUTHFLOW_HPP

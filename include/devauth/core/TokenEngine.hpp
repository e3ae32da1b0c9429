#ifndef INCLUDE_DEVAUTH_CORE_TOKENENGINE_HPP
#define INCLUDE_DEVAUTH_CORE_TOKENENGINE_HPP

#include "devauth/core/ApiResult.hpp"
#include "devauth/core/AssertionSigner.hpp"
#include "devauth/core/EngineConfig.hpp"
#include "devauth/net/ITransportClient.hpp"
#include "devauth/security/SecureBuffer.hpp"
#include "devauth/storage/ICredentialStore.hpp"
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace devauth::core
{

// Authorization-code + PKCE login and token lifecycle for a registered device.
//
// Registered -> AuthorizationRequested -> AwaitingCode -> Exchanging -> LoggedIn <-> Refreshing.
// logout() returns to Registered: tokens go, the registration stays.
class TokenEngine final
{
public:
    TokenEngine(const devauth::crypto::IKeyCustody& custody, devauth::storage::ICredentialStore& store,
                devauth::net::ITransportClient& transport, EngineConfig config, NowProvider now = &systemNowMs);

    // Pure: response_type=code, scope from config, code_challenge_method=S256.
    [[nodiscard]] std::string buildAuthorizationUrl(std::string_view serverUrl, std::string_view clientId,
                                                    std::string_view state, std::string_view codeChallenge) const;

    [[nodiscard]] ApiResult<Unit> exchangeCodeForToken(std::string_view code,
                                                       const devauth::security::SecureString& codeVerifier) noexcept;

    // Keeps the stored refresh token when the server does not rotate it.
    [[nodiscard]] ApiResult<Unit> refreshAccessToken() noexcept;

    // Refreshes first if now >= expiresAt; a refresh error is returned unchanged.
    [[nodiscard]] ApiResult<devauth::net::UserInfo> getUserInfo() noexcept;

    [[nodiscard]] ApiResult<Unit> logout() noexcept;

    [[nodiscard]] bool isLoggedIn() const noexcept;

    [[nodiscard]] std::optional<std::int64_t> tokenExpiresAt() const noexcept;

    [[nodiscard]] std::future<ApiResult<Unit>> exchangeCodeForTokenAsync(std::string code,
                                                                         devauth::security::SecureString codeVerifier);
    [[nodiscard]] std::future<ApiResult<Unit>> refreshAccessTokenAsync();
    [[nodiscard]] std::future<ApiResult<devauth::net::UserInfo>> getUserInfoAsync();

private:
    AssertionSigner m_signer;
    devauth::storage::ICredentialStore* m_store{ nullptr };
    devauth::net::ITransportClient* m_transport{ nullptr };
    EngineConfig m_config;
    NowProvider m_now;
    // Serializes every use of the stored refresh token.
    std::mutex m_refreshMutex;

    enum class RefreshMode : std::uint8_t
    {
        Always,
        IfExpired,
    };

    [[nodiscard]] ApiResult<Unit> refreshLocked(RefreshMode mode);

    [[nodiscard]] ApiResult<std::string> clientAssertion(const devauth::storage::DeviceRegistration& reg,
                                                         std::int64_t nowMs) const;
};

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_TOKENENGINE_HPP

#ifndef INCLUDE_DEVAUTH_NET_ITRANSPORTCLIENT_HPP
#define INCLUDE_DEVAUTH_NET_ITRANSPORTCLIENT_HPP

#include "devauth/core/ApiResult.hpp"
#include "devauth/net/WireModels.hpp"
#include <string_view>

namespace devauth::net
{

constexpr std::string_view g_systemInfoPath{ "/api/system/info" };
constexpr std::string_view g_enrollDevicePath{ "/api/auth/enrollDevice" };
constexpr std::string_view g_registerPath{ "/connect/register" };
constexpr std::string_view g_authorizePath{ "/oauth2/authorize" };
constexpr std::string_view g_tokenPath{ "/oauth2/token" };
constexpr std::string_view g_userInfoPath{ "/api/me" };

// The device-side wire contract. Every call is one HTTP exchange; nothing is retried.
class ITransportClient
{
public:
    ITransportClient() = default;
    ITransportClient(const ITransportClient&) = delete;
    ITransportClient& operator=(const ITransportClient&) = delete;
    ITransportClient(ITransportClient&&) = delete;
    ITransportClient& operator=(ITransportClient&&) = delete;
    virtual ~ITransportClient() = default;

    [[nodiscard]] virtual devauth::core::ApiResult<SystemInfo> probeSystemInfo(std::string_view serverUrl) = 0;

    // Bearer-authenticated with the raw IAT.
    [[nodiscard]] virtual devauth::core::ApiResult<ClientRegistrationResponse>
    registerClient(std::string_view serverUrl, std::string_view initialAccessToken,
                   const ClientRegistrationRequest& request) = 0;

    [[nodiscard]] virtual devauth::core::ApiResult<TokenResponse>
    exchangeAuthorizationCode(std::string_view serverUrl, const AuthorizationCodeGrant& grant) = 0;

    [[nodiscard]] virtual devauth::core::ApiResult<TokenResponse> refreshToken(std::string_view serverUrl,
                                                                               const RefreshTokenGrant& grant) = 0;

    [[nodiscard]] virtual devauth::core::ApiResult<UserInfo> fetchUserInfo(std::string_view serverUrl,
                                                                           std::string_view accessToken) = 0;
};

} // namespace devauth::net

#endif // INCLUDE_DEVAUTH_NET_ITRANSPORTCLIENT_HPP

#ifndef INCLUDE_DEVAUTH_NET_HTTPTRANSPORTCLIENT_HPP
#define INCLUDE_DEVAUTH_NET_HTTPTRANSPORTCLIENT_HPP

#include "devauth/net/IHttpClient.hpp"
#include "devauth/net/ITransportClient.hpp"

namespace devauth::net
{

// Maps the wire contract onto raw HTTP exchanges:
//  - TransportFailure from the HTTP client -> TransportError
//  - non-2xx -> ProtocolError with the server's message and status
//  - 2xx with an unexpected body -> TransportError("malformed response: ...")
class HttpTransportClient final : public ITransportClient
{
public:
    explicit HttpTransportClient(IHttpClient& http) noexcept;

    [[nodiscard]] devauth::core::ApiResult<SystemInfo> probeSystemInfo(std::string_view serverUrl) override;

    [[nodiscard]] devauth::core::ApiResult<ClientRegistrationResponse>
    registerClient(std::string_view serverUrl, std::string_view initialAccessToken,
                   const ClientRegistrationRequest& request) override;

    [[nodiscard]] devauth::core::ApiResult<TokenResponse>
    exchangeAuthorizationCode(std::string_view serverUrl, const AuthorizationCodeGrant& grant) override;

    [[nodiscard]] devauth::core::ApiResult<TokenResponse> refreshToken(std::string_view serverUrl,
                                                                       const RefreshTokenGrant& grant) override;

    [[nodiscard]] devauth::core::ApiResult<UserInfo> fetchUserInfo(std::string_view serverUrl,
                                                                   std::string_view accessToken) override;

private:
    IHttpClient* m_http{ nullptr };
};

} // namespace devauth::net

#endif // INCLUDE_DEVAUTH_NET_HTTPTRANSPORTCLIENT_HPP

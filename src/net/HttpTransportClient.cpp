#include "devauth/net/HttpTransportClient.hpp"
#include "devauth/net/Url.hpp"
#include "devauth/security/ScopeWipe.hpp"

namespace devauth::net
{
namespace
{

using devauth::core::ApiResult;
using devauth::core::ProtocolError;
using devauth::core::TransportError;

constexpr std::string_view g_kJson{ "application/json" };
constexpr std::string_view g_kForm{ "application/x-www-form-urlencoded" };

[[nodiscard]] std::string bearer(std::string_view token)
{
    std::string out{ "Bearer " };
    out.append(token);
    return out;
}

[[nodiscard]] HttpRequest formPost(std::string_view serverUrl, const url::QueryParams& form)
{
    HttpRequest req{};
    req.method = HttpMethod::Post;
    req.url = url::joinPath(serverUrl, g_tokenPath);
    req.headers.emplace("Content-Type", std::string{ g_kForm });
    req.headers.emplace("Accept", std::string{ g_kJson });
    req.body = url::encodeQuery(form);
    return req;
}

// One exchange: transport failure, non-2xx and undecodable bodies become typed errors.
template <class T, class Parse>
[[nodiscard]] ApiResult<T> exchange(IHttpClient& http, HttpRequest request, std::string_view failurePrefix,
                                    Parse parse)
{
    auto wipeBody{ devauth::security::scopeWipe(request.body) };
    HttpResponse response{};
    try
    {
        response = http.send(request);
    }
    catch (const TransportFailure& e)
    {
        return TransportError{ e.what() };
    }
    catch (const std::exception& e)
    {
        return TransportError{ std::string{ "http client: " } + e.what() };
    }

    if (!response.isSuccess())
    {
        std::string message{ failurePrefix };
        message.append(extractErrorMessage(response.body));
        return ProtocolError{ std::move(message), response.statusCode };
    }

    try
    {
        return parse(response.body);
    }
    catch (const MalformedResponse& e)
    {
        return TransportError{ std::string{ "malformed response: " } + e.what() };
    }
}

} // namespace

HttpTransportClient::HttpTransportClient(IHttpClient& http) noexcept : m_http(&http)
{
}

ApiResult<SystemInfo> HttpTransportClient::probeSystemInfo(std::string_view serverUrl)
{
    HttpRequest req{};
    req.url = url::joinPath(serverUrl, g_systemInfoPath);
    req.headers.emplace("Accept", std::string{ g_kJson });
    return exchange<SystemInfo>(*m_http, std::move(req), "Server not reachable: ",
                                [](std::string_view body) { return parseSystemInfo(body); });
}

ApiResult<ClientRegistrationResponse> HttpTransportClient::registerClient(std::string_view serverUrl,
                                                                          std::string_view initialAccessToken,
                                                                          const ClientRegistrationRequest& request)
{
    HttpRequest req{};
    req.method = HttpMethod::Post;
    req.url = url::joinPath(serverUrl, g_registerPath);
    req.headers.emplace("Authorization", bearer(initialAccessToken));
    req.headers.emplace("Content-Type", std::string{ g_kJson });
    req.headers.emplace("Accept", std::string{ g_kJson });
    try
    {
        req.body = request.toJson();
    }
    catch (const std::invalid_argument& e)
    {
        return TransportError{ e.what() };
    }
    return exchange<ClientRegistrationResponse>(
        *m_http, std::move(req), "Client registration failed: ",
        [](std::string_view body) { return parseClientRegistrationResponse(body); });
}

ApiResult<TokenResponse> HttpTransportClient::exchangeAuthorizationCode(std::string_view serverUrl,
                                                                        const AuthorizationCodeGrant& grant)
{
    const url::QueryParams form{ { "grant_type", "authorization_code" },
                                 { "code", grant.code },
                                 { "redirect_uri", grant.redirectUri },
                                 { "client_id", grant.clientId },
                                 { "client_assertion_type", std::string{ g_clientAssertionType } },
                                 { "client_assertion", grant.clientAssertion },
                                 { "code_verifier", std::string{ devauth::security::asStringView(
                                                        grant.codeVerifier) } } };
    return exchange<TokenResponse>(*m_http, formPost(serverUrl, form), "Token exchange failed: ",
                                   [](std::string_view body) { return parseTokenResponse(body); });
}

ApiResult<TokenResponse> HttpTransportClient::refreshToken(std::string_view serverUrl,
                                                           const RefreshTokenGrant& grant)
{
    const url::QueryParams form{
        { "grant_type", "refresh_token" },
        { "refresh_token", std::string{ devauth::security::asStringView(grant.refreshToken) } },
        { "client_id", grant.clientId },
        { "client_assertion_type", std::string{ g_clientAssertionType } },
        { "client_assertion", grant.clientAssertion }
    };
    return exchange<TokenResponse>(*m_http, formPost(serverUrl, form), "Token refresh failed: ",
                                   [](std::string_view body) { return parseTokenResponse(body); });
}

ApiResult<UserInfo> HttpTransportClient::fetchUserInfo(std::string_view serverUrl, std::string_view accessToken)
{
    HttpRequest req{};
    req.url = url::joinPath(serverUrl, g_userInfoPath);
    req.headers.emplace("Authorization", bearer(accessToken));
    req.headers.emplace("Accept", std::string{ g_kJson });
    return exchange<UserInfo>(*m_http, std::move(req), "Failed to fetch user info: ",
                              [](std::string_view body) { return parseUserInfo(body); });
}

} // namespace devauth::net

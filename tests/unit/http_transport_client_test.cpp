#include "devauth/net/HttpTransportClient.hpp"
#include "devauth/net/Url.hpp"
#include "test_utils/Fakes.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace
{

using devauth::core::ProtocolError;
using devauth::core::TransportError;
using devauth::net::HttpMethod;
using devauth::security::asStringView;
using devauth::security::secureStringFrom;

constexpr std::string_view g_server{ "https://play.dhis2.org/dev/" };

[[nodiscard]] devauth::net::url::QueryParams formOf(const devauth::net::HttpRequest& request)
{
    return devauth::net::url::parseQuery("?" + request.body).value_or(devauth::net::url::QueryParams{});
}

class HttpTransportClientTest : public ::testing::Test
{
protected:
    devauth::test_utils::FakeHttpClient m_http;             // NOLINT
    devauth::net::HttpTransportClient m_transport{ m_http }; // NOLINT
};

TEST_F(HttpTransportClientTest, ProbeGetsSystemInfo)
{
    m_http.enqueue(200, R"({"version":"2.41.0","revision":"abc","systemName":"DHIS 2 Demo"})");

    const auto result{ m_transport.probeSystemInfo(g_server) };

    ASSERT_TRUE(devauth::core::isOk(result));
    EXPECT_EQ(std::get<devauth::net::SystemInfo>(result).version, "2.41.0");
    ASSERT_EQ(m_http.requests.size(), 1U);
    EXPECT_EQ(m_http.requests[0].method, HttpMethod::Get);
    EXPECT_EQ(m_http.requests[0].url, "https://play.dhis2.org/dev/api/system/info");
}

TEST_F(HttpTransportClientTest, ProbeConnectionFailureIsTransportError)
{
    const auto result{ m_transport.probeSystemInfo(g_server) };

    ASSERT_TRUE(std::holds_alternative<TransportError>(result));
    EXPECT_EQ(std::get<TransportError>(result).cause, "connection refused");
}

TEST_F(HttpTransportClientTest, ProbeHttpFailureIsProtocolError)
{
    m_http.enqueue(503, "Service Unavailable");

    const auto result{ m_transport.probeSystemInfo(g_server) };

    ASSERT_TRUE(std::holds_alternative<ProtocolError>(result));
    const auto& error{ std::get<ProtocolError>(result) };
    EXPECT_EQ(error.message, "Server not reachable: Service Unavailable");
    EXPECT_EQ(error.httpStatus, 503);
}

TEST_F(HttpTransportClientTest, RegisterPostsJsonWithBearerIat)
{
    m_http.enqueue(201, R"({"client_id":"client_abc","client_id_issued_at":1700000000})");
    devauth::net::ClientRegistrationRequest request{};
    request.clientName = "DHIS2 Device Client - host";
    request.redirectUris = { "dhis2oauth://oauth" };
    request.grantTypes = { "authorization_code", "refresh_token" };
    request.responseTypes = { "code" };
    request.tokenEndpointAuthMethod = "private_key_jwt";
    request.tokenEndpointAuthSigningAlg = "RS256";
    request.scope = "openid profile username";
    request.jwksUri = "https://dhis2.org/jwks.json";
    request.jwks = R"({"keys":[{"kty":"RSA","kid":"k1","n":"AQAB","e":"AQAB"}]})";

    const auto result{ m_transport.registerClient(g_server, "iat-token", request) };

    ASSERT_TRUE(devauth::core::isOk(result)) << devauth::core::errorMessage(result);
    EXPECT_EQ(std::get<devauth::net::ClientRegistrationResponse>(result).clientId, "client_abc");

    ASSERT_EQ(m_http.requests.size(), 1U);
    const auto& sent{ m_http.requests[0] };
    EXPECT_EQ(sent.method, HttpMethod::Post);
    EXPECT_EQ(sent.url, "https://play.dhis2.org/dev/connect/register");
    EXPECT_EQ(sent.headers.at("Authorization"), "Bearer iat-token");
    EXPECT_EQ(sent.headers.at("Content-Type"), "application/json");

    const auto body{ nlohmann::json::parse(sent.body) };
    EXPECT_EQ(body["client_name"], "DHIS2 Device Client - host");
    EXPECT_EQ(body["token_endpoint_auth_method"], "private_key_jwt");
    EXPECT_EQ(body["token_endpoint_auth_signing_alg"], "RS256");
    EXPECT_EQ(body["grant_types"], nlohmann::json::array({ "authorization_code", "refresh_token" }));
    EXPECT_EQ(body["jwks_uri"], "https://dhis2.org/jwks.json");
    ASSERT_TRUE(body["jwks"].is_object());
    EXPECT_EQ(body["jwks"]["keys"][0]["kid"], "k1");
}

TEST_F(HttpTransportClientTest, RegisterRejectionCarriesServerMessage)
{
    m_http.enqueue(401, R"({"error":"invalid_token","error_description":"IAT expired"})");
    devauth::net::ClientRegistrationRequest request{};
    request.jwks = R"({"keys":[]})";

    const auto result{ m_transport.registerClient(g_server, "iat", request) };

    ASSERT_TRUE(std::holds_alternative<ProtocolError>(result));
    EXPECT_EQ(std::get<ProtocolError>(result).message, "Client registration failed: IAT expired");
    EXPECT_EQ(std::get<ProtocolError>(result).httpStatus, 401);
}

TEST_F(HttpTransportClientTest, RegisterWithoutClientIdIsMalformed)
{
    m_http.enqueue(201, R"({"client_name":"x"})");
    devauth::net::ClientRegistrationRequest request{};
    request.jwks = R"({"keys":[]})";

    const auto result{ m_transport.registerClient(g_server, "iat", request) };

    ASSERT_TRUE(std::holds_alternative<TransportError>(result));
    EXPECT_THAT(std::get<TransportError>(result).cause, ::testing::StartsWith("malformed response"));
}

TEST_F(HttpTransportClientTest, CodeExchangePostsFormInOrder)
{
    m_http.enqueue(200, R"({"access_token":"A1","token_type":"Bearer","expires_in":3600,"refresh_token":"R1"})");
    devauth::net::AuthorizationCodeGrant grant{};
    grant.code = "C1";
    grant.codeVerifier = secureStringFrom("verifier-1");
    grant.redirectUri = "dhis2oauth://oauth";
    grant.clientId = "client_abc";
    grant.clientAssertion = "h.c.s";

    const auto result{ m_transport.exchangeAuthorizationCode(g_server, grant) };

    ASSERT_TRUE(devauth::core::isOk(result)) << devauth::core::errorMessage(result);
    const auto& tokens{ std::get<devauth::net::TokenResponse>(result) };
    EXPECT_EQ(asStringView(tokens.accessToken), "A1");
    EXPECT_EQ(asStringView(*tokens.refreshToken), "R1");
    EXPECT_EQ(tokens.expiresIn, 3600);

    const auto& sent{ m_http.requests.at(0) };
    EXPECT_EQ(sent.url, "https://play.dhis2.org/dev/oauth2/token");
    EXPECT_EQ(sent.headers.at("Content-Type"), "application/x-www-form-urlencoded");
    EXPECT_THAT(formOf(sent),
                ::testing::ElementsAre(
                    ::testing::Pair("grant_type", "authorization_code"), ::testing::Pair("code", "C1"),
                    ::testing::Pair("redirect_uri", "dhis2oauth://oauth"), ::testing::Pair("client_id", "client_abc"),
                    ::testing::Pair("client_assertion_type", "urn:ietf:params:oauth:client-assertion-type:jwt-bearer"),
                    ::testing::Pair("client_assertion", "h.c.s"), ::testing::Pair("code_verifier", "verifier-1")));
}

TEST_F(HttpTransportClientTest, RefreshPostsFormInOrder)
{
    m_http.enqueue(200, R"({"access_token":"A2","expires_in":3600})");
    devauth::net::RefreshTokenGrant grant{};
    grant.refreshToken = secureStringFrom("R1");
    grant.clientId = "client_abc";
    grant.clientAssertion = "h.c.s";

    const auto result{ m_transport.refreshToken(g_server, grant) };

    ASSERT_TRUE(devauth::core::isOk(result)) << devauth::core::errorMessage(result);
    const auto& tokens{ std::get<devauth::net::TokenResponse>(result) };
    EXPECT_EQ(tokens.tokenType, "Bearer");
    EXPECT_FALSE(tokens.refreshToken.has_value());
    EXPECT_THAT(formOf(m_http.requests.at(0)),
                ::testing::ElementsAre(
                    ::testing::Pair("grant_type", "refresh_token"), ::testing::Pair("refresh_token", "R1"),
                    ::testing::Pair("client_id", "client_abc"),
                    ::testing::Pair("client_assertion_type", "urn:ietf:params:oauth:client-assertion-type:jwt-bearer"),
                    ::testing::Pair("client_assertion", "h.c.s")));
}

TEST_F(HttpTransportClientTest, RefreshRejectionIsProtocolError)
{
    m_http.enqueue(400, R"({"error":"invalid_grant"})");
    devauth::net::RefreshTokenGrant grant{};
    grant.refreshToken = secureStringFrom("R1");

    const auto result{ m_transport.refreshToken(g_server, grant) };

    ASSERT_TRUE(std::holds_alternative<ProtocolError>(result));
    EXPECT_EQ(std::get<ProtocolError>(result).message, "Token refresh failed: invalid_grant");
}

TEST_F(HttpTransportClientTest, UserInfoSendsBearerAccessToken)
{
    m_http.enqueue(200, R"({"id":"u1","username":"admin","displayName":"John Traore","email":null})");

    const auto result{ m_transport.fetchUserInfo(g_server, "A1") };

    ASSERT_TRUE(devauth::core::isOk(result)) << devauth::core::errorMessage(result);
    const auto& user{ std::get<devauth::net::UserInfo>(result) };
    EXPECT_EQ(user.username, "admin");
    EXPECT_EQ(user.displayName, "John Traore");
    EXPECT_FALSE(user.email.has_value());
    EXPECT_EQ(m_http.requests.at(0).url, "https://play.dhis2.org/dev/api/me");
    EXPECT_EQ(m_http.requests.at(0).headers.at("Authorization"), "Bearer A1");
}

TEST_F(HttpTransportClientTest, UserInfoUnauthorizedIsProtocolError)
{
    m_http.enqueue(401, "");

    const auto result{ m_transport.fetchUserInfo(g_server, "A1") };

    ASSERT_TRUE(std::holds_alternative<ProtocolError>(result));
    EXPECT_EQ(std::get<ProtocolError>(result).httpStatus, 401);
}

} // namespace

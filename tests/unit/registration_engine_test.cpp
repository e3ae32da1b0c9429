#include "devauth/core/RegistrationEngine.hpp"
#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace
{

using devauth::core::ApiResult;
using devauth::core::ValidationError;
using devauth::core::ValidationErrorCode;
using devauth::net::ClientRegistrationRequest;
using devauth::net::ClientRegistrationResponse;
using ::testing::_;
using ::testing::Return;

constexpr std::string_view g_server{ "https://play.dhis2.org/dev" };

class RegistrationEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        devauth::core::EngineConfig config{};
        config.deviceId = "test-device";
        m_engine = std::make_unique<devauth::core::RegistrationEngine>(m_custody, m_store, m_transport, config,
                                                                       m_clock.provider());
    }

    [[nodiscard]] devauth::security::SecureString validIat() const
    {
        return devauth::security::secureStringFrom(devauth::test_utils::makeIat(m_clock.nowSeconds() + 600));
    }

    [[nodiscard]] static ClientRegistrationResponse issued(std::string clientId)
    {
        ClientRegistrationResponse response{};
        response.clientId = std::move(clientId);
        return response;
    }

    devauth::test_utils::FakeClock m_clock;                           // NOLINT
    devauth::test_utils::FakeKeyCustody m_custody;                    // NOLINT
    devauth::test_utils::InMemoryCredentialStore m_store;             // NOLINT
    ::testing::StrictMock<devauth::test_utils::MockTransportClient> m_transport; // NOLINT
    std::unique_ptr<devauth::core::RegistrationEngine> m_engine;      // NOLINT
};

TEST_F(RegistrationEngineTest, EnrollmentUrlCarriesDeviceParameters)
{
    const auto url{ m_engine->buildEnrollmentUrl("https://srv/", "state-1") };
    EXPECT_EQ(url, "https://srv/api/auth/enrollDevice?deviceVersion=1.0&deviceType=linux&deviceAttestation=none"
                   "&redirectUri=dhis2oauth%3A%2F%2Foauth&state=state-1");
}

TEST_F(RegistrationEngineTest, ClientNameIncludesDeviceId)
{
    EXPECT_EQ(m_engine->clientName(), "DHIS2 Device Client - test-device");
}

TEST_F(RegistrationEngineTest, ExpiredIatFailsWithoutNetworkOrKey)
{
    const auto iat{ devauth::security::secureStringFrom(devauth::test_utils::makeIat(m_clock.nowSeconds() - 1)) };

    const auto result{ m_engine->registerDevice(g_server, iat) };

    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_EQ(std::get<ValidationError>(result).code, ValidationErrorCode::InvalidIat);
    EXPECT_EQ(m_custody.keyCount(), 0U);
    EXPECT_FALSE(m_store.loadRegistration().has_value());
}

TEST_F(RegistrationEngineTest, IatWithoutExpOrGarbageIsRejected)
{
    for (const std::string& raw : { devauth::test_utils::makeIat(std::nullopt), std::string{ "not-a-jwt" },
                                    std::string{ "" } })
    {
        const auto result{ m_engine->registerDevice(g_server, devauth::security::secureStringFrom(raw)) };
        ASSERT_TRUE(std::holds_alternative<ValidationError>(result)) << raw;
        EXPECT_EQ(std::get<ValidationError>(result).code, ValidationErrorCode::InvalidIat);
    }
}

TEST_F(RegistrationEngineTest, SuccessStoresRegistrationAndKey)
{
    ClientRegistrationRequest sent{};
    std::string sentIat;
    EXPECT_CALL(m_transport, registerClient(g_server, _, _))
        .WillOnce([&](std::string_view, std::string_view iat, const ClientRegistrationRequest& request)
                      -> ApiResult<ClientRegistrationResponse> {
            sent = request;
            sentIat = std::string{ iat };
            return issued("client_abc");
        });

    const auto iat{ validIat() };
    const auto result{ m_engine->registerDevice(g_server, iat) };

    ASSERT_TRUE(devauth::core::isOk(result)) << devauth::core::errorMessage(result);
    EXPECT_EQ(std::get<std::string>(result), "client_abc");
    EXPECT_EQ(sentIat, devauth::security::asStringView(iat));

    EXPECT_EQ(sent.clientName, "DHIS2 Device Client - test-device");
    EXPECT_THAT(sent.redirectUris, ::testing::ElementsAre("dhis2oauth://oauth"));
    EXPECT_THAT(sent.grantTypes, ::testing::ElementsAre("authorization_code", "refresh_token"));
    EXPECT_THAT(sent.responseTypes, ::testing::ElementsAre("code"));
    EXPECT_EQ(sent.tokenEndpointAuthMethod, "private_key_jwt");
    EXPECT_EQ(sent.tokenEndpointAuthSigningAlg, "RS256");
    EXPECT_EQ(sent.scope, "openid profile username");
    const auto jwks{ nlohmann::json::parse(sent.jwks) };
    EXPECT_EQ(jwks["keys"][0]["kid"], "key-1");

    const auto reg{ m_store.loadRegistration() };
    ASSERT_TRUE(reg.has_value());
    EXPECT_EQ(reg->clientId, "client_abc");
    EXPECT_EQ(reg->keyId, "key-1");
    EXPECT_EQ(reg->serverUrl, g_server);
    EXPECT_EQ(reg->registeredAtEpochMs, m_clock.nowMs());
    EXPECT_TRUE(m_engine->isDeviceRegistered());
}

TEST_F(RegistrationEngineTest, ServerRejectionDeletesGeneratedKey)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _))
        .WillOnce(Return(ApiResult<ClientRegistrationResponse>{
            devauth::core::ProtocolError{ "Client registration failed: invalid_token", 401 } }));

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<devauth::core::ProtocolError>(result));
    EXPECT_EQ(std::get<devauth::core::ProtocolError>(result).httpStatus, 401);
    EXPECT_EQ(m_custody.keyCount(), 0U);
    EXPECT_FALSE(m_store.loadRegistration().has_value());
    EXPECT_FALSE(m_engine->isDeviceRegistered());
}

TEST_F(RegistrationEngineTest, TransportFailureDeletesGeneratedKey)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _))
        .WillOnce(Return(ApiResult<ClientRegistrationResponse>{ devauth::core::TransportError{ "timeout" } }));

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<devauth::core::TransportError>(result));
    EXPECT_EQ(m_custody.keyCount(), 0U);
}

TEST_F(RegistrationEngineTest, FailedCleanupIsReportedAlongsideError)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _))
        .WillOnce(Return(ApiResult<ClientRegistrationResponse>{ devauth::core::TransportError{ "timeout" } }));
    m_custody.failDelete = true;

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<devauth::core::TransportError>(result));
    EXPECT_THAT(std::get<devauth::core::TransportError>(result).cause, ::testing::HasSubstr("could not be deleted"));
}

TEST_F(RegistrationEngineTest, StorageFailureAfterRegistrationDeletesKey)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _)).WillOnce(Return(issued("client_abc")));
    m_store.failSaveRegistration = true;

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_EQ(std::get<ValidationError>(result).code, ValidationErrorCode::StorageFailure);
    EXPECT_EQ(m_custody.keyCount(), 0U);
}

TEST_F(RegistrationEngineTest, FailedReRegistrationKeepsPreviousSession)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _))
        .WillOnce(Return(issued("client_one")))
        .WillOnce(Return(issued("client_two")));

    ASSERT_TRUE(devauth::core::isOk(m_engine->registerDevice(g_server, validIat())));
    devauth::storage::TokenSet tokens{};
    tokens.accessToken = devauth::security::secureStringFrom("current-access");
    tokens.expiresAtEpochMs = m_clock.nowMs() + 60'000;
    m_store.saveTokens(tokens);
    m_store.failSaveRegistration = true;

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_EQ(std::get<ValidationError>(result).code, ValidationErrorCode::StorageFailure);
    const auto reg{ m_store.loadRegistration() };
    ASSERT_TRUE(reg.has_value());
    EXPECT_EQ(reg->clientId, "client_one");
    EXPECT_TRUE(m_custody.hasKey("key-1"));
    EXPECT_FALSE(m_custody.hasKey("key-2"));
    const auto kept{ m_store.loadTokens() };
    ASSERT_TRUE(kept.has_value());
    EXPECT_EQ(devauth::security::asStringView(kept->accessToken), "current-access");
    EXPECT_TRUE(m_engine->isDeviceRegistered());
}

TEST_F(RegistrationEngineTest, KeyGenerationFailureIsFatalKeyStoreError)
{
    m_custody.failGenerate = true;

    const auto result{ m_engine->registerDevice(g_server, validIat()) };

    ASSERT_TRUE(std::holds_alternative<ValidationError>(result));
    EXPECT_EQ(std::get<ValidationError>(result).code, ValidationErrorCode::KeyStoreFailure);
    EXPECT_TRUE(std::get<ValidationError>(result).isFatal());
}

TEST_F(RegistrationEngineTest, ReRegistrationReplacesIdentityAndDropsTokens)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _))
        .WillOnce(Return(issued("client_one")))
        .WillOnce(Return(issued("client_two")));

    ASSERT_TRUE(devauth::core::isOk(m_engine->registerDevice(g_server, validIat())));
    devauth::storage::TokenSet tokens{};
    tokens.accessToken = devauth::security::secureStringFrom("old-access");
    tokens.expiresAtEpochMs = m_clock.nowMs() + 60'000;
    m_store.saveTokens(tokens);

    ASSERT_TRUE(devauth::core::isOk(m_engine->registerDevice(g_server, validIat())));

    const auto reg{ m_store.loadRegistration() };
    ASSERT_TRUE(reg.has_value());
    EXPECT_EQ(reg->clientId, "client_two");
    EXPECT_EQ(reg->keyId, "key-2");
    EXPECT_FALSE(m_custody.hasKey("key-1"));
    EXPECT_FALSE(m_store.loadTokens().has_value());
}

TEST_F(RegistrationEngineTest, RegistrationWithoutKeyIsNotRegistered)
{
    m_store.saveRegistration(devauth::storage::DeviceRegistration{
        .serverUrl = std::string{ g_server }, .clientId = "client_abc", .keyId = "lost", .registeredAtEpochMs = 1 });
    EXPECT_FALSE(m_engine->isDeviceRegistered());
}

TEST_F(RegistrationEngineTest, ResetDeletesKeyAndStateAndIsIdempotent)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _)).WillOnce(Return(issued("client_abc")));
    ASSERT_TRUE(devauth::core::isOk(m_engine->registerDevice(g_server, validIat())));

    EXPECT_TRUE(devauth::core::isOk(m_engine->resetRegistration()));
    EXPECT_EQ(m_custody.keyCount(), 0U);
    EXPECT_FALSE(m_store.loadRegistration().has_value());
    EXPECT_FALSE(m_engine->isDeviceRegistered());

    EXPECT_TRUE(devauth::core::isOk(m_engine->resetRegistration()));
}

TEST_F(RegistrationEngineTest, ProbeForwardsTransportResult)
{
    devauth::net::SystemInfo info{};
    info.version = "2.41";
    EXPECT_CALL(m_transport, probeSystemInfo(g_server)).WillOnce(Return(info));

    const auto result{ m_engine->probeServer(g_server) };

    ASSERT_TRUE(devauth::core::isOk(result));
    EXPECT_EQ(std::get<devauth::net::SystemInfo>(result).version, "2.41");
}

TEST_F(RegistrationEngineTest, AsyncRegistrationDeliversResult)
{
    EXPECT_CALL(m_transport, registerClient(_, _, _)).WillOnce(Return(issued("client_async")));

    auto future{ m_engine->registerDeviceAsync(std::string{ g_server }, validIat()) };
    const auto result{ future.get() };

    ASSERT_TRUE(devauth::core::isOk(result));
    EXPECT_EQ(std::get<std::string>(result), "client_async");
}

TEST_F(RegistrationEngineTest, AsyncProbeDeliversTransportError)
{
    EXPECT_CALL(m_transport, probeSystemInfo(g_server))
        .WillOnce(Return(devauth::core::ApiResult<devauth::net::SystemInfo>{
            devauth::core::TransportError{ "connection refused" } }));

    auto future{ m_engine->probeServerAsync(std::string{ g_server }) };
    const auto result{ future.get() };

    ASSERT_TRUE(std::holds_alternative<devauth::core::TransportError>(result));
    EXPECT_EQ(std::get<devauth::core::TransportError>(result).cause, "connection refused");
}

} // namespace

#include "devauth/core/RegistrationEngine.hpp"
#include "devauth/core/Jwt.hpp"
#include "devauth/crypto/KeyCustodyErrors.hpp"
#include "devauth/net/Url.hpp"
#include "devauth/storage/StorageErrors.hpp"

namespace devauth::core
{
namespace
{

constexpr std::string_view g_kInvalidIat{ "invalid or expired IAT" };
constexpr std::string_view g_kCleanupFailed{ " (generated key could not be deleted)" };
constexpr std::int64_t g_kMsPerSecond{ 1000 };

template <class T> [[nodiscard]] ApiResult<T> withCleanupNote(ApiResult<T> result, bool cleaned)
{
    if (cleaned)
    {
        return result;
    }
    std::visit(Overloaded{ [](T&) {},
                           [](ValidationError& e) { e.message.append(g_kCleanupFailed); },
                           [](ProtocolError& e) { e.message.append(g_kCleanupFailed); },
                           [](TransportError& e) { e.cause.append(g_kCleanupFailed); } },
               result);
    return result;
}

} // namespace

RegistrationEngine::RegistrationEngine(devauth::crypto::IKeyCustody& custody, devauth::storage::ICredentialStore& store,
                                       devauth::net::ITransportClient& transport, EngineConfig config, NowProvider now)
    : m_custody(&custody), m_store(&store), m_transport(&transport), m_config(std::move(config)),
      m_now(std::move(now))
{
}

std::string RegistrationEngine::buildEnrollmentUrl(std::string_view serverUrl, std::string_view state) const
{
    const devauth::net::url::QueryParams params{ { "deviceVersion", m_config.deviceVersion },
                                                 { "deviceType", m_config.deviceType },
                                                 { "deviceAttestation", m_config.deviceAttestation },
                                                 { "redirectUri", m_config.redirectUri },
                                                 { "state", std::string{ state } } };
    return devauth::net::url::appendQuery(devauth::net::url::joinPath(serverUrl, devauth::net::g_enrollDevicePath),
                                          params);
}

std::string RegistrationEngine::clientName() const
{
    if (m_config.deviceId.empty())
    {
        return m_config.clientNamePrefix;
    }
    return m_config.clientNamePrefix + " - " + m_config.deviceId;
}

ApiResult<std::string> RegistrationEngine::registerDevice(std::string_view serverUrl,
                                                          const devauth::security::SecureString& iat) noexcept
{
    try
    {
        std::lock_guard lock{ m_registerMutex };
        return registerLocked(serverUrl, iat);
    }
    catch (const std::exception& e)
    {
        return TransportError{ e.what() };
    }
}

ApiResult<std::string> RegistrationEngine::registerLocked(std::string_view serverUrl,
                                                          const devauth::security::SecureString& iat)
{
    const auto nowMs{ m_now() };

    // 1. Local IAT check. Nothing leaves the device for an expired or unparsable token.
    const auto claims{ jwt::decodeClaims(devauth::security::asStringView(iat)) };
    if (!claims || !jwt::isUnexpired(*claims, nowMs / g_kMsPerSecond))
    {
        return ValidationError{ ValidationErrorCode::InvalidIat, std::string{ g_kInvalidIat } };
    }

    // 2. Fresh signing key.
    std::string keyId{};
    try
    {
        keyId = m_custody->generateKeyPair();
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::KeyStoreFailure, e.what() };
    }

    // 3. Public half as inline JWKS.
    std::string jwks{};
    try
    {
        jwks = m_custody->exportPublicJwks(keyId);
    }
    catch (const std::exception& e)
    {
        const bool cleaned{ discardKey(keyId) };
        return withCleanupNote<std::string>(ValidationError{ ValidationErrorCode::KeyStoreFailure, e.what() },
                                            cleaned);
    }

    // 4. Registration metadata.
    devauth::net::ClientRegistrationRequest request{};
    request.clientName = clientName();
    request.redirectUris = { m_config.redirectUri };
    request.grantTypes = { "authorization_code", "refresh_token" };
    request.responseTypes = { "code" };
    request.tokenEndpointAuthMethod = "private_key_jwt";
    request.tokenEndpointAuthSigningAlg = std::string{ devauth::crypto::g_signingAlgorithm };
    request.scope = m_config.scope;
    request.jwksUri = m_config.jwksUri;
    request.jwks = std::move(jwks);

    // 5. Bearer-authenticated with the raw IAT.
    ApiResult<devauth::net::ClientRegistrationResponse> response{ TransportError{} };
    try
    {
        response = m_transport->registerClient(serverUrl, devauth::security::asStringView(iat), request);
    }
    catch (const std::exception& e)
    {
        response = TransportError{ e.what() };
    }
    if (!isOk(response))
    {
        const bool cleaned{ discardKey(keyId) };
        return withCleanupNote(forwardError<std::string>(std::move(response)), cleaned);
    }
    const auto clientId{ std::get<devauth::net::ClientRegistrationResponse>(response).clientId };

    // 6. Persist. The previous identity keeps its session until the new identity is durable;
    // only then are its tokens dropped and its key released.
    std::optional<devauth::storage::DeviceRegistration> previous{};
    try
    {
        previous = m_store->loadRegistration();
        m_store->saveRegistration(devauth::storage::DeviceRegistration{ .serverUrl = std::string{ serverUrl },
                                                                        .clientId = clientId,
                                                                        .keyId = keyId,
                                                                        .registeredAtEpochMs = nowMs });
    }
    catch (const std::exception& e)
    {
        const bool cleaned{ discardKey(keyId) };
        return withCleanupNote<std::string>(ValidationError{ ValidationErrorCode::StorageFailure, e.what() },
                                            cleaned);
    }

    if (previous && previous->keyId != keyId)
    {
        // Best effort: the stale key is unreachable once the new registration is stored.
        (void)discardKey(previous->keyId);
    }

    try
    {
        m_store->clearTokens();
    }
    catch (const std::exception& e)
    {
        // The new registration stands; the leftover session belongs to the replaced client.
        return ValidationError{ ValidationErrorCode::StorageFailure,
                                std::string{ "device registered, but the previous session could not be cleared: " } +
                                    e.what() };
    }
    return clientId;
}

std::future<ApiResult<std::string>> RegistrationEngine::registerDeviceAsync(std::string serverUrl,
                                                                            devauth::security::SecureString iat)
{
    return std::async(std::launch::async, [this, serverUrl = std::move(serverUrl), iat = std::move(iat)]() {
        return registerDevice(serverUrl, iat);
    });
}

bool RegistrationEngine::discardKey(std::string_view keyId) noexcept
{
    try
    {
        m_custody->deleteKey(keyId);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool RegistrationEngine::isDeviceRegistered() const noexcept
{
    try
    {
        const auto reg{ m_store->loadRegistration() };
        return reg && !reg->clientId.empty() && !reg->keyId.empty() && m_custody->hasKey(reg->keyId);
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::optional<devauth::storage::DeviceRegistration> RegistrationEngine::registration() const noexcept
{
    try
    {
        return m_store->loadRegistration();
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

ApiResult<Unit> RegistrationEngine::resetRegistration() noexcept
{
    try
    {
        std::lock_guard lock{ m_registerMutex };
        if (const auto reg{ m_store->loadRegistration() }; reg)
        {
            m_custody->deleteKey(reg->keyId);
        }
        m_store->clearAll();
        return Unit{};
    }
    catch (const devauth::crypto::KeyStoreUnavailable& e)
    {
        return ValidationError{ ValidationErrorCode::KeyStoreFailure, e.what() };
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
    }
}

ApiResult<devauth::net::SystemInfo> RegistrationEngine::probeServer(std::string_view serverUrl) noexcept
{
    try
    {
        return m_transport->probeSystemInfo(serverUrl);
    }
    catch (const std::exception& e)
    {
        return TransportError{ e.what() };
    }
}

std::future<ApiResult<devauth::net::SystemInfo>> RegistrationEngine::probeServerAsync(std::string serverUrl)
{
    return std::async(std::launch::async,
                      [this, serverUrl = std::move(serverUrl)]() { return probeServer(serverUrl); });
}

} // namespace devauth::core

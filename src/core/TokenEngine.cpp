#include "devauth/core/TokenEngine.hpp"
#include "devauth/core/Pkce.hpp"
#include "devauth/crypto/KeyCustodyErrors.hpp"
#include "devauth/net/Url.hpp"

#include <limits>

namespace devauth::core
{
namespace
{

constexpr std::int64_t g_kMsPerSecond{ 1000 };

[[nodiscard]] ValidationError notRegistered()
{
    return ValidationError{ ValidationErrorCode::NotRegistered, "device is not registered" };
}

[[nodiscard]] ValidationError storageFailure(const std::exception& e)
{
    return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
}

// Transport implementations report failures as values; anything thrown is still a transport failure.
template <class T, class Call> [[nodiscard]] ApiResult<T> callTransport(Call&& call)
{
    try
    {
        return call();
    }
    catch (const std::exception& e)
    {
        return TransportError{ e.what() };
    }
}

// Saturates at the largest representable instant.
[[nodiscard]] std::int64_t expiryFrom(std::int64_t nowMs, std::int64_t expiresInSeconds) noexcept
{
    constexpr std::int64_t maxMs{ std::numeric_limits<std::int64_t>::max() };
    if (expiresInSeconds <= 0)
    {
        return nowMs;
    }
    const std::int64_t headroomMs{ nowMs > 0 ? maxMs - nowMs : maxMs };
    if (expiresInSeconds > headroomMs / g_kMsPerSecond)
    {
        return maxMs;
    }
    return nowMs + (expiresInSeconds * g_kMsPerSecond);
}

} // namespace

TokenEngine::TokenEngine(const devauth::crypto::IKeyCustody& custody, devauth::storage::ICredentialStore& store,
                         devauth::net::ITransportClient& transport, EngineConfig config, NowProvider now)
    : m_signer(custody), m_store(&store), m_transport(&transport), m_config(std::move(config)), m_now(std::move(now))
{
}

std::string TokenEngine::buildAuthorizationUrl(std::string_view serverUrl, std::string_view clientId,
                                               std::string_view state, std::string_view codeChallenge) const
{
    const devauth::net::url::QueryParams params{ { "client_id", std::string{ clientId } },
                                                 { "redirect_uri", m_config.redirectUri },
                                                 { "response_type", "code" },
                                                 { "scope", m_config.scope },
                                                 { "state", std::string{ state } },
                                                 { "code_challenge", std::string{ codeChallenge } },
                                                 { "code_challenge_method", std::string{ pkce::g_challengeMethod } } };
    return devauth::net::url::appendQuery(devauth::net::url::joinPath(serverUrl, devauth::net::g_authorizePath),
                                          params);
}

ApiResult<std::string> TokenEngine::clientAssertion(const devauth::storage::DeviceRegistration& reg,
                                                    std::int64_t nowMs) const
{
    const auto tokenEndpoint{ devauth::net::url::joinPath(reg.serverUrl, devauth::net::g_tokenPath) };
    try
    {
        return m_signer.buildClientAssertion(reg.clientId, tokenEndpoint, reg.keyId, nowMs / g_kMsPerSecond,
                                             m_config.assertionTtl);
    }
    catch (const devauth::crypto::KeyNotFound& e)
    {
        return ValidationError{ ValidationErrorCode::KeyStoreFailure, e.what() };
    }
    catch (const devauth::crypto::KeyStoreUnavailable& e)
    {
        return ValidationError{ ValidationErrorCode::KeyStoreFailure, e.what() };
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::RandomFailed, e.what() };
    }
}

ApiResult<Unit> TokenEngine::exchangeCodeForToken(std::string_view code,
                                                  const devauth::security::SecureString& codeVerifier) noexcept
{
    try
    {
        std::lock_guard lock{ m_refreshMutex };

        const auto reg{ m_store->loadRegistration() };
        if (!reg)
        {
            return notRegistered();
        }

        auto assertion{ clientAssertion(*reg, m_now()) };
        if (!isOk(assertion))
        {
            return forwardError<Unit>(std::move(assertion));
        }

        devauth::net::AuthorizationCodeGrant grant{};
        grant.code = std::string{ code };
        grant.codeVerifier = codeVerifier;
        grant.redirectUri = m_config.redirectUri;
        grant.clientId = reg->clientId;
        grant.clientAssertion = std::move(std::get<std::string>(assertion));

        auto response{ callTransport<devauth::net::TokenResponse>(
            [&] { return m_transport->exchangeAuthorizationCode(reg->serverUrl, grant); }) };
        if (!isOk(response))
        {
            return forwardError<Unit>(std::move(response));
        }
        auto& token{ std::get<devauth::net::TokenResponse>(response) };

        devauth::storage::TokenSet tokens{};
        tokens.accessToken = std::move(token.accessToken);
        tokens.refreshToken = std::move(token.refreshToken);
        tokens.expiresAtEpochMs = expiryFrom(m_now(), token.expiresIn);
        m_store->saveTokens(tokens);
        return Unit{};
    }
    catch (const std::exception& e)
    {
        return storageFailure(e);
    }
}

ApiResult<Unit> TokenEngine::refreshAccessToken() noexcept
{
    try
    {
        std::lock_guard lock{ m_refreshMutex };
        return refreshLocked(RefreshMode::Always);
    }
    catch (const std::exception& e)
    {
        return storageFailure(e);
    }
}

ApiResult<Unit> TokenEngine::refreshLocked(RefreshMode mode)
{
    const auto reg{ m_store->loadRegistration() };
    if (!reg)
    {
        return notRegistered();
    }

    auto current{ m_store->loadTokens() };
    if (mode == RefreshMode::IfExpired)
    {
        if (!current)
        {
            return ValidationError{ ValidationErrorCode::MissingAccessToken, "access token not found" };
        }
        // Another caller may have refreshed while this one waited for the lock.
        if (m_now() < current->expiresAtEpochMs)
        {
            return Unit{};
        }
    }
    if (!current || !current->refreshToken)
    {
        return ValidationError{ ValidationErrorCode::MissingRefreshToken, "refresh token not found" };
    }

    auto assertion{ clientAssertion(*reg, m_now()) };
    if (!isOk(assertion))
    {
        return forwardError<Unit>(std::move(assertion));
    }

    devauth::net::RefreshTokenGrant grant{};
    grant.refreshToken = *current->refreshToken;
    grant.clientId = reg->clientId;
    grant.clientAssertion = std::move(std::get<std::string>(assertion));

    auto response{ callTransport<devauth::net::TokenResponse>(
        [&] { return m_transport->refreshToken(reg->serverUrl, grant); }) };
    if (!isOk(response))
    {
        // The registration survives a failed refresh; only the session is affected.
        return forwardError<Unit>(std::move(response));
    }
    auto& token{ std::get<devauth::net::TokenResponse>(response) };

    devauth::storage::TokenSet tokens{};
    tokens.accessToken = std::move(token.accessToken);
    tokens.refreshToken = token.refreshToken ? std::move(token.refreshToken) : std::move(current->refreshToken);
    tokens.expiresAtEpochMs = expiryFrom(m_now(), token.expiresIn);
    m_store->saveTokens(tokens);
    return Unit{};
}

ApiResult<devauth::net::UserInfo> TokenEngine::getUserInfo() noexcept
{
    try
    {
        std::optional<devauth::storage::DeviceRegistration> reg{};
        std::optional<devauth::storage::TokenSet> tokens{};
        {
            std::lock_guard lock{ m_refreshMutex };
            reg = m_store->loadRegistration();
            if (!reg)
            {
                return notRegistered();
            }
            if (!m_store->loadTokens())
            {
                return ValidationError{ ValidationErrorCode::MissingAccessToken, "access token not found" };
            }

            auto refreshed{ refreshLocked(RefreshMode::IfExpired) };
            if (!isOk(refreshed))
            {
                return forwardError<devauth::net::UserInfo>(std::move(refreshed));
            }
            tokens = m_store->loadTokens();
        }
        if (!tokens)
        {
            return ValidationError{ ValidationErrorCode::MissingAccessToken, "access token not found" };
        }

        return callTransport<devauth::net::UserInfo>([&] {
            return m_transport->fetchUserInfo(reg->serverUrl, devauth::security::asStringView(tokens->accessToken));
        });
    }
    catch (const std::exception& e)
    {
        return storageFailure(e);
    }
}

ApiResult<Unit> TokenEngine::logout() noexcept
{
    try
    {
        std::lock_guard lock{ m_refreshMutex };
        m_store->clearTokens();
        return Unit{};
    }
    catch (const std::exception& e)
    {
        return storageFailure(e);
    }
}

bool TokenEngine::isLoggedIn() const noexcept
{
    try
    {
        const auto tokens{ m_store->loadTokens() };
        return tokens && !tokens->accessToken.empty() && m_now() < tokens->expiresAtEpochMs;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::optional<std::int64_t> TokenEngine::tokenExpiresAt() const noexcept
{
    try
    {
        const auto tokens{ m_store->loadTokens() };
        if (!tokens)
        {
            return std::nullopt;
        }
        return tokens->expiresAtEpochMs;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

std::future<ApiResult<Unit>> TokenEngine::exchangeCodeForTokenAsync(std::string code,
                                                                    devauth::security::SecureString codeVerifier)
{
    return std::async(std::launch::async, [this, code = std::move(code), verifier = std::move(codeVerifier)]() {
        return exchangeCodeForToken(code, verifier);
    });
}

std::future<ApiResult<Unit>> TokenEngine::refreshAccessTokenAsync()
{
    return std::async(std::launch::async, [this]() { return refreshAccessToken(); });
}

std::future<ApiResult<devauth::net::UserInfo>> TokenEngine::getUserInfoAsync()
{
    return std::async(std::launch::async, [this]() { return getUserInfo(); });
}

} // namespace devauth::core

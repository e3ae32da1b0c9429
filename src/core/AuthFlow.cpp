#include "devauth/core/AuthFlow.hpp"
#include "devauth/core/Pkce.hpp"
#include "devauth/net/Url.hpp"

namespace devauth::core
{
namespace
{

using devauth::storage::FlowKind;
using devauth::storage::PendingFlowState;

[[nodiscard]] std::optional<std::string> nonEmptyParam(const devauth::net::url::QueryParams& params,
                                                       std::string_view name)
{
    auto value{ devauth::net::url::findParam(params, name) };
    if (!value || value->empty())
    {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] CallbackKind routeParams(const devauth::net::url::QueryParams& params)
{
    if (nonEmptyParam(params, "error"))
    {
        return CallbackKind::Error;
    }
    if (nonEmptyParam(params, "iat"))
    {
        return CallbackKind::Enrollment;
    }
    if (nonEmptyParam(params, "code"))
    {
        return CallbackKind::Login;
    }
    return CallbackKind::Unknown;
}

[[nodiscard]] ValidationError stateMismatch()
{
    return ValidationError{ ValidationErrorCode::StateMismatch, "invalid state parameter (CSRF check failed)" };
}

} // namespace

AuthFlow::AuthFlow(RegistrationEngine& registration, TokenEngine& tokens,
                   devauth::storage::ICredentialStore& store) noexcept
    : m_registration(&registration), m_tokens(&tokens), m_store(&store)
{
}

ApiResult<std::string> AuthFlow::beginEnrollment(std::string_view serverUrl) noexcept
{
    try
    {
        if (serverUrl.empty())
        {
            return ValidationError{ ValidationErrorCode::MissingServerUrl, "server URL is required" };
        }

        std::string state{};
        try
        {
            state = pkce::newState();
        }
        catch (const std::runtime_error& e)
        {
            return ValidationError{ ValidationErrorCode::RandomFailed, e.what() };
        }

        m_store->savePendingFlow(FlowKind::Enrollment, PendingFlowState{ .state = state,
                                                                         .codeVerifier = std::nullopt,
                                                                         .serverUrl = std::string{ serverUrl } });
        return m_registration->buildEnrollmentUrl(serverUrl, state);
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
    }
}

ApiResult<std::string> AuthFlow::beginLogin() noexcept
{
    try
    {
        const auto reg{ m_registration->registration() };
        if (!reg || !m_registration->isDeviceRegistered())
        {
            return ValidationError{ ValidationErrorCode::NotRegistered, "device is not registered" };
        }

        std::string state{};
        devauth::security::SecureString verifier{};
        try
        {
            state = pkce::newState();
            verifier = pkce::newCodeVerifier();
        }
        catch (const std::runtime_error& e)
        {
            return ValidationError{ ValidationErrorCode::RandomFailed, e.what() };
        }
        const auto challenge{ pkce::codeChallenge(devauth::security::asStringView(verifier)) };

        m_store->savePendingFlow(FlowKind::Login, PendingFlowState{ .state = state,
                                                                    .codeVerifier = std::move(verifier),
                                                                    .serverUrl = reg->serverUrl });
        return m_tokens->buildAuthorizationUrl(reg->serverUrl, reg->clientId, state, challenge);
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
    }
}

CallbackKind AuthFlow::routeCallback(std::string_view uri) noexcept
{
    try
    {
        const auto params{ devauth::net::url::parseQuery(uri) };
        if (!params)
        {
            return CallbackKind::Unknown;
        }
        return routeParams(*params);
    }
    catch (const std::exception&)
    {
        return CallbackKind::Unknown;
    }
}

std::optional<PendingFlowState> AuthFlow::consumePending(FlowKind kind, const std::optional<std::string>& state)
{
    auto pending{ m_store->loadPendingFlow(kind) };
    // Single use either way: a mismatch aborts the attempt, a match consumes it.
    m_store->clearPendingFlow(kind);
    if (!pending || !state || !devauth::security::secureEquals(pending->state, *state))
    {
        return std::nullopt;
    }
    return pending;
}

ApiResult<CallbackOutcome> AuthFlow::handleCallback(std::string_view uri) noexcept
{
    try
    {
        const auto params{ devauth::net::url::parseQuery(uri) };
        if (!params)
        {
            return ValidationError{ ValidationErrorCode::MalformedCallback, "callback URI is not well formed" };
        }
        const auto state{ devauth::net::url::findParam(*params, "state") };

        switch (routeParams(*params))
        {
        case CallbackKind::Error:
        {
            const auto error{ nonEmptyParam(*params, "error") };
            const auto description{ nonEmptyParam(*params, "error_description") };
            m_store->clearPendingFlow(FlowKind::Enrollment);
            m_store->clearPendingFlow(FlowKind::Login);
            return ValidationError{ ValidationErrorCode::AuthorizationDenied,
                                    "OAuth error: " + description.value_or(error.value_or("unknown")) };
        }
        case CallbackKind::Enrollment:
        {
            const auto pending{ consumePending(FlowKind::Enrollment, state) };
            if (!pending)
            {
                return stateMismatch();
            }
            if (!pending->serverUrl || pending->serverUrl->empty())
            {
                return ValidationError{ ValidationErrorCode::MissingServerUrl, "enrollment has no server URL" };
            }

            auto iatParam{ *nonEmptyParam(*params, "iat") };
            const auto iat{ devauth::security::secureStringFrom(iatParam) };
            devauth::security::secureWipe(std::span<char>{ iatParam.data(), iatParam.size() });

            auto registered{ m_registration->registerDevice(*pending->serverUrl, iat) };
            if (!isOk(registered))
            {
                return forwardError<CallbackOutcome>(std::move(registered));
            }
            return CallbackOutcome{ .kind = CallbackKind::Enrollment,
                                    .clientId = std::move(std::get<std::string>(registered)) };
        }
        case CallbackKind::Login:
        {
            const auto pending{ consumePending(FlowKind::Login, state) };
            if (!pending)
            {
                return stateMismatch();
            }
            if (!pending->codeVerifier)
            {
                return ValidationError{ ValidationErrorCode::NoPendingFlow, "login has no code verifier" };
            }

            auto exchanged{ m_tokens->exchangeCodeForToken(*nonEmptyParam(*params, "code"), *pending->codeVerifier) };
            if (!isOk(exchanged))
            {
                return forwardError<CallbackOutcome>(std::move(exchanged));
            }
            return CallbackOutcome{ .kind = CallbackKind::Login, .clientId = std::nullopt };
        }
        case CallbackKind::Unknown:
            break;
        }
        return ValidationError{ ValidationErrorCode::MalformedCallback,
                                "unknown callback type: missing iat or code parameter" };
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
    }
}

ApiResult<Unit> AuthFlow::abandon(FlowKind kind) noexcept
{
    try
    {
        m_store->clearPendingFlow(kind);
        return Unit{};
    }
    catch (const std::exception& e)
    {
        return ValidationError{ ValidationErrorCode::StorageFailure, e.what() };
    }
}

} // namespace devauth::core

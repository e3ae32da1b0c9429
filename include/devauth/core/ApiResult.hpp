#ifndef INCLUDE_DEVAUTH_CORE_APIRESULT_HPP
#define INCLUDE_DEVAUTH_CORE_APIRESULT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace devauth::core
{

enum class ValidationErrorCode : std::uint8_t
{
    InvalidIat,
    NotRegistered,
    MissingAccessToken,
    MissingRefreshToken,
    StateMismatch,
    NoPendingFlow,
    MissingServerUrl,
    KeyStoreFailure,
    StorageFailure,
    RandomFailed,
    MalformedCallback,
    AuthorizationDenied,
};

[[nodiscard]] constexpr std::string_view validationErrorCodeName(ValidationErrorCode code) noexcept
{
    switch (code)
    {
    case ValidationErrorCode::InvalidIat:
        return "invalid_iat";
    case ValidationErrorCode::NotRegistered:
        return "not_registered";
    case ValidationErrorCode::MissingAccessToken:
        return "missing_access_token";
    case ValidationErrorCode::MissingRefreshToken:
        return "missing_refresh_token";
    case ValidationErrorCode::StateMismatch:
        return "state_mismatch";
    case ValidationErrorCode::NoPendingFlow:
        return "no_pending_flow";
    case ValidationErrorCode::MissingServerUrl:
        return "missing_server_url";
    case ValidationErrorCode::KeyStoreFailure:
        return "key_store_failure";
    case ValidationErrorCode::StorageFailure:
        return "storage_failure";
    case ValidationErrorCode::RandomFailed:
        return "random_failed";
    case ValidationErrorCode::MalformedCallback:
        return "malformed_callback";
    case ValidationErrorCode::AuthorizationDenied:
        return "authorization_denied";
    }
    return "unknown";
}

// Resolved locally, never retried automatically.
struct ValidationError final
{
    ValidationErrorCode code{ ValidationErrorCode::InvalidIat };
    std::string message;

    // Key-store failures cannot be recovered without a fresh registration.
    [[nodiscard]] bool isFatal() const noexcept
    {
        return code == ValidationErrorCode::KeyStoreFailure;
    }
};

// Non-2xx answer from the server.
struct ProtocolError final
{
    std::string message;
    std::optional<int> httpStatus;
};

// Connectivity, timeout or response-decoding failure. Eligible for caller-driven retry.
struct TransportError final
{
    std::string cause;
};

using Unit = std::monostate;

template <class T> using ApiResult = std::variant<T, ValidationError, ProtocolError, TransportError>;

template <class... Ts> struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

template <class T> [[nodiscard]] bool isOk(const ApiResult<T>& result) noexcept
{
    return result.index() == 0;
}

// Re-types an error result. Precondition: !isOk(result).
template <class To, class From> [[nodiscard]] ApiResult<To> forwardError(ApiResult<From>&& result)
{
    return std::visit(Overloaded{ [](From&&) -> ApiResult<To> {
                                     return TransportError{ "internal: forwardError on success" };
                                 },
                                  [](ValidationError&& e) -> ApiResult<To> { return std::move(e); },
                                  [](ProtocolError&& e) -> ApiResult<To> { return std::move(e); },
                                  [](TransportError&& e) -> ApiResult<To> { return std::move(e); } },
                      std::move(result));
}

template <class T> [[nodiscard]] std::string errorMessage(const ApiResult<T>& result)
{
    return std::visit(Overloaded{ [](const T&) { return std::string{}; },
                                  [](const ValidationError& e) { return e.message; },
                                  [](const ProtocolError& e) {
                                      if (e.httpStatus)
                                      {
                                          return e.message + " (HTTP " + std::to_string(*e.httpStatus) + ")";
                                      }
                                      return e.message;
                                  },
                                  [](const TransportError& e) { return e.cause; } },
                      result);
}

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_APIRESULT_HPP

#include "devauth/net/WireModels.hpp"
#include <cmath>
#include <limits>
#include <nlohmann/json.hpp>

namespace devauth::net
{
namespace
{

using nlohmann::json;

[[nodiscard]] json parseObject(std::string_view body, const char* what)
{
    auto parsed{ json::parse(body.begin(), body.end(), nullptr, false) };
    if (parsed.is_discarded() || !parsed.is_object())
    {
        throw MalformedResponse(std::string{ what } + ": body is not a JSON object");
    }
    return parsed;
}

[[nodiscard]] std::string requireString(const json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || !it->is_string())
    {
        throw MalformedResponse(std::string{ "missing string field '" } + key + "'");
    }
    return it->get<std::string>();
}

// null and absent both read as std::nullopt.
[[nodiscard]] std::optional<std::string> optionalString(const json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_string())
    {
        throw MalformedResponse(std::string{ "field '" } + key + "' is not a string");
    }
    return it->get<std::string>();
}

[[nodiscard]] std::optional<std::vector<std::string>> optionalStringList(const json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (!it->is_array())
    {
        throw MalformedResponse(std::string{ "field '" } + key + "' is not an array");
    }
    std::vector<std::string> out{};
    for (const auto& item : *it)
    {
        if (!item.is_string())
        {
            throw MalformedResponse(std::string{ "field '" } + key + "' holds a non-string");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

[[nodiscard]] std::optional<std::int64_t> optionalInt(const json& obj, const char* key)
{
    const auto it{ obj.find(key) };
    if (it == obj.end() || it->is_null())
    {
        return std::nullopt;
    }
    if (it->is_number_unsigned())
    {
        const auto value{ it->get<std::uint64_t>() };
        if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        {
            throw MalformedResponse(std::string{ "field '" } + key + "' is out of range");
        }
        return static_cast<std::int64_t>(value);
    }
    if (it->is_number_integer())
    {
        return it->get<std::int64_t>();
    }
    if (it->is_number_float())
    {
        const double value{ it->get<double>() };
        // 2^63 is exactly representable; anything at or above it does not fit.
        constexpr double upperBound{ static_cast<double>(std::numeric_limits<std::int64_t>::max()) };
        constexpr double lowerBound{ static_cast<double>(std::numeric_limits<std::int64_t>::min()) };
        if (!std::isfinite(value) || value < lowerBound || value >= upperBound)
        {
            throw MalformedResponse(std::string{ "field '" } + key + "' is out of range");
        }
        return static_cast<std::int64_t>(value);
    }
    throw MalformedResponse(std::string{ "field '" } + key + "' is not a number");
}

} // namespace

std::string ClientRegistrationRequest::toJson() const
{
    auto jwksObject{ json::parse(jwks, nullptr, false) };
    if (jwksObject.is_discarded() || !jwksObject.is_object())
    {
        throw std::invalid_argument("registration request: jwks is not a JSON object");
    }

    json body{ { "client_name", clientName },
               { "redirect_uris", redirectUris },
               { "grant_types", grantTypes },
               { "response_types", responseTypes },
               { "token_endpoint_auth_method", tokenEndpointAuthMethod },
               { "token_endpoint_auth_signing_alg", tokenEndpointAuthSigningAlg },
               { "scope", scope } };
    if (jwksUri)
    {
        body["jwks_uri"] = *jwksUri;
    }
    body["jwks"] = std::move(jwksObject);
    return body.dump();
}

SystemInfo parseSystemInfo(std::string_view body)
{
    const auto obj{ parseObject(body, "system info") };
    return SystemInfo{ .version = optionalString(obj, "version"),
                       .revision = optionalString(obj, "revision"),
                       .systemName = optionalString(obj, "systemName"),
                       .contextPath = optionalString(obj, "contextPath") };
}

ClientRegistrationResponse parseClientRegistrationResponse(std::string_view body)
{
    const auto obj{ parseObject(body, "registration response") };
    ClientRegistrationResponse out{};
    out.clientId = requireString(obj, "client_id");
    if (out.clientId.empty())
    {
        throw MalformedResponse("registration response: empty client_id");
    }
    out.clientIdIssuedAt = optionalInt(obj, "client_id_issued_at");
    out.clientName = optionalString(obj, "client_name");
    out.redirectUris = optionalStringList(obj, "redirect_uris");
    out.grantTypes = optionalStringList(obj, "grant_types");
    out.responseTypes = optionalStringList(obj, "response_types");
    out.tokenEndpointAuthMethod = optionalString(obj, "token_endpoint_auth_method");
    out.scope = optionalString(obj, "scope");
    return out;
}

TokenResponse parseTokenResponse(std::string_view body)
{
    const auto obj{ parseObject(body, "token response") };
    TokenResponse out{};
    out.accessToken = devauth::security::secureStringFrom(requireString(obj, "access_token"));
    if (out.accessToken.empty())
    {
        throw MalformedResponse("token response: empty access_token");
    }
    if (auto tokenType{ optionalString(obj, "token_type") }; tokenType)
    {
        out.tokenType = std::move(*tokenType);
    }
    const auto expiresIn{ optionalInt(obj, "expires_in") };
    if (!expiresIn || *expiresIn < 0)
    {
        throw MalformedResponse("token response: missing or negative expires_in");
    }
    if (*expiresIn > g_maxExpiresInSeconds)
    {
        throw MalformedResponse("token response: expires_in exceeds " + std::to_string(g_maxExpiresInSeconds) +
                                " seconds");
    }
    out.expiresIn = *expiresIn;
    if (const auto refresh{ optionalString(obj, "refresh_token") }; refresh && !refresh->empty())
    {
        out.refreshToken = devauth::security::secureStringFrom(*refresh);
    }
    out.scope = optionalString(obj, "scope");
    return out;
}

UserInfo parseUserInfo(std::string_view body)
{
    const auto obj{ parseObject(body, "user info") };
    return UserInfo{ .id = requireString(obj, "id"),
                     .username = requireString(obj, "username"),
                     .displayName = optionalString(obj, "displayName"),
                     .email = optionalString(obj, "email") };
}

std::string extractErrorMessage(std::string_view body)
{
    const auto parsed{ json::parse(body.begin(), body.end(), nullptr, false) };
    if (!parsed.is_discarded() && parsed.is_object())
    {
        for (const char* key : { "error_description", "error", "message" })
        {
            const auto it{ parsed.find(key) };
            if (it != parsed.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
            {
                return it->get<std::string>();
            }
        }
    }
    return std::string{ body };
}

} // namespace devauth::net

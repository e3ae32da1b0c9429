#ifndef INCLUDE_DEVAUTH_NET_WIREMODELS_HPP
#define INCLUDE_DEVAUTH_NET_WIREMODELS_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace devauth::net
{

constexpr std::string_view g_clientAssertionType{ "urn:ietf:params:oauth:client-assertion-type:jwt-bearer" };

// Longest token lifetime accepted from a server (ten years).
constexpr std::int64_t g_maxExpiresInSeconds{ 10LL * 365 * 24 * 60 * 60 };

// A 2xx body that does not have the documented shape.
class MalformedResponse final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct SystemInfo final
{
    std::optional<std::string> version;
    std::optional<std::string> revision;
    std::optional<std::string> systemName;
    std::optional<std::string> contextPath;
};

// RFC 7591 §2 client metadata, restricted to the fields this device sends.
struct ClientRegistrationRequest final
{
    std::string clientName;
    std::vector<std::string> redirectUris;
    std::vector<std::string> grantTypes;
    std::vector<std::string> responseTypes;
    std::string tokenEndpointAuthMethod;
    std::string tokenEndpointAuthSigningAlg;
    std::string scope;
    std::optional<std::string> jwksUri;
    // Serialized JWKS document, embedded as a nested object.
    std::string jwks;

    // Throws std::invalid_argument if `jwks` is not a JSON object.
    [[nodiscard]] std::string toJson() const;
};

struct ClientRegistrationResponse final
{
    std::string clientId;
    std::optional<std::int64_t> clientIdIssuedAt;
    std::optional<std::string> clientName;
    std::optional<std::vector<std::string>> redirectUris;
    std::optional<std::vector<std::string>> grantTypes;
    std::optional<std::vector<std::string>> responseTypes;
    std::optional<std::string> tokenEndpointAuthMethod;
    std::optional<std::string> scope;
};

struct TokenResponse final
{
    devauth::security::SecureString accessToken;
    std::string tokenType{ "Bearer" };
    std::int64_t expiresIn{ 0 };
    std::optional<devauth::security::SecureString> refreshToken;
    std::optional<std::string> scope;
};

struct UserInfo final
{
    std::string id;
    std::string username;
    std::optional<std::string> displayName;
    std::optional<std::string> email;
};

struct AuthorizationCodeGrant final
{
    std::string code;
    devauth::security::SecureString codeVerifier;
    std::string redirectUri;
    std::string clientId;
    std::string clientAssertion;
};

struct RefreshTokenGrant final
{
    devauth::security::SecureString refreshToken;
    std::string clientId;
    std::string clientAssertion;
};

// The parsers throw MalformedResponse.
[[nodiscard]] SystemInfo parseSystemInfo(std::string_view body);
[[nodiscard]] ClientRegistrationResponse parseClientRegistrationResponse(std::string_view body);
[[nodiscard]] TokenResponse parseTokenResponse(std::string_view body);
[[nodiscard]] UserInfo parseUserInfo(std::string_view body);

// Best human-readable message from an error body: `error_description`, then `error`, then
// `message`, then the raw body.
[[nodiscard]] std::string extractErrorMessage(std::string_view body);

} // namespace devauth::net

#endif // INCLUDE_DEVAUTH_NET_WIREMODELS_HPP

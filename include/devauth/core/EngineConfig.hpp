#ifndef INCLUDE_DEVAUTH_CORE_ENGINECONFIG_HPP
#define INCLUDE_DEVAUTH_CORE_ENGINECONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace devauth::core
{

struct EngineConfig final
{
    std::string redirectUri{ "dhis2oauth://oauth" };
    std::string deviceType{ "linux" };
    std::string deviceVersion{ "1.0" };
    std::string deviceAttestation{ "none" };
    std::string clientNamePrefix{ "DHIS2 Device Client" };
    std::string scope{ "openid profile username" };
    // Required by the registration endpoint but not used to fetch keys; the JWKS is sent inline.
    std::string jwksUri{ "https://dhis2.org/jwks.json" };
    std::chrono::seconds assertionTtl{ 60 };
    std::string deviceId;
};

// Milliseconds since the Unix epoch. Injected so tests can move time.
using NowProvider = std::function<std::int64_t()>;

[[nodiscard]] std::int64_t systemNowMs() noexcept;

} // namespace devauth::core

#endif // INCLUDE_DEVAUTH_CORE_ENGINECONFIG_HPP

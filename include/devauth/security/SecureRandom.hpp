#ifndef INCLUDE_DEVAUTH_SECURITY_SECURERANDOM_HPP
#define INCLUDE_DEVAUTH_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace devauth::security
{

// Fills `out` from the OS CSPRNG. Returns false if the kernel source fails.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

// RFC 4122 version 4 UUID in canonical lowercase form ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx").
[[nodiscard]] std::optional<std::string> secureRandomUuid();

} // namespace devauth::security

#endif // INCLUDE_DEVAUTH_SECURITY_SECURERANDOM_HPP

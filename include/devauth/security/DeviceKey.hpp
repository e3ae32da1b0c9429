#ifndef INCLUDE_DEVAUTH_SECURITY_DEVICEKEY_HPP
#define INCLUDE_DEVAUTH_SECURITY_DEVICEKEY_HPP

#include "devauth/security/SecureBuffer.hpp"
#include <cstddef>
#include <filesystem>

namespace devauth::security
{

constexpr std::size_t g_deviceKeyBytes{ 32 };

// Loads the device wrapping key from `keyFile`, creating it from the CSPRNG (mode 0600) on
// first use. Everything the credential store and key custody persist is sealed with this key.
//
// Throws std::runtime_error if the file cannot be created, has the wrong size, or is readable
// by group/others.
[[nodiscard]] SecureBuffer loadOrCreateDeviceKey(const std::filesystem::path& keyFile);

} // namespace devauth::security

#endif // INCLUDE_DEVAUTH_SECURITY_DEVICEKEY_HPP

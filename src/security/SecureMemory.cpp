#include "devauth/security/SecureMemory.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace devauth::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
    ::explicit_bzero(bytes.data(), bytes.size());
}

} // namespace devauth::security

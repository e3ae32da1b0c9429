#include "devauth/security/SecureRandom.hpp"
#include <array>
#include <cerrno>
#include <cstddef>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace devauth::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* outPtr{ out.data() };
    std::size_t remaining{ out.size() };

    while (remaining > 0U)
    {
        const ssize_t bytesReceived{ ::getrandom(outPtr, remaining, 0) };
        if (bytesReceived > 0)
        {
            const auto received{ static_cast<std::size_t>(bytesReceived) };
            if (received > remaining)
            {
                return false;
            }
            remaining -= received;
            outPtr += received;
            continue;
        }
        if (bytesReceived < 0 && errno == EINTR)
        {
            continue;
        }
        return false;
    }
    return true;
}

std::optional<std::string> secureRandomUuid()
{
    constexpr std::size_t kUuidBytes{ 16U };
    constexpr std::uint8_t kVersionMask{ 0x0FU };
    constexpr std::uint8_t kVersion4{ 0x40U };
    constexpr std::uint8_t kVariantMask{ 0x3FU };
    constexpr std::uint8_t kVariantRfc4122{ 0x80U };
    constexpr char kHex[] = "0123456789abcdef";

    std::array<std::uint8_t, kUuidBytes> bytes{};
    if (!secureRandomFill(std::span<std::uint8_t>{ bytes }))
    {
        return std::nullopt;
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & kVersionMask) | kVersion4);
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & kVariantMask) | kVariantRfc4122);

    std::string out{};
    out.reserve(36U);
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        if (i == 4U || i == 6U || i == 8U || i == 10U)
        {
            out.push_back('-');
        }
        out.push_back(kHex[(bytes[i] >> 4U) & 0x0FU]);
        out.push_back(kHex[bytes[i] & 0x0FU]);
    }
    return out;
}

} // namespace devauth::security

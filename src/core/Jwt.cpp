#include "devauth/core/Jwt.hpp"
#include "devauth/crypto/Encoding.hpp"
#include "devauth/security/SecureBuffer.hpp"
#include <array>

namespace devauth::core::jwt
{
namespace
{

constexpr std::size_t g_kSegments{ 3 };

// Splits on '.', requiring exactly three segments.
[[nodiscard]] std::optional<std::array<std::string_view, g_kSegments>> splitCompact(std::string_view token) noexcept
{
    std::array<std::string_view, g_kSegments> parts{};
    std::size_t start{ 0 };
    for (std::size_t i{ 0 }; i < g_kSegments; ++i)
    {
        const auto dot{ token.find('.', start) };
        const bool last{ i + 1 == g_kSegments };
        if (last)
        {
            if (dot != std::string_view::npos)
            {
                return std::nullopt;
            }
            parts[i] = token.substr(start);
            break;
        }
        if (dot == std::string_view::npos)
        {
            return std::nullopt;
        }
        parts[i] = token.substr(start, dot - start);
        start = dot + 1;
    }
    if (parts[0].empty() || parts[1].empty())
    {
        return std::nullopt;
    }
    return parts;
}

} // namespace

std::string encodeSegment(const nlohmann::json& value)
{
    return devauth::crypto::base64UrlEncode(std::string_view{ value.dump() });
}

std::optional<nlohmann::json> decodeSegment(std::string_view segment)
{
    const auto raw{ devauth::crypto::base64UrlDecode(segment) };
    if (!raw)
    {
        return std::nullopt;
    }
    auto parsed{ nlohmann::json::parse(raw->begin(), raw->end(), nullptr, false) };
    if (parsed.is_discarded() || !parsed.is_object())
    {
        return std::nullopt;
    }
    return parsed;
}

std::string signCompact(const nlohmann::json& header, const nlohmann::json& claims, const SignFn& sign)
{
    std::string signingInput{ encodeSegment(header) };
    signingInput.push_back('.');
    signingInput.append(encodeSegment(claims));

    const auto signature{ sign(devauth::security::asBytes(signingInput)) };

    std::string out{ std::move(signingInput) };
    out.push_back('.');
    out.append(devauth::crypto::base64UrlEncode(signature));
    return out;
}

std::optional<nlohmann::json> decodeClaims(std::string_view token)
{
    const auto parts{ splitCompact(token) };
    if (!parts)
    {
        return std::nullopt;
    }
    return decodeSegment((*parts)[1]);
}

std::optional<nlohmann::json> decodeHeader(std::string_view token)
{
    const auto parts{ splitCompact(token) };
    if (!parts)
    {
        return std::nullopt;
    }
    return decodeSegment((*parts)[0]);
}

bool isUnexpired(const nlohmann::json& claims, std::int64_t nowEpochSeconds) noexcept
{
    if (!claims.is_object())
    {
        return false;
    }
    const auto it{ claims.find("exp") };
    if (it == claims.end())
    {
        return false;
    }
    if (it->is_number_integer())
    {
        return it->get<std::int64_t>() > nowEpochSeconds;
    }
    if (it->is_number_float())
    {
        return it->get<double>() > static_cast<double>(nowEpochSeconds);
    }
    return false;
}

} // namespace devauth::core::jwt

#include "devauth/crypto/Encoding.hpp"
#include <memory>
#include <openssl/evp.h>
#include <stdexcept>

namespace devauth::crypto
{
namespace
{

constexpr std::string_view g_kAlphabet{ "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_" };
constexpr std::uint32_t g_kSextetMask{ 0x3FU };
constexpr std::uint32_t g_kByteMask{ 0xFFU };

[[nodiscard]] int sextetOf(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
    {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z')
    {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9')
    {
        return c - '0' + 52;
    }
    if (c == '-')
    {
        return 62;
    }
    if (c == '_')
    {
        return 63;
    }
    return -1;
}

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

} // namespace

std::string base64UrlEncode(std::span<const std::uint8_t> bytes)
{
    std::string out{};
    out.reserve(((bytes.size() + 2U) / 3U) * 4U);

    std::size_t i{};
    for (; i + 3U <= bytes.size(); i += 3U)
    {
        const std::uint32_t triple{ (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                                    (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U) |
                                    static_cast<std::uint32_t>(bytes[i + 2U]) };
        out.push_back(g_kAlphabet[(triple >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(triple >> 6U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[triple & g_kSextetMask]);
    }

    const std::size_t rest{ bytes.size() - i };
    if (rest == 1U)
    {
        const std::uint32_t v{ static_cast<std::uint32_t>(bytes[i]) << 16U };
        out.push_back(g_kAlphabet[(v >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(v >> 12U) & g_kSextetMask]);
    }
    else if (rest == 2U)
    {
        const std::uint32_t v{ (static_cast<std::uint32_t>(bytes[i]) << 16U) |
                               (static_cast<std::uint32_t>(bytes[i + 1U]) << 8U) };
        out.push_back(g_kAlphabet[(v >> 18U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(v >> 12U) & g_kSextetMask]);
        out.push_back(g_kAlphabet[(v >> 6U) & g_kSextetMask]);
    }
    return out;
}

std::string base64UrlEncode(std::string_view text)
{
    return base64UrlEncode(
        std::span<const std::uint8_t>{ reinterpret_cast<const std::uint8_t*>(text.data()), text.size() });
}

std::optional<std::vector<std::uint8_t>> base64UrlDecode(std::string_view text)
{
    while (!text.empty() && text.back() == '=')
    {
        text.remove_suffix(1U);
    }
    if (text.size() % 4U == 1U)
    {
        return std::nullopt;
    }

    std::vector<std::uint8_t> out{};
    out.reserve((text.size() * 3U) / 4U);

    std::uint32_t acc{};
    std::uint32_t bits{};
    for (const char c : text)
    {
        const int v{ sextetOf(c) };
        if (v < 0)
        {
            return std::nullopt;
        }
        acc = (acc << 6U) | static_cast<std::uint32_t>(v);
        bits += 6U;
        if (bits >= 8U)
        {
            bits -= 8U;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & g_kByteMask));
        }
    }
    return out;
}

Sha256Digest sha256(std::span<const std::byte> data)
{
    EvpMdCtxPtr ctx{ EVP_MD_CTX_new(), &EVP_MD_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("sha256: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
    {
        throw std::runtime_error("sha256: EVP_DigestUpdate failed");
    }

    Sha256Digest out{};
    unsigned int written{ 0U };
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &written) != 1 || written != out.size())
    {
        throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
    }
    return out;
}

} // namespace devauth::crypto

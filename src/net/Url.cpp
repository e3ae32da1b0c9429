#include "devauth/net/Url.hpp"

namespace devauth::net::url
{
namespace
{

constexpr std::string_view g_kHex{ "0123456789ABCDEF" };

[[nodiscard]] bool isUnreserved(unsigned char c) noexcept
{
    const bool alnum{ (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') };
    return alnum || c == '-' || c == '.' || c == '_' || c == '~';
}

[[nodiscard]] int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    return -1;
}

} // namespace

std::string percentEncode(std::string_view text)
{
    std::string out{};
    out.reserve(text.size());
    for (const char ch : text)
    {
        const auto c{ static_cast<unsigned char>(ch) };
        if (isUnreserved(c))
        {
            out.push_back(ch);
            continue;
        }
        out.push_back('%');
        out.push_back(g_kHex[c >> 4U]);
        out.push_back(g_kHex[c & 0x0FU]);
    }
    return out;
}

std::optional<std::string> percentDecode(std::string_view text, bool plusAsSpace)
{
    std::string out{};
    out.reserve(text.size());
    for (std::size_t i{ 0 }; i < text.size(); ++i)
    {
        const char c{ text[i] };
        if (c == '+' && plusAsSpace)
        {
            out.push_back(' ');
            continue;
        }
        if (c != '%')
        {
            out.push_back(c);
            continue;
        }
        if (i + 2 >= text.size())
        {
            return std::nullopt;
        }
        const int high{ hexValue(text[i + 1]) };
        const int low{ hexValue(text[i + 2]) };
        if (high < 0 || low < 0)
        {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
        i += 2;
    }
    return out;
}

std::string encodeQuery(const QueryParams& params)
{
    std::string out{};
    for (const auto& [key, value] : params)
    {
        if (!out.empty())
        {
            out.push_back('&');
        }
        out.append(percentEncode(key));
        out.push_back('=');
        out.append(percentEncode(value));
    }
    return out;
}

std::string appendQuery(std::string_view baseUrl, const QueryParams& params)
{
    std::string out{ baseUrl };
    if (params.empty())
    {
        return out;
    }
    out.push_back(baseUrl.find('?') == std::string_view::npos ? '?' : '&');
    out.append(encodeQuery(params));
    return out;
}

std::optional<QueryParams> parseQuery(std::string_view uri)
{
    QueryParams out{};
    const auto question{ uri.find('?') };
    if (question == std::string_view::npos)
    {
        return out;
    }
    auto query{ uri.substr(question + 1) };
    if (const auto hash{ query.find('#') }; hash != std::string_view::npos)
    {
        query = query.substr(0, hash);
    }

    while (!query.empty())
    {
        const auto amp{ query.find('&') };
        const auto pair{ query.substr(0, amp) };
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty())
        {
            continue;
        }

        const auto eq{ pair.find('=') };
        const auto rawKey{ pair.substr(0, eq) };
        const auto rawValue{ (eq == std::string_view::npos) ? std::string_view{} : pair.substr(eq + 1) };
        auto key{ percentDecode(rawKey, true) };
        auto value{ percentDecode(rawValue, true) };
        if (!key || !value)
        {
            return std::nullopt;
        }
        out.emplace_back(std::move(*key), std::move(*value));
    }
    return out;
}

std::optional<std::string> findParam(const QueryParams& params, std::string_view name)
{
    for (const auto& [key, value] : params)
    {
        if (key == name)
        {
            return value;
        }
    }
    return std::nullopt;
}

std::string joinPath(std::string_view baseUrl, std::string_view path)
{
    while (!baseUrl.empty() && baseUrl.back() == '/')
    {
        baseUrl.remove_suffix(1);
    }
    std::string out{ baseUrl };
    if (path.empty() || path.front() != '/')
    {
        out.push_back('/');
    }
    out.append(path);
    return out;
}

} // namespace devauth::net::url

#include "devauth/net/HttpHeaders.hpp"

namespace devauth::net
{

void addHeaderLine(std::map<std::string, std::string>& headers, std::string_view line)
{
    const auto colon{ line.find(':') };
    if (colon == std::string_view::npos)
    {
        return;
    }

    std::string key{ line.substr(0, colon) };
    for (auto& c : key)
    {
        if (c >= 'A' && c <= 'Z')
        {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    auto value{ line.substr(colon + 1) };
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
    {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
    {
        value.remove_suffix(1);
    }
    headers[std::move(key)] = std::string{ value };
}

} // namespace devauth::net

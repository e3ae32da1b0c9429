#ifndef INCLUDE_DEVAUTH_NET_HTTPHEADERS_HPP
#define INCLUDE_DEVAUTH_NET_HTTPHEADERS_HPP

#include <map>
#include <string>
#include <string_view>

namespace devauth::net
{

// Adds one raw response header line ("Name: value\r\n") to `headers`. The name is lowercased and
// the value trimmed; a repeated name keeps the last value. Lines without ':' (the status line,
// the blank terminator) are ignored.
void addHeaderLine(std::map<std::string, std::string>& headers, std::string_view line);

} // namespace devauth::net

#endif // INCLUDE_DEVAUTH_NET_HTTPHEADERS_HPP

#ifndef INCLUDE_DEVAUTH_NET_URL_HPP
#define INCLUDE_DEVAUTH_NET_URL_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace devauth::net::url
{

// Ordered, duplicates allowed.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Everything outside the RFC 3986 unreserved set becomes %XX (uppercase hex).
[[nodiscard]] std::string percentEncode(std::string_view text);

// std::nullopt on a truncated or non-hex escape. `plusAsSpace` selects form decoding.
[[nodiscard]] std::optional<std::string> percentDecode(std::string_view text, bool plusAsSpace);

// "k1=v1&k2=v2", both sides percent-encoded. Also used for form bodies.
[[nodiscard]] std::string encodeQuery(const QueryParams& params);

[[nodiscard]] std::string appendQuery(std::string_view baseUrl, const QueryParams& params);

// Parses the query component of `uri` (anything after the first '?', up to '#').
// std::nullopt if any escape is malformed. A uri without '?' yields an empty list.
[[nodiscard]] std::optional<QueryParams> parseQuery(std::string_view uri);

[[nodiscard]] std::optional<std::string> findParam(const QueryParams& params, std::string_view name);

// joinPath("https://h/", "/api/me") == "https://h/api/me"
[[nodiscard]] std::string joinPath(std::string_view baseUrl, std::string_view path);

} // namespace devauth::net::url

#endif // INCLUDE_DEVAUTH_NET_URL_HPP

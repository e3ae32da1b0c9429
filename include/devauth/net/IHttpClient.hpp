#ifndef INCLUDE_DEVAUTH_NET_IHTTPCLIENT_HPP
#define INCLUDE_DEVAUTH_NET_IHTTPCLIENT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace devauth::net
{

enum class HttpMethod : std::uint8_t
{
    Get,
    Post,
};

struct HttpRequest final
{
    HttpMethod method{ HttpMethod::Get };
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse final
{
    int statusCode{ 0 };
    std::string body;
    std::map<std::string, std::string> headers;

    [[nodiscard]] bool isSuccess() const noexcept
    {
        return statusCode >= 200 && statusCode < 300;
    }
};

struct TransportOptions final
{
    std::chrono::seconds connectTimeout{ 15 };
    std::chrono::seconds totalTimeout{ 30 };
    std::string userAgent{ "devauth/1.0" };
    bool verifyTls{ true };
    std::optional<std::string> caBundlePath;
};

// No HTTP exchange happened (DNS, connect, TLS, timeout).
class TransportFailure final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Raw request/response exchange. Any status code is a response; only a failed exchange throws
// TransportFailure.
class IHttpClient
{
public:
    IHttpClient() = default;
    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;
    virtual ~IHttpClient() = default;

    [[nodiscard]] virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace devauth::net

#endif // INCLUDE_DEVAUTH_NET_IHTTPCLIENT_HPP

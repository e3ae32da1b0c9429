#ifndef INCLUDE_DEVAUTH_NET_CURL_CURLHTTPCLIENTFACTORY_HPP
#define INCLUDE_DEVAUTH_NET_CURL_CURLHTTPCLIENTFACTORY_HPP

#include "devauth/net/IHttpClient.hpp"
#include <memory>

namespace devauth::net::curl
{

// Throws TransportFailure if libcurl cannot be initialized.
[[nodiscard]] std::unique_ptr<devauth::net::IHttpClient> makeCurlHttpClient(devauth::net::TransportOptions options);

} // namespace devauth::net::curl

#endif // INCLUDE_DEVAUTH_NET_CURL_CURLHTTPCLIENTFACTORY_HPP

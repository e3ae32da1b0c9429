#include "devauth/net/curl/CurlHttpClientFactory.hpp"
#include "devauth/net/HttpHeaders.hpp"

#include <curl/curl.h>
#include <mutex>
#include <string>

namespace devauth::net::curl
{
namespace
{

using CurlEasyPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlSlistPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

// curl_global_init is not thread-safe; a function-local static runs it exactly once.
struct CurlGlobal final
{
    CurlGlobal() noexcept : ok(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK)
    {
    }
    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
    CurlGlobal(CurlGlobal&&) = delete;
    CurlGlobal& operator=(CurlGlobal&&) = delete;
    ~CurlGlobal()
    {
        if (ok)
        {
            curl_global_cleanup();
        }
    }

    bool ok;
};

[[nodiscard]] bool ensureCurlGlobal() noexcept
{
    static const CurlGlobal g_kGlobal{};
    return g_kGlobal.ok;
}

std::size_t writeBody(char* data, std::size_t size, std::size_t nmemb, void* userp)
{
    auto* body{ static_cast<std::string*>(userp) };
    const std::size_t total{ size * nmemb };
    body->append(data, total);
    return total;
}

std::size_t writeHeader(char* data, std::size_t size, std::size_t nmemb, void* userp)
{
    auto* headers{ static_cast<std::map<std::string, std::string>*>(userp) };
    const std::size_t total{ size * nmemb };
    addHeaderLine(*headers, std::string_view{ data, total });
    return total;
}

void setOpt(CURLcode rc)
{
    if (rc != CURLE_OK)
    {
        throw TransportFailure(std::string{ "curl: setopt failed: " } + curl_easy_strerror(rc));
    }
}

class CurlHttpClient final : public devauth::net::IHttpClient
{
public:
    explicit CurlHttpClient(TransportOptions options)
        : m_options{ std::move(options) }, m_curl{ nullptr, &curl_easy_cleanup }
    {
        if (!ensureCurlGlobal())
        {
            throw TransportFailure("curl: curl_global_init failed");
        }
        m_curl.reset(curl_easy_init());
        if (!m_curl)
        {
            throw TransportFailure("curl: curl_easy_init failed");
        }
    }

    [[nodiscard]] HttpResponse send(const HttpRequest& request) override
    {
        std::lock_guard lock{ m_mutex };
        CURL* curl{ m_curl.get() };
        curl_easy_reset(curl);

        HttpResponse response{};

        setOpt(curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str()));
        setOpt(curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L));
        setOpt(curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(m_options.connectTimeout.count())));
        setOpt(curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(m_options.totalTimeout.count())));
        // Tokens and IATs must not be replayed to another host.
        setOpt(curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L));
        setOpt(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, m_options.verifyTls ? 1L : 0L));
        setOpt(curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, m_options.verifyTls ? 2L : 0L));
        if (m_options.caBundlePath)
        {
            setOpt(curl_easy_setopt(curl, CURLOPT_CAINFO, m_options.caBundlePath->c_str()));
        }
        setOpt(curl_easy_setopt(curl, CURLOPT_USERAGENT, m_options.userAgent.c_str()));

        setOpt(curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, &writeBody));
        setOpt(curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body));
        setOpt(curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, &writeHeader));
        setOpt(curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers));

        CurlSlistPtr headerList{ nullptr, &curl_slist_free_all };
        for (const auto& [key, value] : request.headers)
        {
            const std::string line{ key + ": " + value };
            curl_slist* appended{ curl_slist_append(headerList.get(), line.c_str()) };
            if (appended == nullptr)
            {
                throw TransportFailure("curl: curl_slist_append failed");
            }
            (void)headerList.release();
            headerList.reset(appended);
        }
        if (headerList)
        {
            setOpt(curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList.get()));
        }

        if (request.method == HttpMethod::Post)
        {
            setOpt(curl_easy_setopt(curl, CURLOPT_POST, 1L));
            setOpt(curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size())));
            setOpt(curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str()));
        }
        else
        {
            setOpt(curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L));
        }

        const CURLcode rc{ curl_easy_perform(curl) };
        if (rc != CURLE_OK)
        {
            throw TransportFailure(curl_easy_strerror(rc));
        }

        long status{ 0 };
        setOpt(curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status));
        response.statusCode = static_cast<int>(status);
        return response;
    }

private:
    TransportOptions m_options;
    CurlEasyPtr m_curl;
    std::mutex m_mutex;
};

} // namespace

[[nodiscard]] std::unique_ptr<devauth::net::IHttpClient> makeCurlHttpClient(devauth::net::TransportOptions options)
{
    return std::make_unique<CurlHttpClient>(std::move(options));
}

} // namespace devauth::net::curl

/// @file curl_fetcher.cpp
/// @brief Implementation of the libcurl JsonFetcher.

#include "net/curl_fetcher.hpp"

#include "core/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <utility>

namespace skybrief::net
{

namespace
{
    std::once_flag g_curl_init_flag;

    size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata)
    {
        auto* body = static_cast<std::string*>(userdata);
        body->append(ptr, size * nmemb);
        return size * nmemb;
    }

    /// @brief Progress hook: a non-zero return aborts the transfer.
    int progress_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
    {
        const auto* stop = static_cast<const std::stop_token*>(userdata);
        return stop->stop_requested() ? 1 : 0;
    }

    struct CurlHandleDeleter
    {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };

    using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

} // namespace

CurlFetcher::CurlFetcher(std::string user_agent)
    : m_user_agent(std::move(user_agent))
{
    std::call_once(g_curl_init_flag, []
    {
        const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK)
        {
            SKB_CORE_ERROR("CurlFetcher: curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

FetchOutcome CurlFetcher::fetch_json(const std::string& url,
                                     std::chrono::milliseconds timeout,
                                     std::stop_token stop)
{
    if (stop.stop_requested())
    {
        return FetchError{FetchErrorKind::Cancelled, "cancelled before request"};
    }

    CurlHandle curl{curl_easy_init()};
    if (!curl)
    {
        return FetchError{FetchErrorKind::Network, "curl_easy_init failed"};
    }

    std::string body;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, m_user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);

    const CURLcode rc = curl_easy_perform(curl.get());

    if (rc == CURLE_OPERATION_TIMEDOUT)
    {
        return FetchError{FetchErrorKind::Timeout, curl_easy_strerror(rc)};
    }
    if (rc == CURLE_ABORTED_BY_CALLBACK)
    {
        return FetchError{FetchErrorKind::Cancelled, "transfer aborted by stop request"};
    }
    if (rc != CURLE_OK)
    {
        return FetchError{FetchErrorKind::Network, curl_easy_strerror(rc)};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

    SKB_CORE_TRACE("CurlFetcher: GET {} -> {} ({} bytes)", url, status, body.size());

    return HttpResponse{.status = status, .body = std::move(body)};
}

} // namespace skybrief::net

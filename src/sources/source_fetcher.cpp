/// @file source_fetcher.cpp
/// @brief Implementation of the budgeted live fetch.

#include "sources/source_fetcher.hpp"

#include "core/logger.hpp"

#include <fmt/format.h>

#include <utility>

namespace skybrief::sources
{

SourceFetcher::SourceFetcher(net::JsonFetcher& fetcher,
                             const core::SourceSettings& settings,
                             std::stop_token stop)
    : m_fetcher(fetcher)
    , m_deadline(std::chrono::steady_clock::now() + settings.timeout)
    , m_retry(settings.retry_on_network_error)
    , m_stop(std::move(stop))
{
}

std::chrono::milliseconds SourceFetcher::remaining() const
{
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        m_deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

JsonOutcome SourceFetcher::get_json(const std::string& url)
{
    auto budget = remaining();
    if (budget.count() == 0)
    {
        return SourceFailure{FailureKind::Timeout, "time budget exhausted before " + url};
    }

    auto outcome = attempt(url, budget);

    const auto* failure = std::get_if<SourceFailure>(&outcome);
    if (failure && failure->kind == FailureKind::Network && m_retry && !stop_requested())
    {
        budget = remaining();
        if (budget.count() > 0)
        {
            SKB_CORE_DEBUG("SourceFetcher: reissuing {} after network error: {}", url, failure->detail);
            outcome = attempt(url, budget);
        }
    }

    return outcome;
}

JsonOutcome SourceFetcher::attempt(const std::string& url, std::chrono::milliseconds timeout)
{
    const auto result = m_fetcher.fetch_json(url, timeout, m_stop);

    if (const auto* error = std::get_if<net::FetchError>(&result))
    {
        switch (error->kind)
        {
            case net::FetchErrorKind::Timeout:
                return SourceFailure{FailureKind::Timeout, error->message};
            case net::FetchErrorKind::Cancelled:
                return SourceFailure{FailureKind::Cancelled, error->message};
            case net::FetchErrorKind::Network:
                return SourceFailure{FailureKind::Network, error->message};
        }
        return SourceFailure{FailureKind::Network, error->message};
    }

    const auto& response = std::get<net::HttpResponse>(result);
    if (response.status < 200 || response.status > 299)
    {
        return SourceFailure{FailureKind::HttpStatus, fmt::format("HTTP {}", response.status)};
    }

    auto doc = nlohmann::json::parse(response.body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded())
    {
        return SourceFailure{FailureKind::MalformedPayload, "response body is not valid JSON"};
    }
    return JsonOutcome{std::in_place_index<0>, std::move(doc)};
}

std::string SourceFetcher::with_query(
    std::string_view base,
    std::initializer_list<std::pair<std::string_view, std::string>> params)
{
    std::string url{base};
    char separator = url.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params)
    {
        url += separator;
        url += key;
        url += '=';
        url += value;
        separator = '&';
    }
    return url;
}

} // namespace skybrief::sources

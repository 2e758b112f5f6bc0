#pragma once

/// @file curl_fetcher.hpp
/// @brief libcurl-backed JsonFetcher.

#include "net/json_fetcher.hpp"

#include <string>

namespace skybrief::net
{
    /// @brief Blocking GET via a fresh curl easy handle per request.
    ///
    /// Global libcurl initialisation happens once, on first construction.
    class CurlFetcher final : public JsonFetcher
    {
    public:
        explicit CurlFetcher(std::string user_agent = "skybrief/0.1");

        [[nodiscard]] FetchOutcome fetch_json(const std::string& url,
                                              std::chrono::milliseconds timeout,
                                              std::stop_token stop) override;

    private:
        std::string m_user_agent;
    };

} // namespace skybrief::net

#pragma once

/// @file source_fetcher.hpp
/// @brief Deadline-bounded JSON fetch with a single reissue on network error.

#include "core/config.hpp"
#include "net/json_fetcher.hpp"
#include "sources/source_result.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <initializer_list>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace skybrief::sources
{
    using JsonOutcome = std::variant<nlohmann::json, SourceFailure>;

    /// @brief One live stage of one calculator.
    ///
    /// The configured timeout is a budget for the whole stage, starting at
    /// construction: each request gets whatever remains. A network error is
    /// reissued once if budget remains and the settings allow it; a timeout
    /// is never reissued. Non-2xx and unparsable bodies become failures.
    class SourceFetcher
    {
    public:
        SourceFetcher(net::JsonFetcher& fetcher, const core::SourceSettings& settings, std::stop_token stop);

        [[nodiscard]] JsonOutcome get_json(const std::string& url);

        [[nodiscard]] std::chrono::milliseconds remaining() const;

        [[nodiscard]] bool stop_requested() const { return m_stop.stop_requested(); }

        /// @brief base + "?k1=v1&k2=v2". Values are appended verbatim.
        [[nodiscard]] static std::string with_query(
            std::string_view base,
            std::initializer_list<std::pair<std::string_view, std::string>> params);

    private:
        [[nodiscard]] JsonOutcome attempt(const std::string& url, std::chrono::milliseconds timeout);

        net::JsonFetcher&                     m_fetcher;
        std::chrono::steady_clock::time_point m_deadline;
        bool                                  m_retry;
        std::stop_token                       m_stop;
    };

} // namespace skybrief::sources

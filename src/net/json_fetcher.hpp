#pragma once

/// @file json_fetcher.hpp
/// @brief Abstract "fetch JSON from URL with timeout" capability.

#include <chrono>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace skybrief::net
{
    /// @brief Completed HTTP exchange, any status code.
    struct HttpResponse
    {
        long        status;
        std::string body;
    };

    enum class FetchErrorKind
    {
        Timeout,
        Network,
        Cancelled,
    };

    struct FetchError
    {
        FetchErrorKind kind;
        std::string    message;
    };

    using FetchOutcome = std::variant<HttpResponse, FetchError>;

    [[nodiscard]] constexpr std::string_view to_string(FetchErrorKind kind)
    {
        switch (kind)
        {
            case FetchErrorKind::Timeout:   return "timeout";
            case FetchErrorKind::Network:   return "network";
            case FetchErrorKind::Cancelled: return "cancelled";
        }
        return "unknown";
    }

    /// @brief One GET per call. Implementations must honour @p timeout as an
    /// upper bound on the whole exchange and abandon the transfer when
    /// @p stop is requested. Must be safe to call from several threads.
    class JsonFetcher
    {
    public:
        virtual ~JsonFetcher() = default;

        [[nodiscard]] virtual FetchOutcome fetch_json(const std::string& url,
                                                      std::chrono::milliseconds timeout,
                                                      std::stop_token stop) = 0;
    };

} // namespace skybrief::net

#pragma once

/// @file event_time.hpp
/// @brief Rise/set/crossing result: an instant, or the reason there is none.

#include "astro/instant.hpp"

#include <optional>
#include <string_view>
#include <variant>

namespace skybrief::astro
{
    /// @brief Why a horizon or twilight crossing did not happen.
    enum class NoEventReason : u8
    {
        AlwaysAbove,    ///< Body stays above the threshold (polar day, circumpolar)
        AlwaysBelow,    ///< Body stays below the threshold (polar night)
        NotInWindow,    ///< Crossing exists but falls outside the searched day
    };

    struct NoEvent
    {
        NoEventReason reason;

        [[nodiscard]] bool operator==(const NoEvent&) const = default;
    };

    /// @brief Either the crossing instant or a NoEvent.
    ///
    /// "Does not occur" is a valid result, never an error and never the
    /// same thing as an unavailable data source.
    using EventTime = std::variant<Instant, NoEvent>;

    [[nodiscard]] inline bool occurs(const EventTime& event)
    {
        return std::holds_alternative<Instant>(event);
    }

    [[nodiscard]] inline std::optional<Instant> instant_of(const EventTime& event)
    {
        if (const auto* at = std::get_if<Instant>(&event))
        {
            return *at;
        }
        return std::nullopt;
    }

    [[nodiscard]] constexpr std::string_view to_string(NoEventReason reason)
    {
        switch (reason)
        {
            case NoEventReason::AlwaysAbove: return "always_above";
            case NoEventReason::AlwaysBelow: return "always_below";
            case NoEventReason::NotInWindow: return "not_in_window";
        }
        return "unknown";
    }

} // namespace skybrief::astro

#pragma once

/// @file briefing_record.hpp
/// @brief Structured (JSON) form of a briefing for machine consumers.

#include "briefing/briefing_synthesizer.hpp"

#include <nlohmann/json.hpp>

namespace skybrief::briefing
{
    /// @brief Nested tree whose leaves are strings, numbers, booleans or null.
    ///
    /// Timestamps are ISO-8601 in the location's offset. Rise/set style
    /// events are objects {"status": "occurs" | "always_above" |
    /// "always_below" | "not_in_window", "time": string | null}.
    [[nodiscard]] nlohmann::json to_record(const DailyBriefing& briefing);

    [[nodiscard]] nlohmann::json to_record(const TonightSummary& summary);

    [[nodiscard]] nlohmann::json to_record(const astro::EventTime& event);

    [[nodiscard]] nlohmann::json to_record(const ViewingConditionsScore& score);

} // namespace skybrief::briefing

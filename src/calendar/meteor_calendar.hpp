#pragma once

/// @file meteor_calendar.hpp
/// @brief Yearly-recurring meteor shower table.

#include "core/types.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace skybrief::calendar
{
    /// @brief One annual shower. Dates carry no year; a window may wrap
    /// across New Year (active_end before active_start).
    struct MeteorShower
    {
        std::string          name;
        std::chrono::month_day active_start;
        std::chrono::month_day active_end;
        std::chrono::month_day peak;
        i32                  zhr;              ///< Zenithal hourly rate at peak
        std::string          parent_body;
        std::string          radiant;          ///< Constellation the radiant lies in
        i32                  speed_km_s;

        /// @brief Inclusive at both ends.
        [[nodiscard]] bool is_active(const std::chrono::year_month_day& date) const;

        [[nodiscard]] bool wraps_year() const { return active_end < active_start; }

        /// @brief Signed days from @p date to the nearest peak (negative once past).
        [[nodiscard]] i32 days_to_peak(const std::chrono::year_month_day& date) const;
    };

    enum class ShowerRating : u8
    {
        Poor,
        Fair,
        Good,
        Excellent,
    };

    [[nodiscard]] std::string_view to_string(ShowerRating rating);

    class MeteorCalendar
    {
    public:
        MeteorCalendar() = delete;

        /// @brief The eleven major annual showers, built once, never mutated.
        [[nodiscard]] static const std::vector<MeteorShower>& showers();

        [[nodiscard]] static std::vector<MeteorShower> active_on(const std::chrono::year_month_day& date);

        /// @brief Showers whose next peak falls within [date, date + days].
        [[nodiscard]] static std::vector<MeteorShower> peaking_within(const std::chrono::year_month_day& date,
                                                                     i32 days);

        /// @brief ZHR scaled by distance from peak: ×1 on the day, ×0.7 within
        /// 2 days, ×0.4 within 5, ×0.2 beyond.
        [[nodiscard]] static f64 effective_zhr(const MeteorShower& shower, const std::chrono::year_month_day& date);

        /// @brief ≥80 Excellent, ≥40 Good, ≥15 Fair, otherwise Poor.
        [[nodiscard]] static ShowerRating rate(f64 effective_zhr);
    };

} // namespace skybrief::calendar

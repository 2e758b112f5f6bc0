#pragma once

/// @file eclipse_calendar.hpp
/// @brief Solar and lunar eclipses 2025-2030.

#include "astro/instant.hpp"
#include "core/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skybrief::calendar
{
    enum class EclipseKind : u8
    {
        TotalSolar,
        AnnularSolar,
        PartialSolar,
        HybridSolar,
        TotalLunar,
        PartialLunar,
        PenumbralLunar,
    };

    /// @brief "total_solar", "penumbral_lunar", ...
    [[nodiscard]] std::string_view to_string(EclipseKind kind);

    /// @brief "Total solar eclipse", "Penumbral lunar eclipse", ...
    [[nodiscard]] std::string_view display_name(EclipseKind kind);

    struct EclipseEvent
    {
        EclipseKind                  kind;
        std::chrono::year_month_day  date;              ///< UTC date of greatest eclipse
        astro::Instant               maximum;
        std::optional<f64>           duration_minutes;  ///< Totality or annularity; none for partials
        f64                          magnitude;
        std::vector<std::string>     regions;
        std::string                  notes;

        [[nodiscard]] bool is_solar() const;

        /// @brief Signed whole days from @p date to the eclipse date.
        [[nodiscard]] i32 days_until(const std::chrono::year_month_day& date) const;

        /// @brief True if the eclipse falls on @p date or within @p horizon_days after it.
        [[nodiscard]] bool is_upcoming(const std::chrono::year_month_day& date, i32 horizon_days) const;

        /// @brief "Europe, Africa and Asia".
        [[nodiscard]] std::string region_text() const;
    };

    class EclipseCalendar
    {
    public:
        EclipseCalendar() = delete;

        static constexpr i32 kFirstYear = 2025;
        static constexpr i32 kLastYear  = 2030;

        /// @brief Chronological table, built once.
        [[nodiscard]] static const std::vector<EclipseEvent>& events();

        [[nodiscard]] static std::vector<EclipseEvent> on(const std::chrono::year_month_day& date);

        /// @brief Eclipses within (date, date + horizon_days], soonest first.
        [[nodiscard]] static std::vector<EclipseEvent> upcoming(const std::chrono::year_month_day& date,
                                                                i32 horizon_days);

        /// @brief True if @p date lies inside the table's coverage.
        [[nodiscard]] static bool covers(const std::chrono::year_month_day& date);
    };

} // namespace skybrief::calendar

#pragma once

/// @file instant.hpp
/// @brief Timezone-aware calculation epoch.

#include "core/types.hpp"

#include <chrono>
#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace skybrief::astro
{
    /// @brief A UTC time point paired with the fixed UTC offset it is viewed in.
    ///
    /// Ordering and equality compare the UTC time point only; the offset
    /// decides which civil date "today" is and how timestamps are printed.
    /// Offsets are limited to ±14 h, whole minutes.
    class Instant
    {
    public:
        static constexpr std::chrono::minutes kMaxUtcOffset{14 * 60};

        /// @brief Build from a UTC time point and an offset.
        /// @return std::nullopt if the offset is outside ±14 h.
        [[nodiscard]] static std::optional<Instant> from_utc(
            std::chrono::sys_seconds utc,
            std::chrono::minutes utc_offset = std::chrono::minutes{0});

        /// @brief Build from a Julian Date (UTC).
        [[nodiscard]] static Instant from_julian_date(
            f64 jd, std::chrono::minutes utc_offset = std::chrono::minutes{0});

        /// @brief Civil local date and time in the given offset.
        [[nodiscard]] static std::optional<Instant> from_local(
            const std::chrono::year_month_day& date,
            std::chrono::seconds time_of_day,
            std::chrono::minutes utc_offset);

        /// @brief Current system clock time.
        [[nodiscard]] static Instant now(std::chrono::minutes utc_offset = std::chrono::minutes{0});

        /// @brief Parse ISO-8601 "YYYY-MM-DD[T| ]HH:MM[:SS[.fff]]<zone>".
        ///
        /// Zone is "Z", "±HH:MM", "±HHMM" or "±HH". A timestamp with no zone
        /// designator is rejected unless @p assumed_offset is given.
        [[nodiscard]] static std::optional<Instant> parse_iso8601(
            std::string_view text,
            std::optional<std::chrono::minutes> assumed_offset = std::nullopt);

        [[nodiscard]] std::chrono::sys_seconds utc() const { return m_utc; }
        [[nodiscard]] std::chrono::minutes utc_offset() const { return m_offset; }

        [[nodiscard]] f64 julian_date() const;

        /// @brief Same UTC time point viewed in another offset.
        [[nodiscard]] Instant with_offset(std::chrono::minutes utc_offset) const;

        /// @brief Civil date in this instant's offset.
        [[nodiscard]] std::chrono::year_month_day local_date() const;

        /// @brief Time since local midnight.
        [[nodiscard]] std::chrono::seconds local_time_of_day() const;

        /// @brief Local midnight that starts local_date().
        [[nodiscard]] Instant local_midnight() const;

        /// @brief "2024-01-25T17:54:00+00:00"
        [[nodiscard]] std::string to_iso8601() const;

        /// @brief "17:54" local.
        [[nodiscard]] std::string to_local_hhmm() const;

        [[nodiscard]] Instant operator+(std::chrono::seconds delta) const;
        [[nodiscard]] Instant operator-(std::chrono::seconds delta) const;
        [[nodiscard]] std::chrono::seconds operator-(const Instant& other) const;

        [[nodiscard]] bool operator==(const Instant& other) const { return m_utc == other.m_utc; }
        [[nodiscard]] std::strong_ordering operator<=>(const Instant& other) const
        {
            return m_utc <=> other.m_utc;
        }

    private:
        Instant(std::chrono::sys_seconds utc, std::chrono::minutes utc_offset)
            : m_utc(utc), m_offset(utc_offset)
        {
        }

        std::chrono::sys_seconds m_utc;
        std::chrono::minutes m_offset;
    };

} // namespace skybrief::astro

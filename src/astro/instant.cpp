/// @file instant.cpp
/// @brief Instant construction, ISO-8601 parsing and formatting.

#include "astro/instant.hpp"

#include "astro/time_system.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdlib>

namespace skybrief::astro
{

namespace
{
    /// @brief Parse exactly text.size() decimal digits.
    std::optional<i32> parse_digits(std::string_view text)
    {
        if (text.empty())
        {
            return std::nullopt;
        }
        for (const char c : text)
        {
            if (c < '0' || c > '9')
            {
                return std::nullopt;
            }
        }

        i32 value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr != text.data() + text.size())
        {
            return std::nullopt;
        }
        return value;
    }

    /// @brief Zone designator → offset. Empty text is handled by the caller.
    std::optional<std::chrono::minutes> parse_zone(std::string_view zone)
    {
        if (zone == "Z" || zone == "z")
        {
            return std::chrono::minutes{0};
        }
        if (zone.size() < 3 || (zone[0] != '+' && zone[0] != '-'))
        {
            return std::nullopt;
        }

        const i32 sign = zone[0] == '-' ? -1 : 1;
        zone.remove_prefix(1);

        const auto hours = parse_digits(zone.substr(0, 2));
        zone.remove_prefix(2);
        if (!zone.empty() && zone[0] == ':')
        {
            zone.remove_prefix(1);
        }

        std::optional<i32> minutes = 0;
        if (!zone.empty())
        {
            minutes = zone.size() == 2 ? parse_digits(zone) : std::nullopt;
        }

        if (!hours || !minutes || *minutes >= 60)
        {
            return std::nullopt;
        }
        return std::chrono::minutes{sign * (*hours * 60 + *minutes)};
    }

} // namespace

// -----------------------------------------------------------------
// Construction
// -----------------------------------------------------------------

std::optional<Instant> Instant::from_utc(std::chrono::sys_seconds utc, std::chrono::minutes utc_offset)
{
    if (std::chrono::abs(utc_offset) > kMaxUtcOffset)
    {
        return std::nullopt;
    }
    return Instant{utc, utc_offset};
}

Instant Instant::from_julian_date(f64 jd, std::chrono::minutes utc_offset)
{
    return Instant{TimeSystem::to_sys_seconds(jd), utc_offset};
}

std::optional<Instant> Instant::from_local(const std::chrono::year_month_day& date,
                                           std::chrono::seconds time_of_day,
                                           std::chrono::minutes utc_offset)
{
    if (!date.ok())
    {
        return std::nullopt;
    }
    const auto local = std::chrono::sys_days{date} + time_of_day;
    return from_utc(local - utc_offset, utc_offset);
}

Instant Instant::now(std::chrono::minutes utc_offset)
{
    const auto utc = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return Instant{utc, utc_offset};
}

// -----------------------------------------------------------------
// ISO-8601: YYYY-MM-DD[T| ]HH:MM[:SS[.fff]][zone]
// -----------------------------------------------------------------

std::optional<Instant> Instant::parse_iso8601(std::string_view text,
                                              std::optional<std::chrono::minutes> assumed_offset)
{
    constexpr std::size_t kDateTimeMinLength = 16; // "YYYY-MM-DDTHH:MM"
    if (text.size() < kDateTimeMinLength
        || text[4] != '-' || text[7] != '-'
        || (text[10] != 'T' && text[10] != 't' && text[10] != ' ')
        || text[13] != ':')
    {
        return std::nullopt;
    }

    const auto year   = parse_digits(text.substr(0, 4));
    const auto month  = parse_digits(text.substr(5, 2));
    const auto day    = parse_digits(text.substr(8, 2));
    const auto hour   = parse_digits(text.substr(11, 2));
    const auto minute = parse_digits(text.substr(14, 2));
    if (!year || !month || !day || !hour || !minute || *hour > 23 || *minute > 59)
    {
        return std::nullopt;
    }

    std::string_view rest = text.substr(kDateTimeMinLength);
    i32 second = 0;
    if (!rest.empty() && rest[0] == ':')
    {
        const auto sec = rest.size() >= 3 ? parse_digits(rest.substr(1, 2)) : std::nullopt;
        if (!sec || *sec > 60)
        {
            return std::nullopt;
        }
        second = *sec == 60 ? 59 : *sec;
        rest.remove_prefix(3);

        // Fractional seconds are truncated
        if (!rest.empty() && (rest[0] == '.' || rest[0] == ','))
        {
            rest.remove_prefix(1);
            std::size_t digits = 0;
            while (digits < rest.size() && rest[digits] >= '0' && rest[digits] <= '9')
            {
                ++digits;
            }
            if (digits == 0)
            {
                return std::nullopt;
            }
            rest.remove_prefix(digits);
        }
    }

    std::optional<std::chrono::minutes> offset;
    if (rest.empty())
    {
        offset = assumed_offset;
    }
    else
    {
        offset = parse_zone(rest);
    }
    if (!offset)
    {
        return std::nullopt;
    }

    const std::chrono::year_month_day date{
        std::chrono::year{*year},
        std::chrono::month{static_cast<unsigned>(*month)},
        std::chrono::day{static_cast<unsigned>(*day)}};

    const std::chrono::seconds time_of_day{*hour * 3600 + *minute * 60 + second};
    return from_local(date, time_of_day, *offset);
}

// -----------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------

f64 Instant::julian_date() const
{
    return TimeSystem::to_julian_date(m_utc);
}

Instant Instant::with_offset(std::chrono::minutes utc_offset) const
{
    return Instant{m_utc, utc_offset};
}

std::chrono::year_month_day Instant::local_date() const
{
    return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(m_utc + m_offset)};
}

std::chrono::seconds Instant::local_time_of_day() const
{
    const auto local = m_utc + m_offset;
    return local - std::chrono::floor<std::chrono::days>(local);
}

Instant Instant::local_midnight() const
{
    return Instant{m_utc - local_time_of_day(), m_offset};
}

std::string Instant::to_iso8601() const
{
    const auto local = m_utc + m_offset;
    const auto day_start = std::chrono::floor<std::chrono::days>(local);
    const std::chrono::year_month_day ymd{day_start};
    const std::chrono::hh_mm_ss hms{local - day_start};

    const auto offset_minutes = m_offset.count();
    const char sign = offset_minutes < 0 ? '-' : '+';
    const auto abs_minutes = std::abs(offset_minutes);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}{}{:02}:{:02}",
                       static_cast<i32>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       hms.hours().count(),
                       hms.minutes().count(),
                       hms.seconds().count(),
                       sign,
                       abs_minutes / 60,
                       abs_minutes % 60);
}

std::string Instant::to_local_hhmm() const
{
    const std::chrono::hh_mm_ss hms{local_time_of_day()};
    return fmt::format("{:02}:{:02}", hms.hours().count(), hms.minutes().count());
}

Instant Instant::operator+(std::chrono::seconds delta) const
{
    return Instant{m_utc + delta, m_offset};
}

Instant Instant::operator-(std::chrono::seconds delta) const
{
    return Instant{m_utc - delta, m_offset};
}

std::chrono::seconds Instant::operator-(const Instant& other) const
{
    return m_utc - other.m_utc;
}

} // namespace skybrief::astro

/// @file test_instant.cpp
/// @brief Unit tests for skybrief::astro::Instant and the input validators.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/instant.hpp"
#include "core/errors.hpp"
#include "sources/geo_location.hpp"

#include <chrono>
#include <cmath>
#include <limits>

using namespace skybrief;
using namespace skybrief::astro;
using namespace std::chrono;

// =================================================================
// Construction
// =================================================================

TEST_CASE("from_utc rejects offsets beyond ±14 h")
{
    const sys_seconds t = sys_days{2024y / March / 20};
    CHECK(Instant::from_utc(t, minutes{14 * 60}).has_value());
    CHECK(Instant::from_utc(t, minutes{-14 * 60}).has_value());
    CHECK_FALSE(Instant::from_utc(t, minutes{14 * 60 + 1}).has_value());
}

TEST_CASE("from_local applies the offset to reach UTC")
{
    const auto at = Instant::from_local(year_month_day{2024y / July / 1}, hours{22}, minutes{120});
    REQUIRE(at.has_value());
    CHECK(at->utc() == sys_days{2024y / July / 1} + 20h);
    CHECK(at->local_date() == year_month_day{2024y / July / 1});
}

TEST_CASE("from_local rejects impossible dates")
{
    CHECK_FALSE(Instant::from_local(year_month_day{2023y / February / 29}, hours{0}, minutes{0}).has_value());
}

// =================================================================
// Local calendar views
// =================================================================

TEST_CASE("Local date follows the offset across midnight")
{
    const auto utc = Instant::from_utc(sys_days{2024y / January / 25} + 23h + 30min);
    REQUIRE(utc.has_value());

    CHECK(utc->local_date() == year_month_day{2024y / January / 25});
    CHECK(utc->with_offset(minutes{60}).local_date() == year_month_day{2024y / January / 26});
    CHECK(utc->with_offset(minutes{-300}).local_time_of_day() == hours{18} + minutes{30});
}

TEST_CASE("local_midnight starts the local day")
{
    const auto at = Instant::from_utc(sys_days{2024y / January / 25} + 3h, minutes{-300});
    REQUIRE(at.has_value());

    // 03:00 UTC is 22:00 the previous evening at UTC-5
    const auto midnight = at->local_midnight();
    CHECK(midnight.local_date() == year_month_day{2024y / January / 24});
    CHECK(midnight.local_time_of_day() == seconds{0});
    CHECK(midnight.utc() == sys_days{2024y / January / 24} + 5h);
}

TEST_CASE("Equality and ordering ignore the display offset")
{
    const auto a = Instant::from_utc(sys_days{2024y / January / 1}, minutes{0});
    REQUIRE(a.has_value());
    const auto b = a->with_offset(minutes{330});

    CHECK(*a == b);
    CHECK((*a + seconds{1}) > b);
    CHECK(((*a + hours{2}) - b) == seconds{7200});
}

// =================================================================
// Formatting
// =================================================================

TEST_CASE("to_iso8601 prints local time with the offset")
{
    const auto at = Instant::from_utc(sys_days{2024y / January / 25} + 17h + 54min);
    REQUIRE(at.has_value());

    CHECK(at->to_iso8601() == "2024-01-25T17:54:00+00:00");
    CHECK(at->with_offset(minutes{330}).to_iso8601() == "2024-01-25T23:24:00+05:30");
    CHECK(at->with_offset(minutes{-480}).to_iso8601() == "2024-01-25T09:54:00-08:00");
    CHECK(at->with_offset(minutes{-480}).to_local_hhmm() == "09:54");
}

// =================================================================
// Parsing
// =================================================================

TEST_CASE("parse_iso8601 accepts the common zone forms")
{
    const sys_seconds expected = sys_days{2024y / January / 25} + 17h + 54min;

    SUBCASE("Z")
    {
        const auto at = Instant::parse_iso8601("2024-01-25T17:54:00Z");
        REQUIRE(at.has_value());
        CHECK(at->utc() == expected);
    }

    SUBCASE("±HH:MM")
    {
        const auto at = Instant::parse_iso8601("2024-01-25T19:54:00+02:00");
        REQUIRE(at.has_value());
        CHECK(at->utc() == expected);
        CHECK(at->utc_offset() == minutes{120});
    }

    SUBCASE("±HHMM without seconds")
    {
        const auto at = Instant::parse_iso8601("2024-01-25T12:54-0500");
        REQUIRE(at.has_value());
        CHECK(at->utc() == expected);
    }

    SUBCASE("fractional seconds are truncated")
    {
        const auto at = Instant::parse_iso8601("2024-01-25 17:54:00.987+00");
        REQUIRE(at.has_value());
        CHECK(at->utc() == expected);
    }
}

TEST_CASE("parse_iso8601 without a zone needs an assumed offset")
{
    CHECK_FALSE(Instant::parse_iso8601("2024-01-25T17:54").has_value());

    const auto at = Instant::parse_iso8601("2024-01-25T17:54", minutes{0});
    REQUIRE(at.has_value());
    CHECK(at->utc() == sys_days{2024y / January / 25} + 17h + 54min);
}

TEST_CASE("parse_iso8601 rejects malformed text")
{
    CHECK_FALSE(Instant::parse_iso8601("").has_value());
    CHECK_FALSE(Instant::parse_iso8601("2024/01/25T17:54Z").has_value());
    CHECK_FALSE(Instant::parse_iso8601("2024-01-25T25:00Z").has_value());
    CHECK_FALSE(Instant::parse_iso8601("2024-13-01T00:00Z").has_value());
    CHECK_FALSE(Instant::parse_iso8601("2024-01-25T17:54:00X").has_value());
}

// =================================================================
// Input validation
// =================================================================

TEST_CASE("Location validation")
{
    using sources::GeoLocation;

    CHECK_FALSE(sources::validate(GeoLocation{.latitude_deg = 51.5, .longitude_deg = -0.1}).has_value());
    CHECK(sources::validate(GeoLocation{.latitude_deg = 91.0, .longitude_deg = 0.0}).has_value());
    CHECK(sources::validate(GeoLocation{.latitude_deg = 0.0, .longitude_deg = -180.5}).has_value());
    CHECK(sources::validate(GeoLocation{.latitude_deg = std::numeric_limits<f64>::quiet_NaN()}).has_value());
    CHECK(sources::validate(GeoLocation{.latitude_deg = 0.0, .longitude_deg = 0.0,
                                        .elevation_m = std::nullopt, .utc_offset_minutes = 15 * 60})
              .has_value());
}

TEST_CASE("Instants outside 1900-2100 are rejected")
{
    const auto old = Instant::from_utc(sys_days{1850y / June / 1});
    const auto ok = Instant::from_utc(sys_days{2024y / June / 1});
    REQUIRE(old.has_value());
    REQUIRE(ok.has_value());

    CHECK(sources::validate(*old).has_value());
    CHECK_FALSE(sources::validate(*ok).has_value());

    const sources::GeoLocation greenwich{.latitude_deg = 51.48, .longitude_deg = 0.0};
    CHECK_THROWS_AS(sources::require_valid(greenwich, *old), InvalidInputError);
    CHECK_NOTHROW(sources::require_valid(greenwich, *ok));
}

TEST_CASE("local_instant prefers the location's offset")
{
    const auto at = Instant::from_utc(sys_days{2024y / June / 1}, minutes{60});
    REQUIRE(at.has_value());

    const sources::GeoLocation plain{.latitude_deg = 0.0, .longitude_deg = 0.0};
    const sources::GeoLocation tokyo{.latitude_deg = 35.7, .longitude_deg = 139.7,
                                     .elevation_m = std::nullopt, .utc_offset_minutes = 540};

    CHECK(sources::local_instant(plain, *at).utc_offset() == minutes{60});
    CHECK(sources::local_instant(tokyo, *at).utc_offset() == minutes{540});
    CHECK(sources::local_instant(tokyo, *at) == *at);
}

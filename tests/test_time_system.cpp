/// @file test_time_system.cpp
/// @brief Unit tests for skybrief::astro::TimeSystem.
///
/// Verifies Julian Date conversion (Meeus algorithm), GMST (IAU 1982),
/// LMST, and round-trip consistency against known reference values.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cmath>

using namespace skybrief;
using namespace skybrief::astro;
using namespace std::chrono;

// =================================================================
// Tolerances
// =================================================================

static constexpr f64 kJdTolerance = 1e-9;   // Relative; ~0.2 s at JD 2.4e6
static constexpr f64 kAngleTolRad = 1e-6;

// =================================================================
// Julian Date conversion tests
// =================================================================

TEST_CASE("J2000.0 epoch gives JD 2451545.0")
{
    const f64 jd = TimeSystem::to_julian_date(year_month_day{2000y / January / 1}, 12.0);
    CHECK(jd == doctest::Approx(2451545.0).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 1999-01-01 00:00 UTC → JD 2451179.5")
{
    const f64 jd = TimeSystem::to_julian_date(year_month_day{1999y / January / 1});
    CHECK(jd == doctest::Approx(2451179.5).epsilon(kJdTolerance));
}

TEST_CASE("Known date: 2024-06-15 22:30:00 UTC")
{
    const f64 jd = TimeSystem::to_julian_date(year_month_day{2024y / June / 15}, 22.5);
    CHECK(jd == doctest::Approx(2460477.4375).epsilon(kJdTolerance));
}

TEST_CASE("January and February use the previous year in Meeus")
{
    // 2024-02-29 is a leap day; 2024-03-01 must be exactly one day later
    const f64 leap = TimeSystem::to_julian_date(year_month_day{2024y / February / 29});
    const f64 march = TimeSystem::to_julian_date(year_month_day{2024y / March / 1});
    CHECK(march - leap == doctest::Approx(1.0));
}

TEST_CASE("Calendar and system-clock conversions agree")
{
    const sys_seconds utc = sys_days{2024y / January / 25} + 17h + 54min;
    const f64 from_clock = TimeSystem::to_julian_date(utc);
    const f64 from_calendar = TimeSystem::to_julian_date(year_month_day{2024y / January / 25}, 17.0 + 54.0 / 60.0);
    CHECK(from_clock == doctest::Approx(from_calendar).epsilon(kJdTolerance));
}

TEST_CASE("Unix epoch is JD 2440587.5")
{
    CHECK(TimeSystem::to_julian_date(sys_seconds{}) == doctest::Approx(2440587.5));
}

// =================================================================
// Round trips
// =================================================================

TEST_CASE("JD → sys_seconds → JD round trip within one second")
{
    const f64 jd = 2460334.74583;
    const auto utc = TimeSystem::to_sys_seconds(jd);
    const f64 back = TimeSystem::to_julian_date(utc);
    CHECK(std::abs(back - jd) * astro_constants::kSecondsPerDay <= 1.0);
}

TEST_CASE("to_calendar_date returns the UT day containing the JD")
{
    // JD 2451545.0 is noon on 2000-01-01; JD 2451544.5 is midnight of the same day
    CHECK(TimeSystem::to_calendar_date(2451545.0) == year_month_day{2000y / January / 1});
    CHECK(TimeSystem::to_calendar_date(2451544.5) == year_month_day{2000y / January / 1});
    CHECK(TimeSystem::to_calendar_date(2451544.49) == year_month_day{1999y / December / 31});
}

// =================================================================
// Julian centuries
// =================================================================

TEST_CASE("Julian centuries at J2000 is zero and one century later is one")
{
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000) == doctest::Approx(0.0));
    CHECK(TimeSystem::julian_centuries(astro_constants::kJ2000 + 36525.0) == doctest::Approx(1.0));
    CHECK(TimeSystem::days_since_j2000(astro_constants::kJ2000 - 10.0) == doctest::Approx(-10.0));
}

// =================================================================
// Sidereal time
// =================================================================

TEST_CASE("GMST at J2000.0 is 280.46°")
{
    const f64 gmst = TimeSystem::gmst(astro_constants::kJ2000);
    CHECK(gmst == doctest::Approx(280.46061837 * astro_constants::kDegToRad).epsilon(kAngleTolRad));
}

TEST_CASE("GMST is always within [0, 2π)")
{
    for (f64 jd = 2451000.0; jd < 2470000.0; jd += 1234.567)
    {
        const f64 gmst = TimeSystem::gmst(jd);
        CHECK(gmst >= 0.0);
        CHECK(gmst < astro_constants::kTwoPi);
    }
}

TEST_CASE("LMST is GMST plus east longitude")
{
    const f64 jd = 2460334.5;
    const f64 lon = 90.0 * astro_constants::kDegToRad;
    const f64 expected = TimeSystem::normalize_radians(TimeSystem::gmst(jd) + lon);
    CHECK(TimeSystem::lmst(jd, lon) == doctest::Approx(expected).epsilon(kAngleTolRad));
}

TEST_CASE("Sidereal day is about 3 min 56 s shorter than a solar day")
{
    // After one solar day GMST advances by ~0.9856°
    const f64 jd = 2460000.5;
    const f64 advance = TimeSystem::normalize_radians(TimeSystem::gmst(jd + 1.0) - TimeSystem::gmst(jd));
    CHECK(advance * astro_constants::kRadToDeg == doctest::Approx(0.98565).epsilon(1e-3));
}

// =================================================================
// Angle normalization
// =================================================================

TEST_CASE("normalize_degrees wraps negative and large angles")
{
    CHECK(TimeSystem::normalize_degrees(-30.0) == doctest::Approx(330.0));
    CHECK(TimeSystem::normalize_degrees(725.0) == doctest::Approx(5.0));
    CHECK(TimeSystem::normalize_degrees(0.0) == doctest::Approx(0.0));
}

TEST_CASE("normalize_radians wraps into [0, 2π)")
{
    CHECK(TimeSystem::normalize_radians(-astro_constants::kHalfPi)
          == doctest::Approx(1.5 * astro_constants::kPi));
    CHECK(TimeSystem::normalize_radians(5.0 * astro_constants::kPi)
          == doctest::Approx(astro_constants::kPi));
}

/// @file test_eclipse_calendar.cpp
/// @brief Unit tests for the eclipse table and the eclipse calculator.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "calendar/eclipse_calendar.hpp"
#include "core/logger.hpp"
#include "sources/eclipse_calculator.hpp"

#include <algorithm>
#include <chrono>

using namespace skybrief;
using namespace skybrief::calendar;
using namespace std::chrono;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    skybrief::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skybrief::core::Logger::shutdown();
    return result;
}

static sources::CalculationContext context_at(const sources::GeoLocation& location, sys_seconds utc)
{
    const auto at = astro::Instant::from_utc(utc);
    REQUIRE(at.has_value());
    return sources::CalculationContext{.location = location, .instant = *at};
}

// =================================================================
// Table integrity
// =================================================================

TEST_CASE("Table is chronological and within its years")
{
    const auto& events = EclipseCalendar::events();
    REQUIRE(events.size() == 25);

    for (std::size_t i = 0; i < events.size(); ++i)
    {
        const auto& e = events[i];
        CAPTURE(i);
        CHECK(static_cast<i32>(e.date.year()) >= EclipseCalendar::kFirstYear);
        CHECK(static_cast<i32>(e.date.year()) <= EclipseCalendar::kLastYear);
        CHECK(e.maximum.local_date() == e.date);
        CHECK_FALSE(e.regions.empty());
        if (i > 0)
        {
            CHECK(events[i - 1].maximum < e.maximum);
        }
    }
}

TEST_CASE("Only central eclipses and total lunar eclipses carry a duration")
{
    for (const auto& e : EclipseCalendar::events())
    {
        const bool central = e.kind == EclipseKind::TotalSolar || e.kind == EclipseKind::AnnularSolar
                          || e.kind == EclipseKind::HybridSolar || e.kind == EclipseKind::TotalLunar;
        CAPTURE(to_string(e.kind));
        CHECK(e.duration_minutes.has_value() == central);
    }
}

TEST_CASE("Kind names")
{
    CHECK(to_string(EclipseKind::TotalSolar) == "total_solar");
    CHECK(to_string(EclipseKind::PenumbralLunar) == "penumbral_lunar");
    CHECK(display_name(EclipseKind::AnnularSolar) == "Annular solar eclipse");
    CHECK(display_name(EclipseKind::TotalLunar) == "Total lunar eclipse");
}

// =================================================================
// Queries
// =================================================================

TEST_CASE("Total solar eclipse of 2026-08-12")
{
    const auto today = EclipseCalendar::on(2026y / August / 12);
    REQUIRE(today.size() == 1);

    const auto& e = today.front();
    CHECK(e.kind == EclipseKind::TotalSolar);
    CHECK(e.is_solar());
    CHECK(e.days_until(2026y / August / 12) == 0);
    CHECK(e.is_upcoming(2026y / August / 12, 0));
    CHECK(e.region_text() == "Arctic, Greenland, Iceland and Spain");

    CHECK(EclipseCalendar::on(2026y / August / 13).empty());
}

TEST_CASE("upcoming excludes today and is soonest first")
{
    const auto from_march_1 = EclipseCalendar::upcoming(2025y / March / 1, 30);
    REQUIRE(from_march_1.size() == 2);
    CHECK(from_march_1[0].kind == EclipseKind::TotalLunar);
    CHECK(from_march_1[1].kind == EclipseKind::PartialSolar);

    const auto from_march_14 = EclipseCalendar::upcoming(2025y / March / 14, 30);
    REQUIRE(from_march_14.size() == 1);
    CHECK(from_march_14[0].date == year_month_day{2025y / March / 29});

    CHECK(EclipseCalendar::upcoming(2025y / April / 1, 30).empty());
}

TEST_CASE("days_until and is_upcoming")
{
    const auto& first = EclipseCalendar::events().front();
    CHECK(first.days_until(2025y / March / 4) == 10);
    CHECK(first.days_until(2025y / March / 24) == -10);
    CHECK(first.is_upcoming(2025y / March / 4, 10));
    CHECK_FALSE(first.is_upcoming(2025y / March / 4, 9));
    CHECK_FALSE(first.is_upcoming(2025y / March / 24, 365));
}

TEST_CASE("Coverage is 2025 through 2030")
{
    CHECK_FALSE(EclipseCalendar::covers(2024y / December / 31));
    CHECK(EclipseCalendar::covers(2025y / January / 1));
    CHECK(EclipseCalendar::covers(2030y / December / 31));
    CHECK_FALSE(EclipseCalendar::covers(2031y / January / 1));
}

// =================================================================
// Calculator
// =================================================================

TEST_CASE("Lunar eclipse visibility depends on the Moon being up")
{
    // Total lunar eclipse 2025-09-07, maximum 18:11 UTC
    const sources::GeoLocation delhi{.latitude_deg = 28.61, .longitude_deg = 77.21};
    const sources::GeoLocation new_york{.latitude_deg = 40.71, .longitude_deg = -74.01};
    const sys_seconds evening = sys_days{2025y / September / 7} + 12h;

    const auto in_delhi = sources::EclipseCalculator::outlook_for(context_at(delhi, evening), 30);
    const auto in_new_york = sources::EclipseCalculator::outlook_for(context_at(new_york, evening), 30);

    REQUIRE(in_delhi.today.size() == 1);
    REQUIRE(in_new_york.today.size() == 1);
    CHECK(in_delhi.today[0].above_horizon_at_maximum);
    CHECK_FALSE(in_new_york.today[0].above_horizon_at_maximum);
    CHECK(in_delhi.covered);
}

TEST_CASE("Solar eclipse above the horizon from Spain")
{
    const sources::GeoLocation madrid{.latitude_deg = 40.42, .longitude_deg = -3.70};
    const sources::GeoLocation sydney{.latitude_deg = -33.87, .longitude_deg = 151.21};
    const sys_seconds before = sys_days{2026y / August / 1} + 12h;

    const auto from_madrid = sources::EclipseCalculator::outlook_for(context_at(madrid, before), 30);
    const auto from_sydney = sources::EclipseCalculator::outlook_for(context_at(sydney, before), 30);

    const auto total = [](const sources::EclipseOutlook& o)
    {
        return std::find_if(o.upcoming.begin(), o.upcoming.end(), [](const sources::EclipseSighting& s)
                            { return s.event.kind == EclipseKind::TotalSolar; });
    };

    const auto madrid_total = total(from_madrid);
    const auto sydney_total = total(from_sydney);
    REQUIRE(madrid_total != from_madrid.upcoming.end());
    REQUIRE(sydney_total != from_sydney.upcoming.end());
    CHECK(madrid_total->days_until == 11);
    CHECK(madrid_total->above_horizon_at_maximum);

    // 17:46 UTC is the middle of the night in Sydney
    CHECK_FALSE(sydney_total->above_horizon_at_maximum);
}

TEST_CASE("Eclipse calculator outside the table's years")
{
    const sources::EclipseCalculator calc{365};
    const sources::GeoLocation london{.latitude_deg = 51.5, .longitude_deg = -0.12};
    const auto ctx = context_at(london, sys_days{2024y / June / 1});

    const auto result = calc.compute(ctx.location, ctx.instant);
    CHECK(result.provenance() == sources::Provenance::LocalFallback);
    CHECK_FALSE(result.value().covered);
    CHECK(result.value().today.empty());

    // March 2025 events are still within a year
    CHECK(result.value().upcoming.size() == 2);
}

/// @file test_meteor_calendar.cpp
/// @brief Unit tests for the meteor shower table and the meteor calculator.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "calendar/meteor_calendar.hpp"
#include "core/logger.hpp"
#include "sources/meteor_calculator.hpp"

#include <algorithm>
#include <chrono>
#include <string>

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

// =================================================================
// Helpers
// =================================================================

static MeteorShower make_shower(month_day start, month_day end, month_day peak, i32 zhr = 100)
{
    return MeteorShower{
        .name         = "Test shower",
        .active_start = start,
        .active_end   = end,
        .peak         = peak,
        .zhr          = zhr,
        .parent_body  = "Test comet",
        .radiant      = "Test",
        .speed_km_s   = 40,
    };
}

static const MeteorShower& shower_named(const std::string& name)
{
    const auto& all = MeteorCalendar::showers();
    const auto it = std::find_if(all.begin(), all.end(), [&name](const MeteorShower& s) { return s.name == name; });
    REQUIRE(it != all.end());
    return *it;
}

static bool contains(const std::vector<MeteorShower>& showers, const std::string& name)
{
    return std::any_of(showers.begin(), showers.end(), [&name](const MeteorShower& s) { return s.name == name; });
}

// =================================================================
// Activity window
// =================================================================

TEST_CASE("Active window [Dec 4, Dec 17]")
{
    const auto shower = make_shower(December / 4, December / 17, December / 14);

    CHECK(shower.is_active(2024y / December / 10));
    CHECK_FALSE(shower.is_active(2024y / December / 20));

    // Inclusive at both ends
    CHECK(shower.is_active(2024y / December / 4));
    CHECK(shower.is_active(2024y / December / 17));
    CHECK_FALSE(shower.is_active(2024y / December / 3));
    CHECK_FALSE(shower.wraps_year());
}

TEST_CASE("Window wrapping New Year")
{
    const auto shower = make_shower(December / 28, January / 12, January / 4);

    CHECK(shower.wraps_year());
    CHECK(shower.is_active(2024y / December / 31));
    CHECK(shower.is_active(2025y / January / 1));
    CHECK(shower.is_active(2025y / January / 12));
    CHECK_FALSE(shower.is_active(2025y / January / 13));
    CHECK_FALSE(shower.is_active(2024y / December / 27));
    CHECK_FALSE(shower.is_active(2024y / July / 1));
}

// =================================================================
// Days to peak
// =================================================================

TEST_CASE("days_to_peak is signed and picks the nearest year")
{
    const auto& quadrantids = shower_named("Quadrantids");
    const auto& ursids = shower_named("Ursids");

    CHECK(quadrantids.days_to_peak(2024y / December / 30) == 5);
    CHECK(quadrantids.days_to_peak(2025y / January / 4) == 0);
    CHECK(quadrantids.days_to_peak(2025y / January / 6) == -2);
    CHECK(ursids.days_to_peak(2025y / January / 1) == -10);
}

// =================================================================
// Table
// =================================================================

TEST_CASE("Table holds the eleven major showers")
{
    const auto& all = MeteorCalendar::showers();
    CHECK(all.size() == 11);

    for (const auto& s : all)
    {
        CAPTURE(s.name);
        CHECK(s.zhr > 0);
        CHECK(s.speed_km_s > 0);
        CHECK(s.active_start.ok());
        CHECK(s.active_end.ok());
        // The peak always lies inside the window
        CHECK(s.is_active(year{2025} / s.peak.month() / s.peak.day()));
    }

    CHECK(&MeteorCalendar::showers() == &all);
}

TEST_CASE("Geminids are active mid-December, Perseids in August")
{
    const auto december = MeteorCalendar::active_on(2024y / December / 13);
    CHECK(contains(december, "Geminids"));
    CHECK_FALSE(contains(december, "Perseids"));

    const auto august = MeteorCalendar::active_on(2024y / August / 12);
    CHECK(contains(august, "Perseids"));
    CHECK(contains(august, "Delta Aquariids"));

    CHECK(MeteorCalendar::active_on(2024y / March / 1).empty());
}

TEST_CASE("peaking_within lists future peaks soonest first")
{
    const auto soon = MeteorCalendar::peaking_within(2024y / December / 1, 30);
    REQUIRE(soon.size() == 2);
    CHECK(soon[0].name == "Geminids");
    CHECK(soon[1].name == "Ursids");

    CHECK(MeteorCalendar::peaking_within(2024y / March / 1, 10).empty());
}

// =================================================================
// Rates and ratings
// =================================================================

TEST_CASE("Effective ZHR falls off with distance from peak")
{
    const auto& geminids = shower_named("Geminids");

    CHECK(MeteorCalendar::effective_zhr(geminids, 2024y / December / 14) == doctest::Approx(150.0));
    CHECK(MeteorCalendar::effective_zhr(geminids, 2024y / December / 12) == doctest::Approx(105.0));
    CHECK(MeteorCalendar::effective_zhr(geminids, 2024y / December / 9) == doctest::Approx(60.0));
    CHECK(MeteorCalendar::effective_zhr(geminids, 2024y / December / 5) == doctest::Approx(30.0));
}

TEST_CASE("Rating thresholds")
{
    CHECK(MeteorCalendar::rate(120.0) == ShowerRating::Excellent);
    CHECK(MeteorCalendar::rate(80.0) == ShowerRating::Excellent);
    CHECK(MeteorCalendar::rate(79.9) == ShowerRating::Good);
    CHECK(MeteorCalendar::rate(40.0) == ShowerRating::Good);
    CHECK(MeteorCalendar::rate(15.0) == ShowerRating::Fair);
    CHECK(MeteorCalendar::rate(14.0) == ShowerRating::Poor);
    CHECK(to_string(ShowerRating::Excellent) == "excellent");
}

// =================================================================
// Calculator
// =================================================================

TEST_CASE("Outlook on the Geminid peak")
{
    const auto outlook = sources::MeteorCalculator::outlook_for(2024y / December / 14, 60);

    REQUIRE(outlook.any_active());
    CHECK(outlook.active.front().shower.name == "Geminids");
    CHECK(outlook.active.front().days_to_peak == 0);
    CHECK(outlook.active.front().rating == ShowerRating::Excellent);

    CHECK(std::is_sorted(outlook.active.begin(), outlook.active.end(),
                         [](const sources::ShowerActivity& a, const sources::ShowerActivity& b)
                         { return a.effective_zhr > b.effective_zhr; }));

    // Upcoming peaks are strictly in the future and rated at their peak
    REQUIRE_FALSE(outlook.upcoming.empty());
    CHECK(outlook.upcoming.front().shower.name == "Ursids");
    for (const auto& u : outlook.upcoming)
    {
        CHECK(u.days_to_peak > 0);
        CHECK(u.days_to_peak <= 60);
        CHECK(u.effective_zhr == doctest::Approx(static_cast<f64>(u.shower.zhr)));
    }
    CHECK(std::any_of(outlook.upcoming.begin(), outlook.upcoming.end(),
                      [](const sources::ShowerActivity& a) { return a.shower.name == "Quadrantids"; }));
}

TEST_CASE("Meteor calculator is local only and never unavailable")
{
    const sources::MeteorCalculator calc{30};
    CHECK_FALSE(calc.has_live_source());

    const auto at = astro::Instant::from_utc(sys_days{2024y / March / 1} + 22h);
    REQUIRE(at.has_value());
    const auto result = calc.compute(sources::GeoLocation{.latitude_deg = 40.0, .longitude_deg = -74.0}, *at);

    CHECK(result.provenance() == sources::Provenance::LocalFallback);
    CHECK_FALSE(result.failure().has_value());
    CHECK_FALSE(result.value().any_active());
    CHECK(result.value().upcoming.empty());
}

TEST_CASE("The observer's local date decides which showers are active")
{
    // 2024-12-03 20:00 UTC is already Dec 4 in Sydney
    const auto at = astro::Instant::from_utc(sys_days{2024y / December / 3} + 20h);
    REQUIRE(at.has_value());

    const sources::MeteorCalculator calc;
    const sources::GeoLocation sydney{.latitude_deg = -33.87, .longitude_deg = 151.21,
                                      .elevation_m = std::nullopt, .utc_offset_minutes = 660};
    const sources::GeoLocation greenwich{.latitude_deg = 51.48, .longitude_deg = 0.0};

    const auto in_sydney = calc.compute(sydney, *at).value();
    const auto in_greenwich = calc.compute(greenwich, *at).value();

    const auto has_geminids = [](const sources::MeteorOutlook& o)
    {
        return std::any_of(o.active.begin(), o.active.end(),
                           [](const sources::ShowerActivity& a) { return a.shower.name == "Geminids"; });
    };
    CHECK(has_geminids(in_sydney));
    CHECK_FALSE(has_geminids(in_greenwich));
}

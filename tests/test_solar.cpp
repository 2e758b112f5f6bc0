/// @file test_solar.cpp
/// @brief Unit tests for skybrief::astro::Solar and the Sun calculator.
///
/// Verifies solar position near the equinox, sunrise/sunset and twilight
/// crossings at ordinary and polar latitudes, twilight classification,
/// and the sunrise-sunset.org payload parser.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/solar.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "fake_fetcher.hpp"
#include "sources/sun_calculator.hpp"

#include <chrono>
#include <cmath>
#include <memory>

using namespace skybrief;
using namespace skybrief::astro;
using namespace skybrief::sources;
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
// Fixtures
// =================================================================

static const GeoLocation kEquator{.latitude_deg = 0.0, .longitude_deg = 0.0};
static const GeoLocation kLondon{.latitude_deg = 51.5074, .longitude_deg = -0.1278};
static const GeoLocation kTromso{.latitude_deg = 69.6492, .longitude_deg = 18.9553};

static f64 minutes_between(const EventTime& a, const EventTime& b)
{
    return static_cast<f64>((std::get<Instant>(b) - std::get<Instant>(a)).count()) / 60.0;
}

static bool no_event(const EventTime& event, NoEventReason reason)
{
    const auto* none = std::get_if<NoEvent>(&event);
    return none && none->reason == reason;
}

// =================================================================
// Solar position
// =================================================================

TEST_CASE("Sun is on the celestial equator at the March equinox")
{
    // Equinox 2024-03-20 03:06 UTC
    const f64 jd = TimeSystem::to_julian_date(year_month_day{2024y / March / 20}, 3.1);
    const auto pos = Solar::position(jd);

    CHECK(std::abs(pos.equatorial.dec * astro_constants::kRadToDeg) < 0.05);
    const f64 lon = pos.apparent_longitude_deg;
    CHECK((lon < 0.1 || lon > 359.9));
}

TEST_CASE("Sun is near +23.44° at the June solstice")
{
    const f64 jd = TimeSystem::to_julian_date(year_month_day{2024y / June / 20}, 20.85);
    const auto pos = Solar::position(jd);
    CHECK(pos.equatorial.dec * astro_constants::kRadToDeg == doctest::Approx(23.44).epsilon(0.001));
}

TEST_CASE("Equation of time is about -7.5 min on the March equinox and +16 min in early November")
{
    const f64 march = TimeSystem::to_julian_date(year_month_day{2024y / March / 20}, 12.0);
    const f64 november = TimeSystem::to_julian_date(year_month_day{2024y / November / 3}, 12.0);

    CHECK(Solar::position(march).equation_of_time_min == doctest::Approx(-7.5).epsilon(0.05));
    CHECK(Solar::position(november).equation_of_time_min == doctest::Approx(16.4).epsilon(0.03));
}

TEST_CASE("Transit at Greenwich follows the equation of time")
{
    const f64 transit = Solar::transit_jd(year_month_day{2024y / March / 20}, minutes{0}, kEquator.observer());
    const auto noon = Instant::from_julian_date(transit);

    // 12:00 minus EoT (-7.5 min) ≈ 12:07 UTC
    const f64 minutes_after_noon = static_cast<f64>(noon.local_time_of_day().count()) / 60.0 - 720.0;
    CHECK(minutes_after_noon == doctest::Approx(7.5).epsilon(0.1));
}

// =================================================================
// Sunrise, sunset and twilight
// =================================================================

TEST_CASE("Equator at the equinox has a twelve hour day")
{
    const auto times = SunCalculator::compute_for_day(kEquator, year_month_day{2024y / March / 20}, minutes{0});

    REQUIRE(occurs(times.sunrise));
    REQUIRE(occurs(times.sunset));
    CHECK(std::abs(minutes_between(times.sunrise, times.sunset) - 720.0) <= 2.0);
    CHECK(std::abs(static_cast<f64>(times.day_length.count()) / 60.0 - 720.0) <= 2.0);
    CHECK(times.is_ordered());

    // Twilight is short and nearly symmetric at the equator
    CHECK(minutes_between(times.civil_dawn, times.sunrise) == doctest::Approx(24.0).epsilon(0.1));
}

TEST_CASE("London at the June solstice: no astronomical darkness")
{
    const auto times = SunCalculator::compute_for_day(kLondon, year_month_day{2024y / June / 21}, minutes{60});

    CHECK(no_event(times.astronomical_dawn, NoEventReason::AlwaysAbove));
    CHECK(no_event(times.astronomical_dusk, NoEventReason::AlwaysAbove));
    REQUIRE(occurs(times.nautical_dawn));
    REQUIRE(occurs(times.sunrise));
    REQUIRE(occurs(times.sunset));
    CHECK(times.is_ordered());

    // Geometric sunrise is a few minutes after the refracted 04:43 BST
    const auto rise = std::get<Instant>(times.sunrise);
    CHECK(rise.local_date() == year_month_day{2024y / June / 21});
    CHECK(rise.to_local_hhmm() >= "04:43");
    CHECK(rise.to_local_hhmm() <= "04:55");

    CHECK_FALSE(dark_sky_window(times).has_value());
}

TEST_CASE("Event ordering holds across the year at mid latitudes")
{
    for (unsigned month = 1; month <= 12; ++month)
    {
        const year_month_day date{2024y, std::chrono::month{month}, 15d};
        CAPTURE(month);
        CHECK(SunCalculator::compute_for_day(kLondon, date, minutes{0}).is_ordered());
        CHECK(SunCalculator::compute_for_day(GeoLocation{.latitude_deg = -33.87, .longitude_deg = 151.21},
                                             date, minutes{600})
                  .is_ordered());
    }
}

TEST_CASE("Polar night: the Sun never rises")
{
    const auto times = SunCalculator::compute_for_day(kTromso, year_month_day{2024y / December / 21}, minutes{60});

    CHECK(no_event(times.sunrise, NoEventReason::AlwaysBelow));
    CHECK(no_event(times.sunset, NoEventReason::AlwaysBelow));
    CHECK(times.day_length == seconds{0});

    // Civil twilight still happens around noon
    CHECK(occurs(times.civil_dawn));
    CHECK(occurs(times.civil_dusk));
    CHECK(times.is_ordered());
}

TEST_CASE("Polar day: the Sun never sets")
{
    const auto times = SunCalculator::compute_for_day(kTromso, year_month_day{2024y / June / 21}, minutes{120});

    CHECK(no_event(times.sunrise, NoEventReason::AlwaysAbove));
    CHECK(no_event(times.sunset, NoEventReason::AlwaysAbove));
    CHECK(no_event(times.astronomical_dusk, NoEventReason::AlwaysAbove));
    CHECK(times.day_length == hours{24});
}

// =================================================================
// Classification and the dark window
// =================================================================

TEST_CASE("classify walks through the twilight stages")
{
    const auto times = SunCalculator::compute_for_day(kLondon, year_month_day{2024y / January / 15}, minutes{0});
    REQUIRE(occurs(times.astronomical_dusk));

    const auto noon = times.solar_noon;
    CHECK(classify(times, noon) == TwilightStage::Day);

    const auto sunset = std::get<Instant>(times.sunset);
    const auto civil_dusk = std::get<Instant>(times.civil_dusk);
    const auto nautical_dusk = std::get<Instant>(times.nautical_dusk);
    const auto astro_dusk = std::get<Instant>(times.astronomical_dusk);

    CHECK(classify(times, sunset + minutes{5}) == TwilightStage::Civil);
    CHECK(classify(times, civil_dusk + minutes{5}) == TwilightStage::Nautical);
    CHECK(classify(times, nautical_dusk + minutes{5}) == TwilightStage::Astronomical);
    CHECK(classify(times, astro_dusk + minutes{5}) == TwilightStage::Night);
    CHECK(classify(times, noon.local_midnight() + hours{2}) == TwilightStage::Night);
}

TEST_CASE("Short summer night stays in astronomical twilight")
{
    const auto times = SunCalculator::compute_for_day(kLondon, year_month_day{2024y / June / 21}, minutes{60});
    const auto one_am = times.solar_noon.local_midnight() + hours{1};
    CHECK(classify(times, one_am) == TwilightStage::Astronomical);
}

TEST_CASE("Dark window runs from dusk to the next dawn")
{
    const auto times = SunCalculator::compute_for_day(kLondon, year_month_day{2024y / January / 15}, minutes{0});
    const auto dark = dark_sky_window(times);
    REQUIRE(dark.has_value());

    CHECK(dark->begins == std::get<Instant>(times.astronomical_dusk));
    CHECK(dark->ends > dark->begins);
    CHECK(dark->duration() > hours{10});
    CHECK(dark->duration() < hours{14});
    CHECK(dark->best_time() > dark->begins);
    CHECK(dark->best_time() < dark->ends);
}

TEST_CASE("Polar night is dark around the clock")
{
    // 88°N in December: noon altitude is about -25°
    const GeoLocation high_arctic{.latitude_deg = 88.0, .longitude_deg = 15.0};
    const auto times = SunCalculator::compute_for_day(high_arctic, year_month_day{2024y / December / 21}, minutes{60});

    CHECK(no_event(times.astronomical_dawn, NoEventReason::AlwaysBelow));
    const auto dark = dark_sky_window(times);
    REQUIRE(dark.has_value());
    CHECK(dark->duration() == hours{24});
}

// =================================================================
// Live payload
// =================================================================

static constexpr const char* kLondonSolstice = R"({
  "results": {
    "sunrise": "2024-06-21T03:43:09+00:00",
    "sunset": "2024-06-21T20:21:41+00:00",
    "solar_noon": "2024-06-21T12:02:25+00:00",
    "day_length": 59912,
    "civil_twilight_begin": "2024-06-21T02:57:11+00:00",
    "civil_twilight_end": "2024-06-21T21:07:39+00:00",
    "nautical_twilight_begin": "2024-06-21T01:40:44+00:00",
    "nautical_twilight_end": "2024-06-21T22:24:06+00:00",
    "astronomical_twilight_begin": "1970-01-01T00:00:01+00:00",
    "astronomical_twilight_end": "1970-01-01T00:00:01+00:00"
  },
  "status": "OK",
  "tzid": "UTC"
})";

static CalculationContext london_context(const year_month_day& date, seconds time_of_day)
{
    const auto at = Instant::from_local(date, time_of_day, minutes{60});
    REQUIRE(at.has_value());
    return CalculationContext{.location = kLondon, .instant = *at};
}

TEST_CASE("sunrise-sunset.org payload is parsed into the local offset")
{
    const auto ctx = london_context(year_month_day{2024y / June / 21}, hours{12});
    const auto outcome = SunCalculator::parse_sunrise_sunset(nlohmann::json::parse(kLondonSolstice), ctx);

    const auto* times = std::get_if<SunTimes>(&outcome);
    REQUIRE(times != nullptr);

    CHECK(std::get<Instant>(times->sunrise).to_local_hhmm() == "04:43");
    CHECK(std::get<Instant>(times->sunrise).utc_offset() == minutes{60});
    CHECK(times->day_length == seconds{59912});
    CHECK(no_event(times->astronomical_dawn, NoEventReason::AlwaysAbove));
    CHECK(times->is_ordered());
}

TEST_CASE("sunrise-sunset.org payload errors are malformed, not exceptions")
{
    const auto ctx = london_context(year_month_day{2024y / June / 21}, hours{12});

    SUBCASE("status not OK")
    {
        const auto outcome = SunCalculator::parse_sunrise_sunset(
            nlohmann::json::parse(R"({"results": "", "status": "INVALID_REQUEST"})"), ctx);
        REQUIRE(std::holds_alternative<SourceFailure>(outcome));
        CHECK(std::get<SourceFailure>(outcome).kind == FailureKind::MalformedPayload);
    }

    SUBCASE("bad timestamp")
    {
        auto doc = nlohmann::json::parse(kLondonSolstice);
        doc["results"]["sunset"] = "evening";
        const auto outcome = SunCalculator::parse_sunrise_sunset(doc, ctx);
        REQUIRE(std::holds_alternative<SourceFailure>(outcome));
        CHECK(std::get<SourceFailure>(outcome).kind == FailureKind::MalformedPayload);
    }

    SUBCASE("events out of order")
    {
        auto doc = nlohmann::json::parse(kLondonSolstice);
        doc["results"]["sunset"] = "2024-06-21T02:00:00+00:00";
        const auto outcome = SunCalculator::parse_sunrise_sunset(doc, ctx);
        CHECK(std::holds_alternative<SourceFailure>(outcome));
    }
}

TEST_CASE("SunCalculator: live answer, then local fallback")
{
    auto fetcher = std::make_shared<skybrief::testing::FakeFetcher>();
    const core::SourceSettings settings{.url = "https://api.sunrise-sunset.org/json"};
    const auto ctx = london_context(year_month_day{2024y / June / 21}, hours{12});

    SUBCASE("live")
    {
        fetcher->ok("sunrise-sunset", kLondonSolstice);
        const SunCalculator calc{fetcher, settings};

        const auto result = calc.compute(ctx.location, ctx.instant);
        CHECK(result.provenance() == Provenance::Live);
        REQUIRE(result.has_value());
        CHECK(result.value().day_length == seconds{59912});

        const auto urls = fetcher->urls();
        REQUIRE(urls.size() == 1);
        CHECK(urls[0].find("date=2024-06-21") != std::string::npos);
        CHECK(urls[0].find("formatted=0") != std::string::npos);
    }

    SUBCASE("HTTP error falls back to the local algorithm")
    {
        fetcher->on("sunrise-sunset", net::HttpResponse{.status = 503, .body = ""});
        const SunCalculator calc{fetcher, settings};

        const auto result = calc.compute(ctx.location, ctx.instant);
        CHECK(result.provenance() == Provenance::LocalFallback);
        REQUIRE(result.failure().has_value());
        CHECK(result.failure()->kind == FailureKind::HttpStatus);

        // Local geometric sunrise within ten minutes of the live value
        const auto local_rise = std::get<Instant>(result.value().sunrise);
        const auto live_rise = Instant::parse_iso8601("2024-06-21T03:43:09+00:00");
        REQUIRE(live_rise.has_value());
        CHECK(std::abs((local_rise - *live_rise).count()) <= 600);
    }

    SUBCASE("disabled source never fetches")
    {
        const SunCalculator calc{fetcher, core::SourceSettings{.enabled = false, .url = settings.url}};

        const auto result = calc.compute(ctx.location, ctx.instant);
        CHECK(result.provenance() == Provenance::LocalFallback);
        CHECK(result.failure()->kind == FailureKind::Disabled);
        CHECK(fetcher->calls() == 0);
    }
}

/// @file test_source_fetcher.cpp
/// @brief Unit tests for skybrief::sources::SourceFetcher and the payload readers.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "fake_fetcher.hpp"
#include "sources/payload.hpp"
#include "sources/source_fetcher.hpp"

#include <chrono>
#include <stop_token>

using namespace skybrief;
using namespace skybrief::sources;
using skybrief::testing::FakeFetcher;
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

static constexpr const char* kUrl = "https://example.test/data";

static const SourceFailure* failure_of(const JsonOutcome& outcome)
{
    return std::get_if<SourceFailure>(&outcome);
}

// =================================================================
// Retry policy
// =================================================================

TEST_CASE("A network error is reissued once and the retry can succeed")
{
    FakeFetcher fake;
    fake.on_sequence("example.test", {
        FakeFetcher::network_error(),
        net::HttpResponse{.status = 200, .body = R"({"ok": true})"},
    });

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    const auto outcome = fetcher.get_json(kUrl);

    REQUIRE(std::holds_alternative<nlohmann::json>(outcome));
    CHECK(std::get<nlohmann::json>(outcome).at("ok") == true);
    CHECK(fake.calls() == 2);
}

TEST_CASE("A second network error is reported, not retried again")
{
    FakeFetcher fake;
    fake.on("example.test", FakeFetcher::network_error());

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    const auto* failure = failure_of(fetcher.get_json(kUrl));

    REQUIRE(failure != nullptr);
    CHECK(failure->kind == FailureKind::Network);
    CHECK(fake.calls() == 2);
}

TEST_CASE("A timeout is never reissued")
{
    FakeFetcher fake;
    fake.on("example.test", FakeFetcher::timeout());

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    const auto* failure = failure_of(fetcher.get_json(kUrl));

    REQUIRE(failure != nullptr);
    CHECK(failure->kind == FailureKind::Timeout);
    CHECK(fake.calls() == 1);
}

TEST_CASE("Retry can be switched off")
{
    FakeFetcher fake;
    fake.on("example.test", FakeFetcher::network_error());

    SourceFetcher fetcher{fake, core::SourceSettings{.retry_on_network_error = false}, std::stop_token{}};
    CHECK(failure_of(fetcher.get_json(kUrl))->kind == FailureKind::Network);
    CHECK(fake.calls() == 1);
}

TEST_CASE("A stop request suppresses the reissue")
{
    FakeFetcher fake;
    fake.on("example.test", FakeFetcher::network_error());

    std::stop_source stop;
    stop.request_stop();
    SourceFetcher fetcher{fake, core::SourceSettings{}, stop.get_token()};

    CHECK(fetcher.stop_requested());
    CHECK(failure_of(fetcher.get_json(kUrl)) != nullptr);
    CHECK(fake.calls() == 1);
}

// =================================================================
// Response classification
// =================================================================

TEST_CASE("Non-2xx status becomes an HTTP failure")
{
    FakeFetcher fake;
    fake.on("example.test", net::HttpResponse{.status = 404, .body = R"({"error": "not found"})"});

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    const auto* failure = failure_of(fetcher.get_json(kUrl));

    REQUIRE(failure != nullptr);
    CHECK(failure->kind == FailureKind::HttpStatus);
    CHECK(failure->detail == "HTTP 404");
    CHECK(fake.calls() == 1);
}

TEST_CASE("A body that is not JSON is a malformed payload")
{
    FakeFetcher fake;
    fake.ok("example.test", "<html>Service Unavailable</html>");

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    const auto* failure = failure_of(fetcher.get_json(kUrl));

    REQUIRE(failure != nullptr);
    CHECK(failure->kind == FailureKind::MalformedPayload);
}

TEST_CASE("Cancelled transfers map to Cancelled")
{
    FakeFetcher fake;
    fake.on("example.test", net::FetchError{.kind = net::FetchErrorKind::Cancelled, .message = "aborted"});

    SourceFetcher fetcher{fake, core::SourceSettings{}, std::stop_token{}};
    CHECK(failure_of(fetcher.get_json(kUrl))->kind == FailureKind::Cancelled);
}

// =================================================================
// Time budget
// =================================================================

TEST_CASE("Each request gets at most the remaining budget")
{
    FakeFetcher fake;
    fake.ok("example.test", "[]");

    SourceFetcher fetcher{fake, core::SourceSettings{.timeout = 5000ms}, std::stop_token{}};
    REQUIRE(std::holds_alternative<nlohmann::json>(fetcher.get_json(kUrl)));

    CHECK(fake.last_timeout() > 0ms);
    CHECK(fake.last_timeout() <= 5000ms);
    CHECK(fetcher.remaining() <= 5000ms);
}

TEST_CASE("An exhausted budget fails without a request")
{
    FakeFetcher fake;
    fake.ok("example.test", "[]");

    SourceFetcher fetcher{fake, core::SourceSettings{.timeout = 0ms}, std::stop_token{}};
    const auto* failure = failure_of(fetcher.get_json(kUrl));

    REQUIRE(failure != nullptr);
    CHECK(failure->kind == FailureKind::Timeout);
    CHECK(fake.calls() == 0);
    CHECK(fetcher.remaining() == 0ms);
}

// =================================================================
// URL building
// =================================================================

TEST_CASE("with_query")
{
    CHECK(SourceFetcher::with_query("https://a.test/x", {{"lat", "1.5"}, {"lon", "-2"}})
          == "https://a.test/x?lat=1.5&lon=-2");
    CHECK(SourceFetcher::with_query("https://a.test/x?formatted=0", {{"date", "2024-06-21"}})
          == "https://a.test/x?formatted=0&date=2024-06-21");
    CHECK(SourceFetcher::with_query("https://a.test/x", {}) == "https://a.test/x");
}

// =================================================================
// Payload readers
// =================================================================

TEST_CASE("as_number accepts numbers and numeric strings")
{
    CHECK(payload::as_number(nlohmann::json(2.67)).value_or(-1.0) == doctest::Approx(2.67));
    CHECK(payload::as_number(nlohmann::json("2.67")).value_or(-1.0) == doctest::Approx(2.67));
    CHECK(payload::as_number(nlohmann::json("93%")).value_or(-1.0) == doctest::Approx(93.0));
    CHECK(payload::as_number(nlohmann::json(" 4 ")).value_or(-1.0) == doctest::Approx(4.0));

    CHECK_FALSE(payload::as_number(nlohmann::json("")).has_value());
    CHECK_FALSE(payload::as_number(nlohmann::json("n/a")).has_value());
    CHECK_FALSE(payload::as_number(nlohmann::json(nullptr)).has_value());
    CHECK_FALSE(payload::as_number(nlohmann::json::array()).has_value());
}

TEST_CASE("Object field readers tolerate missing and mistyped keys")
{
    const auto obj = nlohmann::json::parse(R"({"kp": "3.33", "name": "Moon", "count": 4})");

    CHECK(payload::number_at(obj, "kp").value_or(-1.0) == doctest::Approx(3.33));
    CHECK(payload::number_at(obj, "count").value_or(-1.0) == doctest::Approx(4.0));
    CHECK_FALSE(payload::number_at(obj, "missing").has_value());
    CHECK_FALSE(payload::number_at(nlohmann::json::array(), "kp").has_value());

    CHECK(payload::string_at(obj, "name") == "Moon");
    CHECK_FALSE(payload::string_at(obj, "count").has_value());
}

TEST_CASE("instant_at reads zoned and zone-less timestamps")
{
    const auto obj = nlohmann::json::parse(R"({"zoned": "2024-06-21T03:43:00+00:00", "bare": "2024-06-21T03:00"})");

    const auto zoned = payload::instant_at(obj, "zoned");
    REQUIRE(zoned.has_value());
    CHECK(zoned->utc() == sys_days{2024y / June / 21} + 3h + 43min);

    const auto bare = payload::instant_at(obj, "bare", minutes{0});
    REQUIRE(bare.has_value());
    CHECK(bare->utc() == sys_days{2024y / June / 21} + 3h);

    CHECK_FALSE(payload::instant_at(obj, "missing").has_value());
}

TEST_CASE("parse_hhmm")
{
    CHECK(payload::parse_hhmm("06:45") == minutes{405});
    CHECK(payload::parse_hhmm("6:05") == minutes{365});
    CHECK(payload::parse_hhmm("23:59") == minutes{1439});

    CHECK_FALSE(payload::parse_hhmm("24:00").has_value());
    CHECK_FALSE(payload::parse_hhmm("12:60").has_value());
    CHECK_FALSE(payload::parse_hhmm("1245").has_value());
    CHECK_FALSE(payload::parse_hhmm("ab:cd").has_value());
}

/// @file test_config.cpp
/// @brief Unit tests for skybrief::core::ConfigLoader.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace skybrief;
using namespace skybrief::core;
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
// Helper: create a temporary config file for testing
// =================================================================

class TempConfigFile
{
public:
    explicit TempConfigFile(const std::string& filename, const std::string& content)
        : m_path(std::filesystem::temp_directory_path() / filename)
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempConfigFile()
    {
        std::filesystem::remove(m_path);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

    TempConfigFile(const TempConfigFile&) = delete;
    TempConfigFile& operator=(const TempConfigFile&) = delete;

private:
    std::filesystem::path m_path;
};

// =================================================================
// Defaults
// =================================================================

TEST_CASE("Defaults")
{
    const EngineConfig cfg;

    CHECK(cfg.moon.enabled);
    CHECK(cfg.moon.url == default_endpoints::kMoon);
    CHECK(cfg.moon.timeout == 10000ms);
    CHECK(cfg.moon.retry_on_network_error);
    CHECK(cfg.space_weather.timeout == 15000ms);
    CHECK(cfg.weather.url == default_endpoints::kWeather);
    CHECK(cfg.parallel);
    CHECK_FALSE(cfg.bortle.has_value());
    CHECK(cfg.meteor_lookahead_days == 60);
    CHECK(cfg.eclipse_horizon_days == 365);
    CHECK(cfg.log_level == spdlog::level::info);
}

TEST_CASE("Empty document keeps every default")
{
    const auto cfg = ConfigLoader::from_json(nlohmann::json::object());
    CHECK(cfg.sun.url == default_endpoints::kSun);
    CHECK(cfg.location.latitude_deg == doctest::Approx(0.0));
    CHECK_FALSE(cfg.location.utc_offset_minutes.has_value());

    const auto from_array = ConfigLoader::from_json(nlohmann::json::array());
    CHECK(from_array.planets.url == default_endpoints::kPlanets);
}

// =================================================================
// Overlay
// =================================================================

TEST_CASE("Values overlay the defaults")
{
    const auto cfg = ConfigLoader::from_json(nlohmann::json::parse(R"({
      "location": {"latitude": -33.87, "longitude": 151.21, "elevation_m": 58.5, "utc_offset_minutes": 660},
      "sources": {
        "moon": {"enabled": false},
        "weather": {"url": "http://localhost:8080/forecast", "timeout_ms": 2500, "retry_on_network_error": false}
      },
      "parallel": false,
      "bortle": 3,
      "meteor_lookahead_days": 14,
      "eclipse_horizon_days": 90,
      "log": {"level": "debug"}
    })"));

    CHECK(cfg.location.latitude_deg == doctest::Approx(-33.87));
    CHECK(cfg.location.longitude_deg == doctest::Approx(151.21));
    CHECK(cfg.location.elevation_m.value_or(0.0) == doctest::Approx(58.5));
    CHECK(cfg.location.utc_offset_minutes == 660);

    CHECK_FALSE(cfg.moon.enabled);
    CHECK(cfg.moon.url == default_endpoints::kMoon);
    CHECK(cfg.weather.url == "http://localhost:8080/forecast");
    CHECK(cfg.weather.timeout == 2500ms);
    CHECK_FALSE(cfg.weather.retry_on_network_error);
    CHECK(cfg.sun.enabled);

    CHECK_FALSE(cfg.parallel);
    CHECK(cfg.bortle == 3);
    CHECK(cfg.meteor_lookahead_days == 14);
    CHECK(cfg.eclipse_horizon_days == 90);
    CHECK(cfg.log_level == spdlog::level::debug);
}

TEST_CASE("Wrong types are ignored")
{
    const auto cfg = ConfigLoader::from_json(nlohmann::json::parse(R"({
      "location": {"latitude": "north"},
      "sources": {"sun": {"enabled": "yes", "timeout_ms": 2.5}, "planets": "off"},
      "parallel": 1,
      "meteor_lookahead_days": "soon",
      "bortle": 4.5
    })"));

    CHECK(cfg.location.latitude_deg == doctest::Approx(0.0));
    CHECK(cfg.sun.enabled);
    CHECK(cfg.sun.timeout == 10000ms);
    CHECK(cfg.planets.enabled);
    CHECK(cfg.parallel);
    CHECK(cfg.meteor_lookahead_days == 60);
    CHECK_FALSE(cfg.bortle.has_value());
}

TEST_CASE("Out-of-range values are rejected or clamped")
{
    const auto cfg = ConfigLoader::from_json(nlohmann::json::parse(R"({
      "sources": {"moon": {"timeout_ms": 0}, "sun": {"timeout_ms": -5}},
      "bortle": 10,
      "meteor_lookahead_days": -3,
      "eclipse_horizon_days": -1,
      "log": {"level": "verbose"}
    })"));

    CHECK(cfg.moon.timeout == 10000ms);
    CHECK(cfg.sun.timeout == 10000ms);
    CHECK_FALSE(cfg.bortle.has_value());
    CHECK(cfg.meteor_lookahead_days == 0);
    CHECK(cfg.eclipse_horizon_days == 0);
    CHECK(cfg.log_level == spdlog::level::info);

    CHECK_FALSE(ConfigLoader::from_json(nlohmann::json{{"bortle", 0}}).bortle.has_value());
    CHECK(ConfigLoader::from_json(nlohmann::json{{"bortle", 9}}).bortle == 9);
}

TEST_CASE("Log level names")
{
    CHECK(ConfigLoader::parse_log_level("trace") == spdlog::level::trace);
    CHECK(ConfigLoader::parse_log_level("warn") == spdlog::level::warn);
    CHECK(ConfigLoader::parse_log_level("error") == spdlog::level::err);
    CHECK(ConfigLoader::parse_log_level("off") == spdlog::level::off);
    CHECK_FALSE(ConfigLoader::parse_log_level("WARN").has_value());
    CHECK_FALSE(ConfigLoader::parse_log_level("").has_value());
}

// =================================================================
// Files
// =================================================================

TEST_CASE("Load from a file")
{
    const TempConfigFile file("skybrief_test_config.json", R"({"bortle": 6, "sources": {"sun": {"enabled": false}}})");

    const auto cfg = ConfigLoader::load(file.path());
    REQUIRE(cfg.has_value());
    CHECK(cfg->bortle == 6);
    CHECK_FALSE(cfg->sun.enabled);
}

TEST_CASE("Unreadable or invalid files yield nullopt")
{
    CHECK_FALSE(ConfigLoader::load(std::filesystem::temp_directory_path() / "skybrief_no_such_config.json").has_value());

    const TempConfigFile broken("skybrief_broken_config.json", R"({"bortle": 6,)");
    CHECK_FALSE(ConfigLoader::load(broken.path()).has_value());

    const TempConfigFile not_object("skybrief_array_config.json", "[1, 2, 3]");
    CHECK_FALSE(ConfigLoader::load(not_object.path()).has_value());
}

TEST_CASE("The shipped example config loads")
{
    const auto cfg = ConfigLoader::load(std::filesystem::path{SKYBRIEF_CONFIG_DIR} / "skybrief.example.json");
    REQUIRE(cfg.has_value());

    CHECK(cfg->location.latitude_deg == doctest::Approx(51.4769));
    CHECK(cfg->location.utc_offset_minutes == 0);
    CHECK(cfg->space_weather.timeout == 15000ms);
    CHECK(cfg->bortle == 7);
    CHECK(cfg->parallel);
}

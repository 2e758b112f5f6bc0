/// @file main.cpp
/// @brief SkyBrief console entry point.
///
/// Usage: skybrief [config.json] [--json] [--tonight]
///
///  1. Load configuration
///  2. Build the live fetcher and the service
///  3. Aggregate one briefing for the configured location, now
///  4. Print the narrative, or the structured record with --json

#include "briefing/briefing_record.hpp"
#include "briefing/sky_service.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "net/curl_fetcher.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace
{

constexpr std::string_view kUsage = "usage: skybrief [config.json] [--json] [--tonight]";

struct CommandLine
{
    std::optional<std::filesystem::path> config_path;
    bool as_json = false;
    bool tonight = false;
};

std::optional<CommandLine> parse_command_line(int argc, char** argv)
{
    CommandLine cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--json")
        {
            cmd.as_json = true;
        }
        else if (arg == "--tonight")
        {
            cmd.tonight = true;
        }
        else if (!arg.starts_with("--") && !cmd.config_path)
        {
            cmd.config_path = std::filesystem::path{arg};
        }
        else
        {
            SKB_ERROR("Unexpected argument '{}'", arg);
            return std::nullopt;
        }
    }
    return cmd;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    using namespace skybrief;

    core::Logger::init();

    // -----------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------
    const auto cmd = parse_command_line(argc, argv);
    if (!cmd)
    {
        std::cerr << kUsage << '\n';
        core::Logger::shutdown();
        return 2;
    }

    core::EngineConfig config;
    if (cmd->config_path)
    {
        auto loaded = core::ConfigLoader::load(*cmd->config_path);
        if (!loaded)
        {
            SKB_CRITICAL("Cannot continue without a valid configuration");
            core::Logger::shutdown();
            return 1;
        }
        config = std::move(*loaded);
    }
    else
    {
        SKB_WARN("No configuration file given, using defaults");
    }
    core::Logger::set_level(config.log_level);

    const sources::GeoLocation location{
        .latitude_deg       = config.location.latitude_deg,
        .longitude_deg      = config.location.longitude_deg,
        .elevation_m        = config.location.elevation_m,
        .utc_offset_minutes = config.location.utc_offset_minutes,
    };
    SKB_INFO("Location: {:.4f}, {:.4f}", location.latitude_deg, location.longitude_deg);

    // -----------------------------------------------------------------
    // 2. Service
    // -----------------------------------------------------------------
    auto fetcher = std::make_shared<net::CurlFetcher>();
    const briefing::SkyService service{fetcher, config};

    // -----------------------------------------------------------------
    // 3-4. Aggregate and print
    // -----------------------------------------------------------------
    int exit_code = 0;
    try
    {
        const auto now = astro::Instant::now();

        if (cmd->tonight)
        {
            const auto summary = service.tonight(location, now);
            if (cmd->as_json)
            {
                std::cout << briefing::to_record(summary).dump(2) << '\n';
            }
            else
            {
                std::cout << summary.narrative << '\n';
            }
        }
        else
        {
            const auto daily = service.aggregate(location, now);
            if (cmd->as_json)
            {
                std::cout << briefing::to_record(daily).dump(2) << '\n';
            }
            else
            {
                std::cout << daily.narrative() << '\n';
            }
            SKB_INFO("Briefing ready in {} ms", daily.elapsed().count());
        }
    }
    catch (const InvalidInputError& e)
    {
        SKB_ERROR("Cannot build a briefing: {}", e.what());
        exit_code = 1;
    }

    core::Logger::shutdown();
    return exit_code;
}

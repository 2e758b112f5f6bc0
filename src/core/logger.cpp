/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers sharing console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace skybrief::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

void Logger::init(const std::string& log_file)
{
    if (s_core_logger && s_app_logger)
    {
        return;
    }

    // Console goes to stderr so stdout stays clean for briefing output
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");

    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        log_file, kMaxFileSize, kMaxFiles);
    file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] [%t] %v");

    const std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};

    // -----------------------------------------------------------------
    // Core logger ("SKYBRIEF")
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("SKYBRIEF", sinks.begin(), sinks.end());
    s_core_logger->set_level(spdlog::level::trace);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP")
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(spdlog::level::trace);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

void Logger::set_level(spdlog::level::level_enum level)
{
    if (s_core_logger)
    {
        s_core_logger->set_level(level);
    }
    if (s_app_logger)
    {
        s_app_logger->set_level(level);
    }
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace skybrief::core

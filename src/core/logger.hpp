#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace skybrief::core
{
    /// @brief Centralized logging facility for SkyBrief.
    ///
    /// Provides two separate loggers:
    /// - **SKYBRIEF** (core): calculators, live fetches, fallbacks, orchestration
    /// - **APP**: console front end, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any SKB_ macros are used.
        /// @param log_file Path of the rotating log file.
        static void init(const std::string& log_file = "skybrief.log");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Apply one level to both loggers.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Access the engine-internal logger ("SKYBRIEF").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skybrief::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKB_CORE_TRACE(...)    ::skybrief::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKB_CORE_DEBUG(...)    ::skybrief::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKB_CORE_INFO(...)     ::skybrief::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKB_CORE_WARN(...)     ::skybrief::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKB_CORE_ERROR(...)    ::skybrief::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SKB_CORE_CRITICAL(...) ::skybrief::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKB_TRACE(...)         ::skybrief::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKB_DEBUG(...)         ::skybrief::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SKB_INFO(...)          ::skybrief::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKB_WARN(...)          ::skybrief::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKB_ERROR(...)         ::skybrief::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SKB_CRITICAL(...)      ::skybrief::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)

#pragma once

/// @file sky_service.hpp
/// @brief Entry point for presentation layers: aggregate(location, instant).

#include "briefing/briefing_synthesizer.hpp"
#include "briefing/source_orchestrator.hpp"
#include "core/config.hpp"
#include "net/json_fetcher.hpp"

#include <memory>
#include <optional>
#include <stop_token>

namespace skybrief::briefing
{
    class SkyService
    {
    public:
        /// @brief Production calculators over @p fetcher, configured from @p config.
        SkyService(std::shared_ptr<net::JsonFetcher> fetcher, const core::EngineConfig& config);

        SkyService(CalculatorSet calculators, OrchestratorOptions options, std::optional<i32> bortle = std::nullopt);

        /// @brief Run every domain and synthesize the briefing.
        /// @throws InvalidInputError for an unusable location or instant.
        [[nodiscard]] DailyBriefing aggregate(const sources::GeoLocation& location,
                                              const astro::Instant& instant) const;

        /// @brief Cancellable variant.
        /// @return std::nullopt if @p stop was requested before the briefing was assembled.
        [[nodiscard]] std::optional<DailyBriefing> aggregate(const sources::GeoLocation& location,
                                                             const astro::Instant& instant,
                                                             std::stop_token stop) const;

        [[nodiscard]] TonightSummary tonight(const sources::GeoLocation& location,
                                             const astro::Instant& instant) const;

    private:
        SourceOrchestrator m_orchestrator;
        std::optional<i32> m_bortle;
    };

} // namespace skybrief::briefing

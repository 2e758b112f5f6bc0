/// @file sky_service.cpp
/// @brief Implementation of the SkyService facade.

#include "briefing/sky_service.hpp"

#include "core/logger.hpp"

#include <stdexcept>
#include <utility>

namespace skybrief::briefing
{

SkyService::SkyService(std::shared_ptr<net::JsonFetcher> fetcher, const core::EngineConfig& config)
    : SkyService(CalculatorSet::standard(std::move(fetcher), config),
                 OrchestratorOptions{.parallel = config.parallel},
                 config.bortle)
{
}

SkyService::SkyService(CalculatorSet calculators, OrchestratorOptions options, std::optional<i32> bortle)
    : m_orchestrator(std::move(calculators), options)
    , m_bortle(bortle)
{
}

DailyBriefing SkyService::aggregate(const sources::GeoLocation& location, const astro::Instant& instant) const
{
    auto briefing = aggregate(location, instant, std::stop_token{});
    if (!briefing)
    {
        // A default stop_token can never be requested
        throw std::logic_error("aggregation cancelled without a stop source");
    }
    return std::move(*briefing);
}

std::optional<DailyBriefing> SkyService::aggregate(const sources::GeoLocation& location,
                                                   const astro::Instant& instant,
                                                   std::stop_token stop) const
{
    auto run = m_orchestrator.run(location, instant, stop);
    if (!run)
    {
        return std::nullopt;
    }

    auto briefing = BriefingSynthesizer::synthesize(std::move(*run), m_bortle);
    if (stop.stop_requested())
    {
        SKB_CORE_INFO("Briefing discarded, aggregation was cancelled");
        return std::nullopt;
    }
    return briefing;
}

TonightSummary SkyService::tonight(const sources::GeoLocation& location, const astro::Instant& instant) const
{
    return BriefingSynthesizer::tonight(aggregate(location, instant));
}

} // namespace skybrief::briefing

/// @file source_orchestrator.cpp
/// @brief Fan-out over the domain calculators with per-domain isolation.

#include "briefing/source_orchestrator.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace skybrief::briefing
{

namespace
{
    using sources::Domain;
    using sources::FailureKind;
    using sources::SourceFailure;
    using sources::SourceResult;

    template <typename T>
    SourceResult<T> run_isolated(const sources::Calculator<T>* calculator,
                                 Domain domain,
                                 const sources::GeoLocation& location,
                                 const astro::Instant& instant,
                                 std::stop_token stop)
    {
        if (!calculator)
        {
            return SourceResult<T>::unavailable(SourceFailure{FailureKind::Disabled, "no calculator configured"});
        }
        try
        {
            return calculator->compute(location, instant, stop);
        }
        catch (const std::exception& e)
        {
            SKB_CORE_ERROR("{}: calculator fault: {}", sources::to_string(domain), e.what());
            return SourceResult<T>::unavailable(SourceFailure{FailureKind::CalculatorFault, e.what()});
        }
    }

    template <typename T>
    std::future<SourceResult<T>> launch(bool parallel,
                                        const std::unique_ptr<sources::Calculator<T>>& calculator,
                                        Domain domain,
                                        const sources::GeoLocation& location,
                                        const astro::Instant& instant,
                                        std::stop_token stop)
    {
        // Deferred tasks run in get() order on the calling thread
        const auto policy = parallel ? std::launch::async : std::launch::deferred;
        return std::async(policy, [calc = calculator.get(), domain, location, instant, stop]
        {
            return run_isolated(calc, domain, location, instant, stop);
        });
    }

} // namespace

// -----------------------------------------------------------------
// SourceResults / ProvenanceSummary
// -----------------------------------------------------------------

sources::Provenance SourceResults::provenance(Domain domain) const
{
    switch (domain)
    {
        case Domain::Moon:          return moon.provenance();
        case Domain::Sun:           return sun.provenance();
        case Domain::Planets:       return planets.provenance();
        case Domain::MeteorShowers: return meteor_showers.provenance();
        case Domain::Eclipses:      return eclipses.provenance();
        case Domain::SpaceWeather:  return space_weather.provenance();
        case Domain::Weather:       return weather.provenance();
    }
    return sources::Provenance::Unavailable;
}

const std::optional<SourceFailure>& SourceResults::failure(Domain domain) const
{
    switch (domain)
    {
        case Domain::Moon:          return moon.failure();
        case Domain::Sun:           return sun.failure();
        case Domain::Planets:       return planets.failure();
        case Domain::MeteorShowers: return meteor_showers.failure();
        case Domain::Eclipses:      return eclipses.failure();
        case Domain::SpaceWeather:  return space_weather.failure();
        case Domain::Weather:       return weather.failure();
    }
    return weather.failure();
}

ProvenanceSummary ProvenanceSummary::of(const SourceResults& results)
{
    ProvenanceSummary summary;
    summary.entries.reserve(sources::kAllDomains.size());
    for (const auto domain : sources::kAllDomains)
    {
        summary.entries.push_back(ProvenanceEntry{
            .domain     = domain,
            .provenance = results.provenance(domain),
            .failure    = results.failure(domain),
        });
    }
    return summary;
}

i32 ProvenanceSummary::count(sources::Provenance provenance) const
{
    return static_cast<i32>(std::count_if(entries.begin(), entries.end(),
                                          [provenance](const ProvenanceEntry& e) { return e.provenance == provenance; }));
}

std::vector<Domain> ProvenanceSummary::unavailable() const
{
    std::vector<Domain> out;
    for (const auto& entry : entries)
    {
        if (entry.provenance == sources::Provenance::Unavailable)
        {
            out.push_back(entry.domain);
        }
    }
    return out;
}

bool ProvenanceSummary::all_unavailable() const
{
    return count(sources::Provenance::Unavailable) == static_cast<i32>(entries.size());
}

// -----------------------------------------------------------------
// CalculatorSet
// -----------------------------------------------------------------

CalculatorSet CalculatorSet::standard(std::shared_ptr<net::JsonFetcher> fetcher, const core::EngineConfig& config)
{
    CalculatorSet set;
    set.moon           = std::make_unique<sources::MoonCalculator>(fetcher, config.moon);
    set.sun            = std::make_unique<sources::SunCalculator>(fetcher, config.sun);
    set.planets        = std::make_unique<sources::PlanetCalculator>(fetcher, config.planets);
    set.meteor_showers = std::make_unique<sources::MeteorCalculator>(config.meteor_lookahead_days);
    set.eclipses       = std::make_unique<sources::EclipseCalculator>(config.eclipse_horizon_days);
    set.space_weather  = std::make_unique<sources::SpaceWeatherCalculator>(fetcher, config.space_weather);
    set.weather        = std::make_unique<sources::WeatherCalculator>(std::move(fetcher), config.weather);
    return set;
}

// -----------------------------------------------------------------
// SourceOrchestrator
// -----------------------------------------------------------------

SourceOrchestrator::SourceOrchestrator(CalculatorSet calculators, OrchestratorOptions options)
    : m_calculators(std::move(calculators))
    , m_options(options)
{
}

std::optional<OrchestratorResult> SourceOrchestrator::run(const sources::GeoLocation& location,
                                                          const astro::Instant& instant,
                                                          std::stop_token stop) const
{
    try
    {
        sources::require_valid(location, instant);
    }
    catch (const InvalidInputError& e)
    {
        SKB_CORE_ERROR("Aggregation rejected: {}", e.what());
        throw;
    }

    const auto started = std::chrono::steady_clock::now();
    const bool parallel = m_options.parallel;
    const auto& c = m_calculators;

    auto moon     = launch(parallel, c.moon, Domain::Moon, location, instant, stop);
    auto sun      = launch(parallel, c.sun, Domain::Sun, location, instant, stop);
    auto planets  = launch(parallel, c.planets, Domain::Planets, location, instant, stop);
    auto meteors  = launch(parallel, c.meteor_showers, Domain::MeteorShowers, location, instant, stop);
    auto eclipses = launch(parallel, c.eclipses, Domain::Eclipses, location, instant, stop);
    auto space    = launch(parallel, c.space_weather, Domain::SpaceWeather, location, instant, stop);
    auto weather  = launch(parallel, c.weather, Domain::Weather, location, instant, stop);

    SourceResults results{
        .moon           = moon.get(),
        .sun            = sun.get(),
        .planets        = planets.get(),
        .meteor_showers = meteors.get(),
        .eclipses       = eclipses.get(),
        .space_weather  = space.get(),
        .weather        = weather.get(),
    };

    if (stop.stop_requested())
    {
        SKB_CORE_INFO("Aggregation cancelled, results discarded");
        return std::nullopt;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    auto summary = ProvenanceSummary::of(results);

    SKB_CORE_DEBUG("Aggregation finished in {} ms ({} live, {} local, {} unavailable)",
                   elapsed.count(),
                   summary.count(sources::Provenance::Live),
                   summary.count(sources::Provenance::LocalFallback),
                   summary.count(sources::Provenance::Unavailable));

    return OrchestratorResult{
        .location   = location,
        .instant    = sources::local_instant(location, instant),
        .results    = std::move(results),
        .provenance = std::move(summary),
        .elapsed    = elapsed,
    };
}

} // namespace skybrief::briefing

#pragma once

/// @file source_orchestrator.hpp
/// @brief Runs every domain calculator for one (location, instant) pair.

#include "core/config.hpp"
#include "net/json_fetcher.hpp"
#include "sources/calculator.hpp"
#include "sources/eclipse_calculator.hpp"
#include "sources/meteor_calculator.hpp"
#include "sources/moon_calculator.hpp"
#include "sources/planet_calculator.hpp"
#include "sources/space_weather_calculator.hpp"
#include "sources/sun_calculator.hpp"
#include "sources/weather_calculator.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

namespace skybrief::briefing
{
    /// @brief Exactly one result per domain.
    struct SourceResults
    {
        sources::SourceResult<sources::MoonState>      moon;
        sources::SourceResult<sources::SunTimes>       sun;
        sources::SourceResult<sources::PlanetReport>   planets;
        sources::SourceResult<sources::MeteorOutlook>  meteor_showers;
        sources::SourceResult<sources::EclipseOutlook> eclipses;
        sources::SourceResult<sources::SpaceWeather>   space_weather;
        sources::SourceResult<sources::WeatherState>   weather;

        [[nodiscard]] sources::Provenance provenance(sources::Domain domain) const;
        [[nodiscard]] const std::optional<sources::SourceFailure>& failure(sources::Domain domain) const;
    };

    struct ProvenanceEntry
    {
        sources::Domain                        domain;
        sources::Provenance                    provenance;
        std::optional<sources::SourceFailure>  failure;
    };

    /// @brief Which domains answered live, from the local fallback, or not at all.
    struct ProvenanceSummary
    {
        std::vector<ProvenanceEntry> entries;   ///< In kAllDomains order

        [[nodiscard]] static ProvenanceSummary of(const SourceResults& results);

        [[nodiscard]] i32 count(sources::Provenance provenance) const;
        [[nodiscard]] std::vector<sources::Domain> unavailable() const;
        [[nodiscard]] bool all_unavailable() const;
    };

    /// @brief The calculators one orchestrator drives. A null entry yields
    /// UNAVAILABLE for its domain.
    struct CalculatorSet
    {
        std::unique_ptr<sources::Calculator<sources::MoonState>>      moon;
        std::unique_ptr<sources::Calculator<sources::SunTimes>>       sun;
        std::unique_ptr<sources::Calculator<sources::PlanetReport>>   planets;
        std::unique_ptr<sources::Calculator<sources::MeteorOutlook>>  meteor_showers;
        std::unique_ptr<sources::Calculator<sources::EclipseOutlook>> eclipses;
        std::unique_ptr<sources::Calculator<sources::SpaceWeather>>   space_weather;
        std::unique_ptr<sources::Calculator<sources::WeatherState>>   weather;

        /// @brief The production calculators, all sharing @p fetcher.
        [[nodiscard]] static CalculatorSet standard(std::shared_ptr<net::JsonFetcher> fetcher,
                                                    const core::EngineConfig& config);
    };

    struct OrchestratorOptions
    {
        bool parallel = true;   ///< One std::async task per calculator
    };

    struct OrchestratorResult
    {
        sources::GeoLocation      location;
        astro::Instant            instant;      ///< Carries the location's offset
        SourceResults             results;
        ProvenanceSummary         provenance;
        std::chrono::milliseconds elapsed;
    };

    /// @brief Drives each calculator through its live-then-local protocol and
    /// isolates failures: a calculator that throws becomes UNAVAILABLE with
    /// CalculatorFault, and never stops the others.
    class SourceOrchestrator
    {
    public:
        explicit SourceOrchestrator(CalculatorSet calculators, OrchestratorOptions options = {});

        /// @throws InvalidInputError before any calculator runs if the
        /// location or instant is unusable.
        /// @return std::nullopt if @p stop was requested; partial results are discarded.
        [[nodiscard]] std::optional<OrchestratorResult> run(const sources::GeoLocation& location,
                                                            const astro::Instant& instant,
                                                            std::stop_token stop = {}) const;

        [[nodiscard]] const OrchestratorOptions& options() const { return m_options; }

    private:
        CalculatorSet       m_calculators;
        OrchestratorOptions m_options;
    };

} // namespace skybrief::briefing

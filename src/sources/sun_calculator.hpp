#pragma once

/// @file sun_calculator.hpp
/// @brief Sunrise, sunset and the three twilight crossings for the observer's day.

#include "astro/event_time.hpp"
#include "sources/calculator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string_view>

namespace skybrief::sources
{
    /// @brief Sky brightness by solar altitude: ≥0° Day, ≥-6° Civil,
    /// ≥-12° Nautical, ≥-18° Astronomical, below that Night.
    enum class TwilightStage : u8
    {
        Day,
        Civil,
        Nautical,
        Astronomical,
        Night,
    };

    [[nodiscard]] std::string_view to_string(TwilightStage stage);

    /// @brief One local day of solar events. Occurring events are ordered
    /// astro-dawn ≤ nautical-dawn ≤ civil-dawn ≤ sunrise ≤ sunset ≤
    /// civil-dusk ≤ nautical-dusk ≤ astro-dusk.
    struct SunTimes
    {
        astro::EventTime astronomical_dawn;
        astro::EventTime nautical_dawn;
        astro::EventTime civil_dawn;
        astro::EventTime sunrise;
        astro::EventTime sunset;
        astro::EventTime civil_dusk;
        astro::EventTime nautical_dusk;
        astro::EventTime astronomical_dusk;
        astro::Instant       solar_noon;
        std::chrono::seconds day_length;

        /// @brief True when the occurring events respect the ordering above.
        [[nodiscard]] bool is_ordered() const;
    };

    /// @brief Astronomical darkness from dusk to the following dawn.
    struct DarkSkyWindow
    {
        astro::Instant begins;
        astro::Instant ends;

        [[nodiscard]] std::chrono::seconds duration() const { return ends - begins; }

        /// @brief Midpoint of the window.
        [[nodiscard]] astro::Instant best_time() const { return begins + duration() / 2; }
    };

    /// @brief Twilight stage of @p at according to @p times.
    [[nodiscard]] TwilightStage classify(const SunTimes& times, const astro::Instant& at);

    /// @brief Darkness window starting on the evening of @p times' day.
    ///
    /// The following dawn is taken as this day's dawn plus 24 h, which is
    /// within a few minutes of the true value outside polar latitudes.
    /// @return std::nullopt when the Sun never reaches -18°.
    [[nodiscard]] std::optional<DarkSkyWindow> dark_sky_window(const SunTimes& times);

    /// @brief Live: sunrise-sunset.org. Local: low-order solar position.
    class SunCalculator final : public Calculator<SunTimes>
    {
    public:
        SunCalculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings);

        [[nodiscard]] Domain domain() const override { return Domain::Sun; }
        [[nodiscard]] bool has_live_source() const override { return true; }
        [[nodiscard]] bool has_local_algorithm() const override { return true; }

        /// @brief Local computation for one location and local date.
        [[nodiscard]] static SunTimes compute_for_day(const GeoLocation& location,
                                                      const std::chrono::year_month_day& local_date,
                                                      std::chrono::minutes utc_offset);

        /// @brief Parse a sunrise-sunset.org "formatted=0" payload.
        [[nodiscard]] static LiveOutcome<SunTimes> parse_sunrise_sunset(const nlohmann::json& doc,
                                                                        const CalculationContext& ctx);

    protected:
        [[nodiscard]] LiveOutcome<SunTimes> compute_live(const CalculationContext& ctx,
                                                         SourceFetcher& fetcher) const override;
        [[nodiscard]] std::optional<SunTimes> compute_local(const CalculationContext& ctx) const override;
    };

} // namespace skybrief::sources

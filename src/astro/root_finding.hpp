#pragma once

/// @file root_finding.hpp
/// @brief Bounded searches for altitude-threshold crossings.

#include "astro/event_time.hpp"
#include "core/types.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace skybrief::astro
{
    /// @brief Altitude in degrees as a function of Julian Date.
    using AltitudeFunction = std::function<f64(f64 jd)>;

    struct Crossing
    {
        f64  jd;
        bool rising;    ///< true when the altitude goes from below to above
    };

    /// @brief First rise and first set inside one search window.
    struct HorizonEvents
    {
        EventTime rise;
        EventTime set;
    };

    /// @brief Bisection and coarse-scan crossing finders.
    ///
    /// Every search has a fixed iteration cap. Bisection stops once the
    /// bracket is narrower than one second, far inside the one-minute
    /// accuracy the calculators need.
    class RootFinder
    {
    public:
        RootFinder() = delete;

        static constexpr i32 kMaxIterations = 40;
        static constexpr f64 kToleranceDays = 1.0 / astro_constants::kSecondsPerDay;

        /// @brief Locate f(jd) == threshold inside [lo, hi].
        /// @return std::nullopt when the endpoints do not bracket a crossing.
        [[nodiscard]] static std::optional<f64> bisect(
            const AltitudeFunction& altitude, f64 threshold, f64 lo, f64 hi);

        /// @brief Sample [start, end] every @p step_days and refine each sign change.
        [[nodiscard]] static std::vector<Crossing> scan(
            const AltitudeFunction& altitude, f64 threshold,
            f64 start, f64 end, f64 step_days);

        /// @brief First rising and setting crossing in [start, start + 1 day).
        ///
        /// A missing crossing is AlwaysAbove/AlwaysBelow when the body never
        /// changes side during the window, NotInWindow otherwise.
        [[nodiscard]] static HorizonEvents rise_and_set(
            const AltitudeFunction& altitude, f64 threshold,
            f64 start_jd, std::chrono::minutes utc_offset, f64 step_days);
    };

} // namespace skybrief::astro

/// @file root_finding.cpp
/// @brief Implementation of bounded crossing searches.

#include "astro/root_finding.hpp"

#include <algorithm>
#include <cmath>

namespace skybrief::astro
{

std::optional<f64> RootFinder::bisect(
    const AltitudeFunction& altitude, f64 threshold, f64 lo, f64 hi)
{
    f64 f_lo = altitude(lo) - threshold;
    const f64 f_hi = altitude(hi) - threshold;

    if ((f_lo < 0.0) == (f_hi < 0.0))
    {
        return std::nullopt;
    }

    for (i32 i = 0; i < kMaxIterations && (hi - lo) > kToleranceDays; ++i)
    {
        const f64 mid = 0.5 * (lo + hi);
        const f64 f_mid = altitude(mid) - threshold;

        if ((f_mid < 0.0) == (f_lo < 0.0))
        {
            lo = mid;
            f_lo = f_mid;
        }
        else
        {
            hi = mid;
        }
    }

    return 0.5 * (lo + hi);
}

std::vector<Crossing> RootFinder::scan(
    const AltitudeFunction& altitude, f64 threshold,
    f64 start, f64 end, f64 step_days)
{
    std::vector<Crossing> crossings;
    if (step_days <= 0.0 || end <= start)
    {
        return crossings;
    }

    const auto steps = static_cast<i32>(std::ceil((end - start) / step_days));

    f64 prev_jd = start;
    bool prev_above = altitude(start) >= threshold;

    for (i32 i = 1; i <= steps; ++i)
    {
        const f64 jd = std::min(start + step_days * static_cast<f64>(i), end);
        const bool above = altitude(jd) >= threshold;

        if (above != prev_above)
        {
            if (const auto root = bisect(altitude, threshold, prev_jd, jd))
            {
                crossings.push_back(Crossing{.jd = *root, .rising = above});
            }
        }

        prev_jd = jd;
        prev_above = above;
    }

    return crossings;
}

HorizonEvents RootFinder::rise_and_set(
    const AltitudeFunction& altitude, f64 threshold,
    f64 start_jd, std::chrono::minutes utc_offset, f64 step_days)
{
    const auto crossings = scan(altitude, threshold, start_jd, start_jd + 1.0, step_days);

    std::optional<f64> rise;
    std::optional<f64> set;
    for (const auto& c : crossings)
    {
        if (c.rising && !rise)
        {
            rise = c.jd;
        }
        else if (!c.rising && !set)
        {
            set = c.jd;
        }
    }

    // No crossing at all: the body stayed on one side for the whole window
    const NoEvent missing = crossings.empty()
        ? NoEvent{altitude(start_jd) >= threshold ? NoEventReason::AlwaysAbove : NoEventReason::AlwaysBelow}
        : NoEvent{NoEventReason::NotInWindow};

    const auto to_event = [&](const std::optional<f64>& jd) -> EventTime
    {
        if (jd)
        {
            return Instant::from_julian_date(*jd, utc_offset);
        }
        return missing;
    };

    return HorizonEvents{
        .rise = to_event(rise),
        .set  = to_event(set),
    };
}

} // namespace skybrief::astro

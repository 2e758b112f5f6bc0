/// @file meteor_calculator.cpp
/// @brief Implementation of the meteor shower calculator.

#include "sources/meteor_calculator.hpp"

#include <algorithm>

namespace skybrief::sources
{

namespace
{
    /// @brief Rated on @p date, or at its peak for a shower that has not started.
    ShowerActivity activity_of(const calendar::MeteorShower& shower,
                               const std::chrono::year_month_day& date,
                               bool at_peak)
    {
        const f64 zhr = at_peak ? static_cast<f64>(shower.zhr)
                                : calendar::MeteorCalendar::effective_zhr(shower, date);
        return ShowerActivity{
            .shower        = shower,
            .days_to_peak  = shower.days_to_peak(date),
            .effective_zhr = zhr,
            .rating        = calendar::MeteorCalendar::rate(zhr),
        };
    }

} // namespace

MeteorCalculator::MeteorCalculator(i32 lookahead_days)
    : m_lookahead_days(std::max(lookahead_days, 0))
{
}

MeteorOutlook MeteorCalculator::outlook_for(const std::chrono::year_month_day& date, i32 lookahead_days)
{
    MeteorOutlook outlook;

    for (const auto& shower : calendar::MeteorCalendar::active_on(date))
    {
        outlook.active.push_back(activity_of(shower, date, false));
    }
    std::stable_sort(outlook.active.begin(), outlook.active.end(),
                     [](const ShowerActivity& a, const ShowerActivity& b) { return a.effective_zhr > b.effective_zhr; });

    for (const auto& shower : calendar::MeteorCalendar::peaking_within(date, lookahead_days))
    {
        if (shower.days_to_peak(date) > 0)
        {
            outlook.upcoming.push_back(activity_of(shower, date, true));
        }
    }
    return outlook;
}

std::optional<MeteorOutlook> MeteorCalculator::compute_local(const CalculationContext& ctx) const
{
    return outlook_for(ctx.instant.local_date(), m_lookahead_days);
}

} // namespace skybrief::sources

/// @file eclipse_calculator.cpp
/// @brief Implementation of the eclipse calculator.

#include "sources/eclipse_calculator.hpp"

#include "astro/lunar.hpp"
#include "astro/solar.hpp"

#include <algorithm>

namespace skybrief::sources
{

namespace
{
    bool above_horizon(const calendar::EclipseEvent& event, const GeoLocation& location)
    {
        const f64 jd = event.maximum.julian_date();
        const auto observer = location.observer();
        const f64 altitude = event.is_solar() ? astro::Solar::altitude_deg(jd, observer)
                                              : astro::Lunar::altitude_deg(jd, observer);
        return altitude > 0.0;
    }

    EclipseSighting sighting_of(const calendar::EclipseEvent& event, const CalculationContext& ctx)
    {
        return EclipseSighting{
            .event                    = event,
            .days_until               = event.days_until(ctx.instant.local_date()),
            .above_horizon_at_maximum = above_horizon(event, ctx.location),
        };
    }

} // namespace

EclipseCalculator::EclipseCalculator(i32 horizon_days)
    : m_horizon_days(std::max(horizon_days, 0))
{
}

EclipseOutlook EclipseCalculator::outlook_for(const CalculationContext& ctx, i32 horizon_days)
{
    const auto date = ctx.instant.local_date();

    EclipseOutlook outlook{.today = {}, .upcoming = {}, .covered = calendar::EclipseCalendar::covers(date)};
    for (const auto& event : calendar::EclipseCalendar::on(date))
    {
        outlook.today.push_back(sighting_of(event, ctx));
    }
    for (const auto& event : calendar::EclipseCalendar::upcoming(date, horizon_days))
    {
        outlook.upcoming.push_back(sighting_of(event, ctx));
    }
    return outlook;
}

std::optional<EclipseOutlook> EclipseCalculator::compute_local(const CalculationContext& ctx) const
{
    return outlook_for(ctx, m_horizon_days);
}

} // namespace skybrief::sources

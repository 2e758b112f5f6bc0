#pragma once

/// @file eclipse_calculator.hpp
/// @brief Today's eclipse and those coming up within the horizon.

#include "calendar/eclipse_calendar.hpp"
#include "sources/calculator.hpp"

#include <vector>

namespace skybrief::sources
{
    struct EclipseSighting
    {
        calendar::EclipseEvent event;
        i32                    days_until;
        /// Sun (solar) or Moon (lunar) above the observer's horizon at
        /// greatest eclipse. Necessary for seeing it, not sufficient: the
        /// track or penumbra may still miss the site.
        bool                   above_horizon_at_maximum;
    };

    struct EclipseOutlook
    {
        std::vector<EclipseSighting> today;
        std::vector<EclipseSighting> upcoming;   ///< Soonest first
        bool                         covered;    ///< Date within the table's years
    };

    /// @brief Lookup against the fixed eclipse table. Never fetched, never fails.
    class EclipseCalculator final : public Calculator<EclipseOutlook>
    {
    public:
        explicit EclipseCalculator(i32 horizon_days = 365);

        [[nodiscard]] Domain domain() const override { return Domain::Eclipses; }
        [[nodiscard]] bool has_local_algorithm() const override { return true; }

        [[nodiscard]] static EclipseOutlook outlook_for(const CalculationContext& ctx, i32 horizon_days);

    protected:
        [[nodiscard]] std::optional<EclipseOutlook> compute_local(const CalculationContext& ctx) const override;

    private:
        i32 m_horizon_days;
    };

} // namespace skybrief::sources

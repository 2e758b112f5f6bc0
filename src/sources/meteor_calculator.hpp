#pragma once

/// @file meteor_calculator.hpp
/// @brief Active and upcoming meteor showers for the observer's date.

#include "calendar/meteor_calendar.hpp"
#include "sources/calculator.hpp"

#include <vector>

namespace skybrief::sources
{
    struct ShowerActivity
    {
        calendar::MeteorShower shower;
        i32                    days_to_peak;     ///< Negative once the peak has passed
        f64                    effective_zhr;
        calendar::ShowerRating rating;
    };

    struct MeteorOutlook
    {
        std::vector<ShowerActivity> active;      ///< Highest effective ZHR first
        std::vector<ShowerActivity> upcoming;    ///< Peaks after today within the lookahead, soonest first, rated at peak

        [[nodiscard]] bool any_active() const { return !active.empty(); }
    };

    /// @brief Lookup against the fixed shower table. Never fetched, never fails.
    class MeteorCalculator final : public Calculator<MeteorOutlook>
    {
    public:
        explicit MeteorCalculator(i32 lookahead_days = 60);

        [[nodiscard]] Domain domain() const override { return Domain::MeteorShowers; }
        [[nodiscard]] bool has_local_algorithm() const override { return true; }

        [[nodiscard]] static MeteorOutlook outlook_for(const std::chrono::year_month_day& date, i32 lookahead_days);

    protected:
        [[nodiscard]] std::optional<MeteorOutlook> compute_local(const CalculationContext& ctx) const override;

    private:
        i32 m_lookahead_days;
    };

} // namespace skybrief::sources

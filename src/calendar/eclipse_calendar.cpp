/// @file eclipse_calendar.cpp
/// @brief Eclipse table (NASA Five Millennium Canon) and date filters.

#include "calendar/eclipse_calendar.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <utility>

namespace skybrief::calendar
{

namespace
{
    using Kind = EclipseKind;

    EclipseEvent make(Kind kind, i32 y, unsigned m, unsigned d, i32 hh, i32 mm,
                      std::optional<f64> duration_min, f64 magnitude,
                      std::initializer_list<const char*> regions, std::string notes = {})
    {
        const std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
        const auto utc = std::chrono::sys_days{date} + std::chrono::hours{hh} + std::chrono::minutes{mm};
        // Offset 0 is always in range
        const auto maximum = astro::Instant::from_utc(std::chrono::time_point_cast<std::chrono::seconds>(utc));

        EclipseEvent event{
            .kind             = kind,
            .date             = date,
            .maximum          = *maximum,
            .duration_minutes = duration_min,
            .magnitude        = magnitude,
            .regions          = {},
            .notes            = std::move(notes),
        };
        for (const char* region : regions)
        {
            event.regions.emplace_back(region);
        }
        return event;
    }

} // namespace

std::string_view to_string(EclipseKind kind)
{
    switch (kind)
    {
        case EclipseKind::TotalSolar:     return "total_solar";
        case EclipseKind::AnnularSolar:   return "annular_solar";
        case EclipseKind::PartialSolar:   return "partial_solar";
        case EclipseKind::HybridSolar:    return "hybrid_solar";
        case EclipseKind::TotalLunar:     return "total_lunar";
        case EclipseKind::PartialLunar:   return "partial_lunar";
        case EclipseKind::PenumbralLunar: return "penumbral_lunar";
    }
    return "unknown";
}

std::string_view display_name(EclipseKind kind)
{
    switch (kind)
    {
        case EclipseKind::TotalSolar:     return "Total solar eclipse";
        case EclipseKind::AnnularSolar:   return "Annular solar eclipse";
        case EclipseKind::PartialSolar:   return "Partial solar eclipse";
        case EclipseKind::HybridSolar:    return "Hybrid solar eclipse";
        case EclipseKind::TotalLunar:     return "Total lunar eclipse";
        case EclipseKind::PartialLunar:   return "Partial lunar eclipse";
        case EclipseKind::PenumbralLunar: return "Penumbral lunar eclipse";
    }
    return "Eclipse";
}

bool EclipseEvent::is_solar() const
{
    return kind == EclipseKind::TotalSolar || kind == EclipseKind::AnnularSolar
        || kind == EclipseKind::PartialSolar || kind == EclipseKind::HybridSolar;
}

i32 EclipseEvent::days_until(const std::chrono::year_month_day& from) const
{
    return static_cast<i32>((std::chrono::sys_days{date} - std::chrono::sys_days{from}).count());
}

bool EclipseEvent::is_upcoming(const std::chrono::year_month_day& from, i32 horizon_days) const
{
    const i32 days = days_until(from);
    return days >= 0 && days <= horizon_days;
}

std::string EclipseEvent::region_text() const
{
    std::string text;
    for (std::size_t i = 0; i < regions.size(); ++i)
    {
        if (i > 0)
        {
            text += (i + 1 == regions.size()) ? " and " : ", ";
        }
        text += regions[i];
    }
    return text;
}

// -----------------------------------------------------------------
// Table
// -----------------------------------------------------------------

const std::vector<EclipseEvent>& EclipseCalendar::events()
{
    static const std::vector<EclipseEvent> kEvents{
        make(Kind::TotalLunar,     2025, 3, 14, 6, 58, 65.0, 1.178,
             {"Americas", "Europe", "Africa", "Pacific"}),
        make(Kind::PartialSolar,   2025, 3, 29, 10, 47, std::nullopt, 0.938,
             {"NW Africa", "Europe", "Russia"}),
        make(Kind::TotalLunar,     2025, 9, 7, 18, 11, 82.0, 1.362,
             {"Europe", "Africa", "Asia", "Australia"}),
        make(Kind::PartialSolar,   2025, 9, 21, 19, 42, std::nullopt, 0.855,
             {"Antarctica", "New Zealand", "Australia"}),
        make(Kind::AnnularSolar,   2026, 2, 17, 12, 13, 2.2, 0.963,
             {"Antarctica", "Southern South America"}),
        make(Kind::PenumbralLunar, 2026, 3, 3, 11, 33, std::nullopt, 0.969,
             {"Asia", "Australia", "Pacific", "Americas"}),
        make(Kind::TotalSolar,     2026, 8, 12, 17, 46, 2.3, 1.039,
             {"Arctic", "Greenland", "Iceland", "Spain"},
             "Visible from parts of Spain, Iceland and Greenland"),
        make(Kind::PartialLunar,   2026, 8, 28, 4, 13, std::nullopt, 0.930,
             {"Americas", "Europe", "Africa"}),
        make(Kind::AnnularSolar,   2027, 2, 6, 16, 0, 7.5, 0.928,
             {"South America", "Antarctica", "Africa"}),
        make(Kind::PenumbralLunar, 2027, 2, 20, 23, 13, std::nullopt, 0.928,
             {"Americas", "Europe", "Africa"}),
        make(Kind::TotalSolar,     2027, 8, 2, 10, 7, 6.4, 1.079,
             {"Spain", "Morocco", "Algeria", "Libya", "Egypt", "Saudi Arabia", "Yemen"},
             "Totality crosses the Mediterranean and North Africa"),
        make(Kind::PartialLunar,   2027, 8, 17, 7, 12, std::nullopt, 0.100,
             {"Americas", "Europe", "Africa", "Asia"}),
        make(Kind::TotalLunar,     2028, 1, 12, 4, 13, 71.0, 1.063,
             {"Americas", "Europe", "Africa"}),
        make(Kind::AnnularSolar,   2028, 1, 26, 15, 8, 10.3, 0.921,
             {"South America", "Antarctica"}),
        make(Kind::TotalLunar,     2028, 7, 6, 18, 19, 104.0, 1.399,
             {"Americas", "Europe", "Africa", "Asia"},
             "Longest total lunar eclipse until 2123"),
        make(Kind::TotalSolar,     2028, 7, 22, 2, 55, 5.1, 1.056,
             {"Australia", "New Zealand"}),
        make(Kind::PenumbralLunar, 2029, 1, 1, 0, 37, std::nullopt, 0.090,
             {"Americas", "Europe", "Africa"}),
        make(Kind::PartialSolar,   2029, 1, 14, 17, 13, std::nullopt, 0.871,
             {"North America", "Central America"}),
        make(Kind::TotalLunar,     2029, 6, 26, 3, 22, 70.0, 1.177,
             {"Americas", "Europe", "Africa"}),
        make(Kind::PartialSolar,   2029, 7, 11, 15, 36, std::nullopt, 0.230,
             {"South America"}),
        make(Kind::PartialLunar,   2029, 12, 20, 22, 42, std::nullopt, 0.965,
             {"Americas", "Europe", "Africa", "Asia"}),
        make(Kind::AnnularSolar,   2030, 6, 1, 6, 29, 5.3, 0.944,
             {"North Africa", "Europe", "Russia"}),
        make(Kind::PartialLunar,   2030, 6, 15, 18, 32, std::nullopt, 0.501,
             {"Europe", "Africa", "Asia", "Australia"}),
        make(Kind::TotalSolar,     2030, 11, 25, 6, 51, 3.7, 1.047,
             {"Southern Africa", "Australia"}),
        make(Kind::PenumbralLunar, 2030, 12, 9, 22, 27, std::nullopt, 0.849,
             {"Americas", "Europe", "Africa"}),
    };
    return kEvents;
}

std::vector<EclipseEvent> EclipseCalendar::on(const std::chrono::year_month_day& date)
{
    std::vector<EclipseEvent> today;
    std::copy_if(events().begin(), events().end(), std::back_inserter(today),
                 [&date](const EclipseEvent& e) { return e.date == date; });
    return today;
}

std::vector<EclipseEvent> EclipseCalendar::upcoming(const std::chrono::year_month_day& date, i32 horizon_days)
{
    std::vector<EclipseEvent> out;
    std::copy_if(events().begin(), events().end(), std::back_inserter(out),
                 [&](const EclipseEvent& e) { return e.days_until(date) > 0 && e.is_upcoming(date, horizon_days); });
    return out;
}

bool EclipseCalendar::covers(const std::chrono::year_month_day& date)
{
    const i32 y = static_cast<i32>(date.year());
    return y >= kFirstYear && y <= kLastYear;
}

} // namespace skybrief::calendar

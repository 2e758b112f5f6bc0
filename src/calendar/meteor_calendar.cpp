/// @file meteor_calendar.cpp
/// @brief Meteor shower table and date predicates.

#include "calendar/meteor_calendar.hpp"

#include <algorithm>
#include <cstdlib>
#include <iterator>

namespace skybrief::calendar
{

namespace
{
    using std::chrono::month_day;
    using std::chrono::January;
    using std::chrono::April;
    using std::chrono::May;
    using std::chrono::July;
    using std::chrono::August;
    using std::chrono::September;
    using std::chrono::October;
    using std::chrono::November;
    using std::chrono::December;
    using std::chrono::day;

    constexpr f64 kExcellentZhr = 80.0;
    constexpr f64 kGoodZhr      = 40.0;
    constexpr f64 kFairZhr      = 15.0;

} // namespace

bool MeteorShower::is_active(const std::chrono::year_month_day& date) const
{
    const month_day md{date.month(), date.day()};
    if (!wraps_year())
    {
        return active_start <= md && md <= active_end;
    }
    // e.g. Dec 28 - Jan 12: either the tail of one year or the head of the next
    return md >= active_start || md <= active_end;
}

i32 MeteorShower::days_to_peak(const std::chrono::year_month_day& date) const
{
    const std::chrono::sys_days today{date};
    i32 best = 0;
    bool found = false;

    for (const i32 dy : {-1, 0, 1})
    {
        const std::chrono::year_month_day candidate{date.year() + std::chrono::years{dy}, peak.month(), peak.day()};
        if (!candidate.ok())
        {
            continue;
        }
        const auto diff = static_cast<i32>((std::chrono::sys_days{candidate} - today).count());
        if (!found || std::abs(diff) < std::abs(best))
        {
            best = diff;
            found = true;
        }
    }
    return best;
}

std::string_view to_string(ShowerRating rating)
{
    switch (rating)
    {
        case ShowerRating::Poor:      return "poor";
        case ShowerRating::Fair:      return "fair";
        case ShowerRating::Good:      return "good";
        case ShowerRating::Excellent: return "excellent";
    }
    return "unknown";
}

// -----------------------------------------------------------------
// Table (IMO working list)
// -----------------------------------------------------------------

const std::vector<MeteorShower>& MeteorCalendar::showers()
{
    static const std::vector<MeteorShower> kShowers{
        {"Quadrantids",       month_day{January, day{1}},   month_day{January, day{6}},   month_day{January, day{4}},
         120, "2003 EH1",               "Boötes",     41},
        {"Lyrids",            month_day{April, day{16}},    month_day{April, day{25}},    month_day{April, day{22}},
         18,  "C/1861 G1 (Thatcher)",   "Lyra",       49},
        {"Eta Aquariids",     month_day{April, day{19}},    month_day{May, day{28}},      month_day{May, day{6}},
         50,  "1P/Halley",              "Aquarius",   66},
        {"Delta Aquariids",   month_day{July, day{12}},     month_day{August, day{23}},   month_day{July, day{30}},
         25,  "96P/Machholz",           "Aquarius",   41},
        {"Perseids",          month_day{July, day{17}},     month_day{August, day{24}},   month_day{August, day{12}},
         100, "109P/Swift-Tuttle",      "Perseus",    59},
        {"Orionids",          month_day{October, day{2}},   month_day{November, day{7}},  month_day{October, day{21}},
         20,  "1P/Halley",              "Orion",      66},
        {"Southern Taurids",  month_day{September, day{10}}, month_day{November, day{20}}, month_day{October, day{10}},
         5,   "2P/Encke",               "Taurus",     27},
        {"Northern Taurids",  month_day{October, day{20}},  month_day{December, day{10}}, month_day{November, day{12}},
         5,   "2P/Encke",               "Taurus",     29},
        {"Leonids",           month_day{November, day{6}},  month_day{November, day{30}}, month_day{November, day{17}},
         15,  "55P/Tempel-Tuttle",      "Leo",        71},
        {"Geminids",          month_day{December, day{4}},  month_day{December, day{20}}, month_day{December, day{14}},
         150, "3200 Phaethon",          "Gemini",     35},
        {"Ursids",            month_day{December, day{17}}, month_day{December, day{26}}, month_day{December, day{22}},
         10,  "8P/Tuttle",              "Ursa Minor", 33},
    };
    return kShowers;
}

std::vector<MeteorShower> MeteorCalendar::active_on(const std::chrono::year_month_day& date)
{
    std::vector<MeteorShower> active;
    std::copy_if(showers().begin(), showers().end(), std::back_inserter(active),
                 [&date](const MeteorShower& s) { return s.is_active(date); });
    return active;
}

std::vector<MeteorShower> MeteorCalendar::peaking_within(const std::chrono::year_month_day& date, i32 days)
{
    std::vector<MeteorShower> upcoming;
    for (const auto& shower : showers())
    {
        const i32 until = shower.days_to_peak(date);
        if (until >= 0 && until <= days)
        {
            upcoming.push_back(shower);
        }
    }
    std::sort(upcoming.begin(), upcoming.end(), [&date](const MeteorShower& a, const MeteorShower& b)
    {
        return a.days_to_peak(date) < b.days_to_peak(date);
    });
    return upcoming;
}

f64 MeteorCalendar::effective_zhr(const MeteorShower& shower, const std::chrono::year_month_day& date)
{
    const i32 distance = std::abs(shower.days_to_peak(date));
    const f64 zhr = static_cast<f64>(shower.zhr);

    if (distance == 0) return zhr;
    if (distance <= 2) return zhr * 0.7;
    if (distance <= 5) return zhr * 0.4;
    return zhr * 0.2;
}

ShowerRating MeteorCalendar::rate(f64 effective_zhr)
{
    if (effective_zhr >= kExcellentZhr) return ShowerRating::Excellent;
    if (effective_zhr >= kGoodZhr)      return ShowerRating::Good;
    if (effective_zhr >= kFairZhr)      return ShowerRating::Fair;
    return ShowerRating::Poor;
}

} // namespace skybrief::calendar

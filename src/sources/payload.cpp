/// @file payload.cpp
/// @brief Implementation of payload field readers.

#include "sources/payload.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace skybrief::sources::payload
{

std::optional<f64> as_number(const nlohmann::json& value)
{
    if (value.is_number())
    {
        const f64 v = value.get<f64>();
        return std::isfinite(v) ? std::optional<f64>{v} : std::nullopt;
    }
    if (!value.is_string())
    {
        return std::nullopt;
    }

    std::string_view text = value.get_ref<const std::string&>();
    while (!text.empty() && text.front() == ' ')
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '%'))
    {
        text.remove_suffix(1);
    }
    if (text.empty())
    {
        return std::nullopt;
    }

    f64 parsed = 0.0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(parsed))
    {
        return std::nullopt;
    }
    return parsed;
}

std::optional<f64> number_at(const nlohmann::json& obj, std::string_view key)
{
    if (!obj.is_object())
    {
        return std::nullopt;
    }
    const auto it = obj.find(std::string{key});
    return it == obj.end() ? std::nullopt : as_number(*it);
}

std::optional<std::string> string_at(const nlohmann::json& obj, std::string_view key)
{
    if (!obj.is_object())
    {
        return std::nullopt;
    }
    const auto it = obj.find(std::string{key});
    if (it == obj.end() || !it->is_string())
    {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<astro::Instant> instant_at(const nlohmann::json& obj, std::string_view key,
                                         std::optional<std::chrono::minutes> assumed_offset)
{
    const auto text = string_at(obj, key);
    if (!text)
    {
        return std::nullopt;
    }
    return astro::Instant::parse_iso8601(*text, assumed_offset);
}

std::optional<std::chrono::minutes> parse_hhmm(std::string_view text)
{
    const auto colon = text.find(':');
    if (colon == std::string_view::npos)
    {
        return std::nullopt;
    }

    i32 hours = 0;
    i32 minutes = 0;
    const auto hh = text.substr(0, colon);
    const auto mm = text.substr(colon + 1, 2);
    const auto [hp, he] = std::from_chars(hh.data(), hh.data() + hh.size(), hours);
    const auto [mp, me] = std::from_chars(mm.data(), mm.data() + mm.size(), minutes);
    if (he != std::errc{} || me != std::errc{} || hp != hh.data() + hh.size() || mm.size() != 2
        || hours < 0 || hours > 23 || minutes < 0 || minutes > 59)
    {
        return std::nullopt;
    }
    return std::chrono::minutes{hours * 60 + minutes};
}

} // namespace skybrief::sources::payload

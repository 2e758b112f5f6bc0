#pragma once

/// @file payload.hpp
/// @brief Tolerant field readers for third-party JSON payloads.

#include "astro/instant.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace skybrief::sources::payload
{
    /// @brief Number, or a string holding one ("2.67", "93%").
    [[nodiscard]] std::optional<f64> as_number(const nlohmann::json& value);

    [[nodiscard]] std::optional<f64> number_at(const nlohmann::json& obj, std::string_view key);

    [[nodiscard]] std::optional<std::string> string_at(const nlohmann::json& obj, std::string_view key);

    /// @brief ISO-8601 timestamp; zone-less values take @p assumed_offset.
    [[nodiscard]] std::optional<astro::Instant> instant_at(
        const nlohmann::json& obj, std::string_view key,
        std::optional<std::chrono::minutes> assumed_offset = std::nullopt);

    /// @brief "HH:MM" → time since midnight.
    [[nodiscard]] std::optional<std::chrono::minutes> parse_hhmm(std::string_view text);

} // namespace skybrief::sources::payload

#pragma once

/// @file errors.hpp
/// @brief Exception type for whole-run input rejection.

#include <stdexcept>
#include <string>

namespace skybrief
{
    /// @brief Thrown when a location or instant cannot be used for any calculation.
    ///
    /// Raised before a single calculator runs. Per-domain failures are never
    /// reported this way; they surface as UNAVAILABLE source results.
    class InvalidInputError : public std::invalid_argument
    {
    public:
        explicit InvalidInputError(const std::string& what_arg)
            : std::invalid_argument(what_arg)
        {
        }
    };

} // namespace skybrief

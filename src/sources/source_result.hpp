#pragma once

/// @file source_result.hpp
/// @brief Per-domain result carrying provenance.

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace skybrief::sources
{
    enum class Provenance : u8
    {
        Live,           ///< Parsed from a successful network fetch
        LocalFallback,  ///< Computed by the local astronomical algorithms
        Unavailable,    ///< No value
    };

    enum class FailureKind : u8
    {
        Disabled,           ///< Live source switched off in configuration
        Timeout,
        Network,
        HttpStatus,         ///< Non-2xx response
        MalformedPayload,   ///< Unexpected or partial JSON
        NoLocalAlgorithm,   ///< Domain cannot be computed offline
        CalculatorFault,    ///< Calculator threw; isolated by the orchestrator
        Cancelled,
    };

    struct SourceFailure
    {
        FailureKind kind;
        std::string detail;
    };

    [[nodiscard]] std::string_view to_string(Provenance provenance);
    [[nodiscard]] std::string_view to_string(FailureKind kind);

    /// @brief A domain value with its provenance.
    ///
    /// LIVE and LOCAL_FALLBACK always carry a value; UNAVAILABLE never does and
    /// always carries the failure that caused it. A LOCAL_FALLBACK may keep the
    /// live failure it replaced, for diagnostics.
    template <typename T>
    class SourceResult
    {
    public:
        [[nodiscard]] static SourceResult live(T value)
        {
            return SourceResult{Provenance::Live, std::move(value), std::nullopt};
        }

        [[nodiscard]] static SourceResult local_fallback(T value,
                                                         std::optional<SourceFailure> live_failure = std::nullopt)
        {
            return SourceResult{Provenance::LocalFallback, std::move(value), std::move(live_failure)};
        }

        [[nodiscard]] static SourceResult unavailable(SourceFailure reason)
        {
            return SourceResult{Provenance::Unavailable, std::nullopt, std::move(reason)};
        }

        [[nodiscard]] Provenance provenance() const { return m_provenance; }
        [[nodiscard]] bool has_value() const { return m_value.has_value(); }

        /// @throws std::logic_error when UNAVAILABLE.
        [[nodiscard]] const T& value() const
        {
            if (!m_value)
            {
                throw std::logic_error("SourceResult::value() on an unavailable result");
            }
            return *m_value;
        }

        /// @brief nullptr when UNAVAILABLE.
        [[nodiscard]] const T* get() const { return m_value ? &*m_value : nullptr; }

        [[nodiscard]] const std::optional<SourceFailure>& failure() const { return m_failure; }

    private:
        SourceResult(Provenance provenance, std::optional<T> value, std::optional<SourceFailure> failure)
            : m_provenance(provenance)
            , m_value(std::move(value))
            , m_failure(std::move(failure))
        {
        }

        Provenance                   m_provenance;
        std::optional<T>             m_value;
        std::optional<SourceFailure> m_failure;
    };

} // namespace skybrief::sources

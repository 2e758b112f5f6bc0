#pragma once

/// @file calculator.hpp
/// @brief Live-then-local calculation protocol shared by every domain.

#include "astro/instant.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "net/json_fetcher.hpp"
#include "sources/domain.hpp"
#include "sources/geo_location.hpp"
#include "sources/source_fetcher.hpp"
#include "sources/source_result.hpp"

#include <memory>
#include <optional>
#include <stop_token>
#include <utility>
#include <variant>

namespace skybrief::sources
{
    /// @brief Inputs of one calculation. @c instant already carries the
    /// location's UTC offset, so local_date() is the observer's date.
    struct CalculationContext
    {
        GeoLocation    location;
        astro::Instant instant;
    };

    template <typename T>
    using LiveOutcome = std::variant<T, SourceFailure>;

    /// @brief Base for the per-domain calculators.
    ///
    /// compute() runs the protocol: the live source if the domain has one
    /// and it is enabled, then the local algorithm on any live failure,
    /// else UNAVAILABLE with the live failure as reason. Subclasses only
    /// implement compute_live() and/or compute_local().
    template <typename T>
    class Calculator
    {
    public:
        using Value = T;

        virtual ~Calculator() = default;

        Calculator(const Calculator&) = delete;
        Calculator& operator=(const Calculator&) = delete;

        [[nodiscard]] virtual Domain domain() const = 0;
        [[nodiscard]] virtual bool has_live_source() const { return false; }
        [[nodiscard]] virtual bool has_local_algorithm() const { return false; }

        /// @throws InvalidInputError for an unusable location or instant.
        [[nodiscard]] SourceResult<T> compute(const GeoLocation& location,
                                              const astro::Instant& instant,
                                              std::stop_token stop = {}) const
        {
            require_valid(location, instant);

            const CalculationContext ctx{
                .location = location,
                .instant  = local_instant(location, instant),
            };

            std::optional<SourceFailure> live_failure;

            if (has_live_source())
            {
                if (!m_settings.enabled || !m_fetcher)
                {
                    live_failure = SourceFailure{FailureKind::Disabled, "live source disabled"};
                }
                else
                {
                    SourceFetcher fetcher{*m_fetcher, m_settings, stop};
                    auto outcome = compute_live(ctx, fetcher);
                    if (auto* value = std::get_if<T>(&outcome))
                    {
                        return SourceResult<T>::live(std::move(*value));
                    }

                    live_failure = std::get<SourceFailure>(std::move(outcome));
                    SKB_CORE_WARN("{}: live source failed ({}): {}",
                                  to_string(domain()), to_string(live_failure->kind), live_failure->detail);
                }
            }

            if (stop.stop_requested())
            {
                return SourceResult<T>::unavailable(SourceFailure{FailureKind::Cancelled, "aggregation cancelled"});
            }

            if (has_local_algorithm())
            {
                if (auto local = compute_local(ctx))
                {
                    if (live_failure)
                    {
                        SKB_CORE_INFO("{}: using local fallback", to_string(domain()));
                    }
                    return SourceResult<T>::local_fallback(std::move(*local), std::move(live_failure));
                }
            }

            if (!live_failure)
            {
                live_failure = SourceFailure{FailureKind::NoLocalAlgorithm, "no source produced a value"};
            }
            SKB_CORE_WARN("{}: unavailable ({})", to_string(domain()), to_string(live_failure->kind));
            return SourceResult<T>::unavailable(std::move(*live_failure));
        }

    protected:
        Calculator() = default;

        Calculator(std::shared_ptr<net::JsonFetcher> fetcher, core::SourceSettings settings)
            : m_fetcher(std::move(fetcher))
            , m_settings(std::move(settings))
        {
        }

        [[nodiscard]] virtual LiveOutcome<T> compute_live(const CalculationContext& /*ctx*/,
                                                          SourceFetcher& /*fetcher*/) const
        {
            return SourceFailure{FailureKind::Disabled, "no live source"};
        }

        [[nodiscard]] virtual std::optional<T> compute_local(const CalculationContext& /*ctx*/) const
        {
            return std::nullopt;
        }

        [[nodiscard]] const core::SourceSettings& settings() const { return m_settings; }

    private:
        std::shared_ptr<net::JsonFetcher> m_fetcher;
        core::SourceSettings              m_settings;
    };

} // namespace skybrief::sources

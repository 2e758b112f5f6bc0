/// @file source_result.cpp
/// @brief String names for provenance and failure kinds.

#include "sources/source_result.hpp"

namespace skybrief::sources
{

std::string_view to_string(Provenance provenance)
{
    switch (provenance)
    {
        case Provenance::Live:          return "live";
        case Provenance::LocalFallback: return "local_fallback";
        case Provenance::Unavailable:   return "unavailable";
    }
    return "unknown";
}

std::string_view to_string(FailureKind kind)
{
    switch (kind)
    {
        case FailureKind::Disabled:         return "disabled";
        case FailureKind::Timeout:          return "timeout";
        case FailureKind::Network:          return "network_error";
        case FailureKind::HttpStatus:       return "http_status";
        case FailureKind::MalformedPayload: return "malformed_payload";
        case FailureKind::NoLocalAlgorithm: return "no_local_algorithm";
        case FailureKind::CalculatorFault:  return "calculator_fault";
        case FailureKind::Cancelled:        return "cancelled";
    }
    return "unknown";
}

} // namespace skybrief::sources

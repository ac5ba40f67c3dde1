/**
 * @file types.cpp
 * @brief String conversions for core enums
 */

#include "peerbench/core/types.hpp"

namespace peerbench {

const char* to_string(AccessMode mode) {
    switch (mode) {
        case AccessMode::Precomputed: return "Precomputed";
        case AccessMode::RawFallback: return "RawFallback";
        case AccessMode::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* to_string(QueryKind kind) {
    switch (kind) {
        case QueryKind::KpiValues: return "kpi_values";
        case QueryKind::Benchmarks: return "benchmarks";
    }
    return "unknown";
}

const char* to_string(Provenance provenance) {
    switch (provenance) {
        case Provenance::Precomputed: return "precomputed";
        case Provenance::RawFallback: return "raw_fallback";
        case Provenance::None: return "none";
    }
    return "unknown";
}

} // namespace peerbench

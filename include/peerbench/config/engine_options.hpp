#pragma once

#include "peerbench/core/types.hpp"
#include <cstdint>
#include <string>

namespace peerbench {

/// Engine configuration (paths and tuning knobs)
struct EngineOptions {
    // Inputs
    std::string line_items_path;        ///< Line items CSV (empty = no raw source)
    std::string aggregates_path;        ///< Aggregate definitions CSV
    std::string kpis_path;              ///< KPI definitions CSV
    std::string scopes_path;            ///< Scopes CSV (empty = default scopes)
    std::string entities_path;          ///< Entity dimensions CSV (optional)
    bool derive_ccn_dimensions = true;  ///< Derive region/category from CCN ids

    // Persisted generations
    std::string store_root;             ///< Generation store directory (empty = in-memory only)
    size_t generations_to_keep = constants::DEFAULT_GENERATIONS_TO_KEEP;
    int compression_level = constants::DEFAULT_COMPRESSION_LEVEL;

    // Result cache
    size_t cache_capacity = constants::DEFAULT_CACHE_CAPACITY;
    size_t cache_shards = constants::DEFAULT_CACHE_SHARDS;
    int64_t cache_ttl_ms = constants::DEFAULT_CACHE_TTL_MS;
    int64_t negative_ttl_ms = constants::DEFAULT_NEGATIVE_TTL_MS;

    // RawFallback
    int64_t fallback_timeout_ms = constants::DEFAULT_FALLBACK_TIMEOUT_MS;  ///< 0 = run inline, no timeout
    size_t fallback_workers = constants::DEFAULT_FALLBACK_WORKERS;

    // Capability detection
    int64_t reprobe_interval_ms = constants::DEFAULT_REPROBE_INTERVAL_MS;
};

} // namespace peerbench

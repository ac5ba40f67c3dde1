#pragma once

/**
 * @file types.hpp
 * @brief Core data types for the peerbench analytics engine
 *
 * This file defines the fundamental records shared by the line-item store,
 * the KPI/benchmark computation, the persisted generations and the
 * serving layer.
 */

#include <vector>
#include <string>
#include <cstdint>
#include <map>
#include <optional>
#include <functional>
#include <tuple>

namespace peerbench {

using EntityId = std::string;
using Period = int32_t;
using KpiKey = std::string;

/// Computed KPI value; empty means insufficient data (never zero)
using KpiValue = std::optional<double>;

// ============================================================================
// Source Records
// ============================================================================

/**
 * @brief One financial line item as delivered by the upstream loader
 *
 * Unique per (entity_id, period, line, column).
 */
struct LineItem {
    EntityId entity_id;     ///< Reporting entity identifier
    Period period;          ///< Reporting year
    std::string line;       ///< Categorical line code (e.g. "CA")
    std::string column;     ///< Categorical column code (e.g. "TOTAL")
    double value;           ///< Reported amount

    LineItem() : period(0), value(0.0) {}

    LineItem(EntityId entity, Period p, std::string l, std::string c, double v)
        : entity_id(std::move(entity)), period(p)
        , line(std::move(l)), column(std::move(c)), value(v) {}
};

// ============================================================================
// Computed Records
// ============================================================================

/**
 * @brief One row of the kpi_values table
 */
struct KpiValueRecord {
    EntityId entity_id;
    Period period = 0;
    KpiKey kpi_key;
    KpiValue value;

    bool operator==(const KpiValueRecord& other) const {
        return entity_id == other.entity_id && period == other.period &&
               kpi_key == other.kpi_key && value == other.value;
    }
};

/**
 * @brief Percentile summary of one peer group
 *
 * Invariant when sample_count > 0: p25 <= median <= p75.
 */
struct BenchmarkStat {
    double p25;             ///< 25th percentile (continuous)
    double median;          ///< 50th percentile (continuous)
    double p75;             ///< 75th percentile (continuous)
    double mean;            ///< Arithmetic mean of the samples
    uint64_t sample_count;  ///< Number of non-null contributing values

    BenchmarkStat() : p25(0.0), median(0.0), p75(0.0), mean(0.0), sample_count(0) {}

    bool operator==(const BenchmarkStat& other) const {
        return p25 == other.p25 && median == other.median && p75 == other.p75 &&
               mean == other.mean && sample_count == other.sample_count;
    }
};

/**
 * @brief Identifies one benchmark row: KPI, scope, scope key and period
 */
struct BenchmarkKey {
    KpiKey kpi_key;
    std::string scope;
    std::string scope_key;
    Period period = 0;

    BenchmarkKey() = default;
    BenchmarkKey(KpiKey kpi, std::string s, std::string key, Period p)
        : kpi_key(std::move(kpi)), scope(std::move(s))
        , scope_key(std::move(key)), period(p) {}

    bool operator==(const BenchmarkKey& other) const {
        return kpi_key == other.kpi_key && scope == other.scope &&
               scope_key == other.scope_key && period == other.period;
    }

    bool operator<(const BenchmarkKey& other) const {
        return std::tie(kpi_key, scope, period, scope_key) <
               std::tie(other.kpi_key, other.scope, other.period, other.scope_key);
    }
};

/**
 * @brief One row of the benchmark_stats table
 */
struct BenchmarkRecord {
    BenchmarkKey key;
    BenchmarkStat stat;

    bool operator==(const BenchmarkRecord& other) const {
        return key == other.key && stat == other.stat;
    }
};

// ============================================================================
// Serving Types
// ============================================================================

/// Access mode of one query kind
enum class AccessMode {
    Precomputed,    ///< Persisted generation tables are readable
    RawFallback,    ///< Compute on the fly from line items
    Unavailable     ///< Neither path is usable
};

/// Query kinds tracked independently by the capability detector
enum class QueryKind {
    KpiValues,
    Benchmarks
};

/// Where a response came from
enum class Provenance {
    Precomputed,
    RawFallback,
    None            ///< Explicit "no data" (source unavailable or timed out)
};

const char* to_string(AccessMode mode);
const char* to_string(QueryKind kind);
const char* to_string(Provenance provenance);

/**
 * @brief Result of get_kpis()
 *
 * KPI keys map to a value or to null (insufficient data). A response with
 * Provenance::None carries no values at all.
 */
struct KpiResponse {
    std::map<KpiKey, KpiValue> values;
    Provenance provenance = Provenance::None;

    /// False for the explicit "no data" answer
    bool available() const { return provenance != Provenance::None; }

    /// True when at least one KPI has a value
    bool has_values() const {
        for (const auto& [key, value] : values) {
            if (value) return true;
        }
        return false;
    }
};

/**
 * @brief Result of get_benchmarks()
 */
struct BenchmarkResponse {
    std::optional<BenchmarkStat> stat;
    Provenance provenance = Provenance::None;

    bool available() const { return provenance != Provenance::None; }
};

/**
 * @brief Statistics about cache performance
 */
struct CacheStats {
    size_t hits;            ///< Number of cache hits
    size_t misses;          ///< Number of cache misses (expired entries included)
    size_t evictions;       ///< Entries dropped by LRU capacity
    size_t expirations;     ///< Entries dropped by TTL or invalidation
    size_t entries;         ///< Current number of entries
    size_t capacity;        ///< Maximum number of entries
    double hit_rate;        ///< Hit rate (0.0 - 1.0)

    CacheStats()
        : hits(0), misses(0), evictions(0), expirations(0)
        , entries(0), capacity(0), hit_rate(0.0) {}

    void update_hit_rate() {
        size_t total = hits + misses;
        hit_rate = total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

// ============================================================================
// Callback Types
// ============================================================================

/// Progress callback: receives stage name and percentage (0 - 100)
using ProgressCallback = std::function<void(const std::string&, int)>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    /// Default result cache capacity (entries)
    constexpr size_t DEFAULT_CACHE_CAPACITY = 4096;

    /// Default number of cache shards
    constexpr size_t DEFAULT_CACHE_SHARDS = 16;

    /// Default TTL for cached results (milliseconds)
    constexpr int64_t DEFAULT_CACHE_TTL_MS = 60 * 60 * 1000;

    /// TTL for cached absences and "no data" answers (milliseconds)
    constexpr int64_t DEFAULT_NEGATIVE_TTL_MS = 30 * 1000;

    /// Upper bound on one RawFallback request (milliseconds)
    constexpr int64_t DEFAULT_FALLBACK_TIMEOUT_MS = 5000;

    /// Worker threads serving RawFallback requests
    constexpr size_t DEFAULT_FALLBACK_WORKERS = 4;

    /// Minimum delay between re-probes while a query kind is degraded
    constexpr int64_t DEFAULT_REPROBE_INTERVAL_MS = 5000;

    /// Published generations kept on disk
    constexpr size_t DEFAULT_GENERATIONS_TO_KEEP = 2;

    /// ZSTD level for persisted tables
    constexpr int DEFAULT_COMPRESSION_LEVEL = 3;

    /// Group size above which the mean goes through Arrow compute
    constexpr size_t ARROW_MEAN_THRESHOLD = 10000;

    /// Scope key used by scopes without dimensions
    inline constexpr const char* ALL_SCOPE_KEY = "ALL";

    /// Separator between dimension values in composite scope keys
    constexpr char SCOPE_KEY_SEPARATOR = '|';

    /// Formula marker for KPIs with no source mapping
    inline constexpr const char* UNMAPPED_FORMULA = "UNMAPPED";
}

} // namespace peerbench

// ============================================================================
// Hash Functions (for std::unordered_map)
// ============================================================================

namespace std {
    template<>
    struct hash<peerbench::BenchmarkKey> {
        size_t operator()(const peerbench::BenchmarkKey& k) const {
            size_t h1 = hash<string>()(k.kpi_key);
            size_t h2 = hash<string>()(k.scope);
            size_t h3 = hash<string>()(k.scope_key);
            size_t h4 = hash<int32_t>()(k.period);
            return h1 ^ (h2 << 1) ^ (h3 << 2) ^ (h4 << 3);
        }
    };
}

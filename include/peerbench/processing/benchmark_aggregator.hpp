#pragma once

/**
 * @file benchmark_aggregator.hpp
 * @brief Peer-group percentile benchmarks for one KPI
 *
 * Groups per-entity KPI values by scope key and summarizes each group with
 * p25/median/p75 (continuous percentiles), mean and sample count. Null
 * values never enter a sample, and groups left without samples are omitted.
 */

#include "peerbench/config/scope_registry.hpp"
#include "peerbench/core/cancellation.hpp"
#include "peerbench/core/types.hpp"
#include "peerbench/data/entity_directory.hpp"
#include <map>
#include <string>
#include <vector>

namespace peerbench {

/// One entity's value of the KPI being benchmarked
struct EntityKpiValue {
    EntityId entity_id;
    KpiValue value;
};

class BenchmarkAggregator {
public:
    explicit BenchmarkAggregator(const EntityDirectory& directory);

    /**
     * @brief Summarize every scope key of a scope
     * @return scope_key -> stat, groups without samples omitted
     * @throws OperationCancelled when token is cancelled before a sort
     */
    std::map<std::string, BenchmarkStat> aggregate(const BenchmarkScope& scope,
                                                   const std::vector<EntityKpiValue>& values,
                                                   const CancellationToken* token = nullptr) const;

    /// aggregate() as benchmark_stats rows for (kpi_key, scope, period)
    std::vector<BenchmarkRecord> aggregate_records(const KpiKey& kpi_key,
                                                   const BenchmarkScope& scope,
                                                   Period period,
                                                   const std::vector<EntityKpiValue>& values,
                                                   const CancellationToken* token = nullptr) const;

    /**
     * @brief Summarize a single scope key only
     *
     * Used by on-the-fly benchmark queries; entities outside scope_key are
     * skipped without being grouped.
     */
    std::optional<BenchmarkStat> aggregate_group(const BenchmarkScope& scope,
                                                 const std::string& scope_key,
                                                 const std::vector<EntityKpiValue>& values,
                                                 const CancellationToken* token = nullptr) const;

private:
    const EntityDirectory& directory_;
};

// ============================================================================
// Peer Position
// ============================================================================

enum class QuartileBand {
    BottomQuartile,     ///< value <= p25
    BelowMedian,        ///< p25 < value <= median
    AboveMedian,        ///< median < value <= p75
    TopQuartile         ///< value > p75
};

const char* to_string(QuartileBand band);

QuartileBand classify_quartile(double value, const BenchmarkStat& stat);

/// Distance to the median in the "worse" direction; positive means below par
double performance_gap(double value, const BenchmarkStat& stat, bool higher_is_better);

} // namespace peerbench

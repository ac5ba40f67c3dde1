#pragma once

/**
 * @file query_router.hpp
 * @brief Tiered entry point for KPI and benchmark queries
 *
 * Each call goes: result cache -> access mode of the query kind ->
 *
 * - Precomputed: indexed lookup in the installed generation
 * - RawFallback: computation for just this request from the line items,
 *   on the fallback executor and bounded by the fallback timeout
 * - Unavailable, timeout or I/O failure: explicit "no data"
 *   (Provenance::None), never a zero
 *
 * and the response is cached (negative answers with the short TTL).
 *
 * Usage:
 * @code
 *   QueryRouter router(*context);
 *
 *   auto kpis = router.get_kpis("310001", 2024);
 *   if (kpis.available()) {
 *       double ratio = *kpis.values.at("current_ratio");
 *   }
 *
 *   auto bench = router.get_benchmarks("current_ratio", "by-region", "31", 2024);
 * @endcode
 */

#include "peerbench/core/cancellation.hpp"
#include "peerbench/core/engine_context.hpp"
#include "peerbench/processing/benchmark_aggregator.hpp"
#include "peerbench/processing/kpi_calculator.hpp"
#include "peerbench/serving/fallback_executor.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerbench {

/// Position of one entity's KPI value inside its peer group
struct PeerComparison {
    EntityId entity_id;
    Period period = 0;
    KpiKey kpi_key;
    std::string scope;
    std::optional<std::string> scope_key;   ///< Empty when the entity is outside the scope
    KpiValue value;
    std::optional<BenchmarkStat> stat;
    std::optional<QuartileBand> band;       ///< Set when both value and stat exist
    std::optional<double> gap;              ///< Distance to the median, positive = worse
    bool underperforming = false;
    Provenance kpi_provenance = Provenance::None;
    Provenance benchmark_provenance = Provenance::None;
};

class QueryRouter {
public:
    explicit QueryRouter(EngineContext& context);

    QueryRouter(const QueryRouter&) = delete;
    QueryRouter& operator=(const QueryRouter&) = delete;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief All KPI values of one entity/period
     *
     * An entity/period that was not part of the inputs gives an available
     * response with no values.
     */
    KpiResponse get_kpis(const EntityId& entity_id, Period period);

    /**
     * @brief Benchmark of one KPI for one peer group
     * @throws std::invalid_argument for an unknown KPI key or scope id
     */
    BenchmarkResponse get_benchmarks(const KpiKey& kpi_key, const std::string& scope,
                                     const std::string& scope_key, Period period);

    /**
     * @brief get_kpis() restricted to one level of the KPI tree
     * @throws std::invalid_argument when level is not 1, 2 or 3
     */
    KpiResponse get_kpis_for_level(const EntityId& entity_id, Period period, int level);

    /**
     * @brief Compare an entity's KPI with its peer group in a scope
     * @throws std::invalid_argument for an unknown KPI key or scope id
     */
    PeerComparison compare_to_peers(const EntityId& entity_id, Period period,
                                    const KpiKey& kpi_key, const std::string& scope);

    /// Entities with data for a period (empty when nothing can serve it)
    std::vector<EntityId> list_entities(Period period);

    // ========================================================================
    // Introspection
    // ========================================================================

    CacheStats cache_stats() const { return context_.cache().get_stats(); }

    static std::string kpi_cache_key(const EntityId& entity_id, Period period);

    static std::string benchmark_cache_key(const KpiKey& kpi_key, const std::string& scope,
                                           const std::string& scope_key, Period period);

private:
    KpiResponse fetch_kpis(const EntityId& entity_id, Period period);

    BenchmarkResponse fetch_benchmark(const KpiDefinition& def, const BenchmarkScope& scope,
                                      const std::string& scope_key, Period period);

    /// Values of one KPI for every entity of the period, computed from line items
    std::vector<EntityKpiValue> compute_peer_values(const ILineItemSource& source,
                                                    const KpiDefinition& def,
                                                    const BenchmarkScope& scope,
                                                    const std::string& scope_key,
                                                    Period period,
                                                    const CancellationToken* token) const;

    /**
     * @brief Run a RawFallback computation under the fallback timeout
     * @return nullopt on timeout, cancellation or an unreachable source (the
     *         last one is reported to the context)
     */
    template <typename Result, typename F>
    std::optional<Result> run_fallback(QueryKind kind, const std::string& what, F&& compute);

    std::chrono::milliseconds ttl_for(bool has_data) const;

    EngineContext& context_;
    KpiCalculator calculator_;
    BenchmarkAggregator aggregator_;
    std::unique_ptr<FallbackExecutor> executor_;    ///< Null when fallback runs inline
};

} // namespace peerbench

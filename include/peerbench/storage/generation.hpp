#pragma once

/**
 * @file generation.hpp
 * @brief Immutable, id-stamped snapshot of the computed tables
 *
 * A Generation owns the kpi_values and benchmark_stats rows produced by one
 * build together with their lookup indexes. It is never modified after
 * construction; serving threads share it through shared_ptr<const Generation>,
 * so a reader holding the previous generation keeps a consistent view while a
 * new one is installed.
 *
 * Either table may be missing (a partially readable store on disk); the
 * has_*_table() flags tell the capability detector which query kinds can be
 * served from this generation.
 */

#include "peerbench/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerbench {

class Generation {
public:
    /**
     * @brief Build a generation and its indexes
     *
     * Rows are sorted into canonical order, so the content checksum does not
     * depend on the order the rows were produced in.
     *
     * @throws std::invalid_argument on duplicate keys
     */
    Generation(std::string id,
               std::vector<KpiValueRecord> kpi_values,
               std::vector<BenchmarkRecord> benchmark_stats,
               bool has_kpi_table = true,
               bool has_benchmark_table = true);

    Generation(const Generation&) = delete;
    Generation& operator=(const Generation&) = delete;

    const std::string& id() const { return id_; }

    bool has_kpi_table() const { return has_kpi_table_; }
    bool has_benchmark_table() const { return has_benchmark_table_; }

    // ========================================================================
    // Indexed Lookups
    // ========================================================================

    /**
     * @brief All KPI values of one entity/period
     * @return Empty map when the entity/period was not part of the build
     */
    std::map<KpiKey, KpiValue> find_kpis(const EntityId& entity_id, Period period) const;

    /// One KPI value; nullopt when absent (null values come back as KpiValue{})
    std::optional<KpiValue> find_kpi(const EntityId& entity_id, Period period,
                                     const KpiKey& kpi_key) const;

    /// One benchmark row; nullopt when the group had no samples
    std::optional<BenchmarkStat> find_benchmark(const BenchmarkKey& key) const;

    /// Entities with rows in a period, sorted
    std::vector<EntityId> entities(Period period) const;

    // ========================================================================
    // Content
    // ========================================================================

    const std::vector<KpiValueRecord>& kpi_values() const { return kpi_values_; }
    const std::vector<BenchmarkRecord>& benchmark_stats() const { return benchmark_stats_; }

    size_t kpi_row_count() const { return kpi_values_.size(); }
    size_t non_null_kpi_count() const;
    size_t benchmark_row_count() const { return benchmark_stats_.size(); }

    /// FNV-1a over both tables; excludes the generation id
    uint64_t content_checksum() const { return checksum_; }

private:
    struct EntityPeriodKey {
        EntityId entity_id;
        Period period;

        bool operator==(const EntityPeriodKey& other) const {
            return period == other.period && entity_id == other.entity_id;
        }
    };

    struct EntityPeriodKeyHash {
        size_t operator()(const EntityPeriodKey& k) const {
            return std::hash<std::string>()(k.entity_id) ^
                   (std::hash<int32_t>()(k.period) << 1);
        }
    };

    struct RowRange {
        size_t begin;
        size_t end;
    };

    void build_indexes();
    void compute_checksum();

    std::string id_;
    std::vector<KpiValueRecord> kpi_values_;        ///< Sorted by entity, period, kpi
    std::vector<BenchmarkRecord> benchmark_stats_;  ///< Sorted by BenchmarkKey
    bool has_kpi_table_;
    bool has_benchmark_table_;

    std::unordered_map<EntityPeriodKey, RowRange, EntityPeriodKeyHash> kpi_index_;
    std::unordered_map<BenchmarkKey, size_t> benchmark_index_;
    uint64_t checksum_ = 0;
};

} // namespace peerbench

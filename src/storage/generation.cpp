#include "peerbench/storage/generation.hpp"
#include "peerbench/core/hashing.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <tuple>

namespace peerbench {

Generation::Generation(std::string id,
                       std::vector<KpiValueRecord> kpi_values,
                       std::vector<BenchmarkRecord> benchmark_stats,
                       bool has_kpi_table,
                       bool has_benchmark_table)
    : id_(std::move(id))
    , kpi_values_(std::move(kpi_values))
    , benchmark_stats_(std::move(benchmark_stats))
    , has_kpi_table_(has_kpi_table)
    , has_benchmark_table_(has_benchmark_table)
{
    std::sort(kpi_values_.begin(), kpi_values_.end(),
              [](const KpiValueRecord& a, const KpiValueRecord& b) {
                  return std::tie(a.entity_id, a.period, a.kpi_key) <
                         std::tie(b.entity_id, b.period, b.kpi_key);
              });
    std::sort(benchmark_stats_.begin(), benchmark_stats_.end(),
              [](const BenchmarkRecord& a, const BenchmarkRecord& b) {
                  return a.key < b.key;
              });

    build_indexes();
    compute_checksum();
}

void Generation::build_indexes() {
    size_t begin = 0;
    while (begin < kpi_values_.size()) {
        const auto& first = kpi_values_[begin];
        size_t end = begin + 1;
        while (end < kpi_values_.size() &&
               kpi_values_[end].entity_id == first.entity_id &&
               kpi_values_[end].period == first.period) {
            if (kpi_values_[end].kpi_key == kpi_values_[end - 1].kpi_key) {
                throw std::invalid_argument("Duplicate KPI value: entity=" + first.entity_id +
                                            " period=" + std::to_string(first.period) +
                                            " kpi=" + kpi_values_[end].kpi_key);
            }
            ++end;
        }
        kpi_index_.emplace(EntityPeriodKey{first.entity_id, first.period}, RowRange{begin, end});
        begin = end;
    }

    benchmark_index_.reserve(benchmark_stats_.size());
    for (size_t i = 0; i < benchmark_stats_.size(); ++i) {
        if (!benchmark_index_.emplace(benchmark_stats_[i].key, i).second) {
            const auto& key = benchmark_stats_[i].key;
            throw std::invalid_argument("Duplicate benchmark: kpi=" + key.kpi_key +
                                        " scope=" + key.scope + " key=" + key.scope_key +
                                        " period=" + std::to_string(key.period));
        }
    }
}

void Generation::compute_checksum() {
    Fnv1aHasher hasher;

    hasher.update(static_cast<uint64_t>(kpi_values_.size()));
    for (const auto& row : kpi_values_) {
        hasher.update(row.entity_id);
        hasher.update(static_cast<int64_t>(row.period));
        hasher.update(row.kpi_key);
        hasher.update(static_cast<uint64_t>(row.value.has_value()));
        hasher.update(row.value.value_or(0.0));
    }

    hasher.update(static_cast<uint64_t>(benchmark_stats_.size()));
    for (const auto& row : benchmark_stats_) {
        hasher.update(row.key.kpi_key);
        hasher.update(row.key.scope);
        hasher.update(row.key.scope_key);
        hasher.update(static_cast<int64_t>(row.key.period));
        hasher.update(row.stat.p25);
        hasher.update(row.stat.median);
        hasher.update(row.stat.p75);
        hasher.update(row.stat.mean);
        hasher.update(row.stat.sample_count);
    }

    checksum_ = hasher.digest();
}

std::map<KpiKey, KpiValue> Generation::find_kpis(const EntityId& entity_id, Period period) const {
    std::map<KpiKey, KpiValue> result;
    auto it = kpi_index_.find(EntityPeriodKey{entity_id, period});
    if (it == kpi_index_.end()) {
        return result;
    }
    for (size_t i = it->second.begin; i < it->second.end; ++i) {
        result.emplace(kpi_values_[i].kpi_key, kpi_values_[i].value);
    }
    return result;
}

std::optional<KpiValue> Generation::find_kpi(const EntityId& entity_id, Period period,
                                             const KpiKey& kpi_key) const {
    auto it = kpi_index_.find(EntityPeriodKey{entity_id, period});
    if (it == kpi_index_.end()) {
        return std::nullopt;
    }
    auto first = kpi_values_.begin() + static_cast<std::ptrdiff_t>(it->second.begin);
    auto last = kpi_values_.begin() + static_cast<std::ptrdiff_t>(it->second.end);
    auto row = std::lower_bound(first, last, kpi_key,
                                [](const KpiValueRecord& r, const KpiKey& key) {
                                    return r.kpi_key < key;
                                });
    if (row == last || row->kpi_key != kpi_key) {
        return std::nullopt;
    }
    return row->value;
}

std::optional<BenchmarkStat> Generation::find_benchmark(const BenchmarkKey& key) const {
    auto it = benchmark_index_.find(key);
    if (it == benchmark_index_.end()) {
        return std::nullopt;
    }
    return benchmark_stats_[it->second].stat;
}

std::vector<EntityId> Generation::entities(Period period) const {
    std::set<EntityId> result;
    for (const auto& [key, range] : kpi_index_) {
        if (key.period == period) {
            result.insert(key.entity_id);
        }
    }
    return std::vector<EntityId>(result.begin(), result.end());
}

size_t Generation::non_null_kpi_count() const {
    return static_cast<size_t>(std::count_if(kpi_values_.begin(), kpi_values_.end(),
                                             [](const KpiValueRecord& r) { return r.value.has_value(); }));
}

} // namespace peerbench

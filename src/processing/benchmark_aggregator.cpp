#include "peerbench/processing/benchmark_aggregator.hpp"
#include "peerbench/processing/statistics_engine.hpp"

namespace peerbench {

BenchmarkAggregator::BenchmarkAggregator(const EntityDirectory& directory)
    : directory_(directory)
{
}

std::map<std::string, BenchmarkStat> BenchmarkAggregator::aggregate(
    const BenchmarkScope& scope,
    const std::vector<EntityKpiValue>& values,
    const CancellationToken* token
) const {
    std::map<std::string, std::vector<double>> groups;
    for (const auto& entry : values) {
        if (!entry.value) {
            continue;
        }
        auto key = scope.scope_key_for(entry.entity_id, directory_);
        if (!key) {
            continue;
        }
        groups[*key].push_back(*entry.value);
    }

    std::map<std::string, BenchmarkStat> result;
    for (auto& [key, samples] : groups) {
        auto stat = StatisticsEngine::summarize(std::move(samples), token);
        if (stat) {
            result.emplace(key, *stat);
        }
    }
    return result;
}

std::vector<BenchmarkRecord> BenchmarkAggregator::aggregate_records(
    const KpiKey& kpi_key,
    const BenchmarkScope& scope,
    Period period,
    const std::vector<EntityKpiValue>& values,
    const CancellationToken* token
) const {
    std::vector<BenchmarkRecord> records;
    for (const auto& [scope_key, stat] : aggregate(scope, values, token)) {
        BenchmarkRecord record;
        record.key = BenchmarkKey(kpi_key, scope.id, scope_key, period);
        record.stat = stat;
        records.push_back(std::move(record));
    }
    return records;
}

std::optional<BenchmarkStat> BenchmarkAggregator::aggregate_group(
    const BenchmarkScope& scope,
    const std::string& scope_key,
    const std::vector<EntityKpiValue>& values,
    const CancellationToken* token
) const {
    std::vector<double> samples;
    for (const auto& entry : values) {
        if (!entry.value) {
            continue;
        }
        auto key = scope.scope_key_for(entry.entity_id, directory_);
        if (key && *key == scope_key) {
            samples.push_back(*entry.value);
        }
    }
    return StatisticsEngine::summarize(std::move(samples), token);
}

// ============================================================================
// Peer Position
// ============================================================================

const char* to_string(QuartileBand band) {
    switch (band) {
        case QuartileBand::BottomQuartile: return "Bottom Quartile";
        case QuartileBand::BelowMedian: return "Below Median";
        case QuartileBand::AboveMedian: return "Above Median";
        case QuartileBand::TopQuartile: return "Top Quartile";
    }
    return "Unknown";
}

QuartileBand classify_quartile(double value, const BenchmarkStat& stat) {
    if (value <= stat.p25) return QuartileBand::BottomQuartile;
    if (value <= stat.median) return QuartileBand::BelowMedian;
    if (value <= stat.p75) return QuartileBand::AboveMedian;
    return QuartileBand::TopQuartile;
}

double performance_gap(double value, const BenchmarkStat& stat, bool higher_is_better) {
    return higher_is_better ? stat.median - value : value - stat.median;
}

} // namespace peerbench

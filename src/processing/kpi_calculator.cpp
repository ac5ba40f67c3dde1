#include "peerbench/processing/kpi_calculator.hpp"
#include <cmath>

namespace peerbench {

KpiCalculator::KpiCalculator(const KpiRegistry& registry)
    : registry_(registry)
    , required_aggregates_(registry.required_aggregates())
{
}

AggregateValues KpiCalculator::resolve_aggregates(const LineItemSlice& items,
                                                  const std::vector<std::string>& names) const {
    std::vector<const AggregateDefinition*> defs;
    defs.reserve(names.size());

    AggregateValues values;
    for (const auto& name : names) {
        const AggregateDefinition* def = registry_.find_aggregate(name);
        if (def) {
            defs.push_back(def);
            values[name] = AggregateValue();
        }
    }

    for (size_t row = 0; row < items.size(); ++row) {
        const auto line = items.line_at(row);
        const auto column = items.column_at(row);
        const double value = items.value_at(row);

        for (const AggregateDefinition* def : defs) {
            if (def->matches(line, column)) {
                auto& agg = values[def->name];
                agg.sum += value;
                ++agg.count;
            }
        }
    }

    return values;
}

KpiResult KpiCalculator::compute(const KpiDefinition& def, const LineItemSlice& items,
                                 const CancellationToken* token) const {
    if (def.is_unmapped()) {
        return KpiResult::null(KpiStatus::Unmapped);
    }

    AggregateValues values = resolve_aggregates(items, def.dependencies);
    check_cancelled(token, "aggregate resolution");
    return evaluate(def, values);
}

std::vector<KpiResult> KpiCalculator::compute_all(const LineItemSlice& items,
                                                  const CancellationToken* token) const {
    AggregateValues values = resolve_aggregates(items, required_aggregates_);
    check_cancelled(token, "aggregate resolution");

    std::vector<KpiResult> results;
    results.reserve(registry_.size());
    for (const auto& def : registry_.definitions()) {
        results.push_back(evaluate(def, values));
    }
    return results;
}

std::map<KpiKey, KpiValue> KpiCalculator::compute_values(const LineItemSlice& items,
                                                         const CancellationToken* token) const {
    std::vector<KpiResult> results = compute_all(items, token);

    std::map<KpiKey, KpiValue> values;
    const auto& defs = registry_.definitions();
    for (size_t i = 0; i < defs.size(); ++i) {
        values.emplace(defs[i].key, results[i].as_value());
    }
    return values;
}

KpiResult KpiCalculator::evaluate(const KpiDefinition& def, const AggregateValues& values) const {
    if (def.is_unmapped()) {
        return KpiResult::null(KpiStatus::Unmapped);
    }
    return finalize(def, def.formula->evaluate(values));
}

KpiResult KpiCalculator::finalize(const KpiDefinition& def, KpiResult raw) {
    if (!raw.ok()) {
        return raw;
    }
    if (!std::isfinite(raw.value)) {
        return KpiResult::null(KpiStatus::InsufficientData);
    }
    if (def.decimals) {
        const double scale = std::pow(10.0, *def.decimals);
        raw.value = std::round(raw.value * scale) / scale;
    }
    return raw;
}

} // namespace peerbench

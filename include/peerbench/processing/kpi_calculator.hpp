#pragma once

/**
 * @file kpi_calculator.hpp
 * @brief Computes KPI values for one entity/period from its line items
 *
 * The calculator is pure: no I/O, no shared mutable state. The same slice
 * and definition always give the same result, so it is safe to call from
 * the build pipeline's worker threads and from concurrent fallback queries.
 */

#include "peerbench/config/kpi_registry.hpp"
#include "peerbench/core/cancellation.hpp"
#include "peerbench/data/line_item_source.hpp"
#include "peerbench/processing/formula.hpp"
#include <map>
#include <string>
#include <vector>

namespace peerbench {

class KpiCalculator {
public:
    explicit KpiCalculator(const KpiRegistry& registry);

    /**
     * @brief Sum the named aggregates over a slice
     *
     * Each aggregate reports its sum and the number of rows that matched;
     * a count of zero means the source did not report it.
     */
    AggregateValues resolve_aggregates(const LineItemSlice& items,
                                       const std::vector<std::string>& names) const;

    /**
     * @brief Compute one KPI
     *
     * InsufficientData when a referenced aggregate is missing, ZeroDenominator
     * when a divisor is exactly zero, Unmapped for UNMAPPED KPIs.
     *
     * @throws OperationCancelled if token is cancelled after aggregate resolution
     */
    KpiResult compute(const KpiDefinition& def, const LineItemSlice& items,
                      const CancellationToken* token = nullptr) const;

    /**
     * @brief Compute every registered KPI, in registry order
     *
     * Aggregates are resolved once and shared by all formulas.
     */
    std::vector<KpiResult> compute_all(const LineItemSlice& items,
                                       const CancellationToken* token = nullptr) const;

    /// compute_all() keyed by KPI key, nulls included
    std::map<KpiKey, KpiValue> compute_values(const LineItemSlice& items,
                                              const CancellationToken* token = nullptr) const;

    /// Apply rounding and the non-finite check to a raw formula result
    static KpiResult finalize(const KpiDefinition& def, KpiResult raw);

    const KpiRegistry& registry() const { return registry_; }

private:
    KpiResult evaluate(const KpiDefinition& def, const AggregateValues& values) const;

    const KpiRegistry& registry_;
    std::vector<std::string> required_aggregates_;
};

} // namespace peerbench

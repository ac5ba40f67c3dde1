#pragma once

/**
 * @file kpi_registry.hpp
 * @brief Typed, validated registry of aggregates and the 3-level KPI tree
 *
 * The registry is built once at startup from the static configuration and
 * is read-only afterwards. Construction validates the whole configuration and
 * throws ConfigurationError on the first problem found:
 * - duplicate KPI keys or aggregate names
 * - level outside 1..3, level-1 KPIs with a parent, L2/L3 KPIs without one
 * - dangling parent references and parent cycles
 * - parent level not exactly one above the child
 * - formula syntax errors and references to undefined aggregates
 *
 * A KPI whose formula is the literal UNMAPPED has no source mapping and
 * always evaluates to null.
 */

#include "peerbench/core/types.hpp"
#include "peerbench/processing/formula.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace peerbench {

// ============================================================================
// Aggregates
// ============================================================================

/**
 * @brief (line, column) pattern pair
 *
 * A pattern is an exact code, a prefix ending in '*' ("G3_*"), or "*" alone.
 */
struct LineItemPredicate {
    std::string line;
    std::string column;

    LineItemPredicate() = default;
    LineItemPredicate(std::string l, std::string c) : line(std::move(l)), column(std::move(c)) {}

    static bool pattern_matches(std::string_view pattern, std::string_view code);

    bool matches(std::string_view line_code, std::string_view column_code) const {
        return pattern_matches(line, line_code) && pattern_matches(column, column_code);
    }
};

/**
 * @brief Named sum over the line items matching any predicate
 */
struct AggregateDefinition {
    std::string name;
    std::vector<LineItemPredicate> predicates;

    bool matches(std::string_view line_code, std::string_view column_code) const {
        for (const auto& p : predicates) {
            if (p.matches(line_code, column_code)) return true;
        }
        return false;
    }
};

// ============================================================================
// KPI Definitions
// ============================================================================

struct KpiDefinition {
    KpiKey key;
    int level = 1;                      ///< 1 = summary, 2 = driver, 3 = detail
    std::optional<KpiKey> parent_key;
    std::string formula_text;
    std::string unit;
    bool higher_is_better = true;
    std::optional<int> decimals;        ///< Round the computed value when set
    std::string label;

    expr::ExprPtr formula;              ///< Parsed formula; null when unmapped
    std::vector<std::string> dependencies;

    bool is_unmapped() const { return formula == nullptr; }
};

// ============================================================================
// Registry
// ============================================================================

class KpiRegistry {
public:
    /**
     * @brief Parse formulas and validate the configuration
     * @throws ConfigurationError
     */
    KpiRegistry(std::vector<AggregateDefinition> aggregates,
                std::vector<KpiDefinition> kpis);

    // ========================================================================
    // Lookup
    // ========================================================================

    const KpiDefinition* find(const KpiKey& key) const;

    /// @throws std::out_of_range for unknown keys
    const KpiDefinition& get(const KpiKey& key) const;

    const AggregateDefinition* find_aggregate(const std::string& name) const;

    /// Definitions ordered by level, then declaration order
    const std::vector<KpiDefinition>& definitions() const { return definitions_; }

    const std::vector<AggregateDefinition>& aggregates() const { return aggregates_; }

    /// KPI keys in definitions() order
    std::vector<KpiKey> keys() const;

    size_t size() const { return definitions_.size(); }

    /// Aggregates referenced by at least one KPI
    std::vector<std::string> required_aggregates() const;

    // ========================================================================
    // Hierarchy Navigation
    // ========================================================================

    std::vector<KpiKey> roots() const { return by_level(1); }

    std::vector<KpiKey> children(const KpiKey& key) const;

    std::optional<KpiKey> parent(const KpiKey& key) const;

    /// Path from the level-1 root down to key (inclusive)
    std::vector<KpiKey> lineage(const KpiKey& key) const;

    /// All KPIs below key, depth first
    std::vector<KpiKey> descendants(const KpiKey& key) const;

    std::vector<KpiKey> by_level(int level) const;

private:
    void validate_aggregates() const;
    void prepare_kpis();
    void validate_hierarchy() const;

    std::vector<AggregateDefinition> aggregates_;
    std::unordered_map<std::string, size_t> aggregate_index_;

    std::vector<KpiDefinition> definitions_;
    std::unordered_map<KpiKey, size_t> index_;
    std::unordered_map<KpiKey, std::vector<KpiKey>> children_;
};

} // namespace peerbench

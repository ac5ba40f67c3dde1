#include "peerbench/config/kpi_registry.hpp"
#include "peerbench/core/errors.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace peerbench {

// ============================================================================
// LineItemPredicate
// ============================================================================

bool LineItemPredicate::pattern_matches(std::string_view pattern, std::string_view code) {
    if (pattern == "*") {
        return true;
    }
    if (!pattern.empty() && pattern.back() == '*') {
        std::string_view prefix = pattern.substr(0, pattern.size() - 1);
        return code.substr(0, prefix.size()) == prefix;
    }
    return pattern == code;
}

// ============================================================================
// Construction & Validation
// ============================================================================

KpiRegistry::KpiRegistry(std::vector<AggregateDefinition> aggregates,
                         std::vector<KpiDefinition> kpis)
    : aggregates_(std::move(aggregates))
    , definitions_(std::move(kpis))
{
    validate_aggregates();
    for (size_t i = 0; i < aggregates_.size(); ++i) {
        aggregate_index_[aggregates_[i].name] = i;
    }

    prepare_kpis();
    validate_hierarchy();

    // Order by level, keep declaration order within a level
    std::stable_sort(definitions_.begin(), definitions_.end(),
                     [](const KpiDefinition& a, const KpiDefinition& b) {
                         return a.level < b.level;
                     });

    index_.clear();
    for (size_t i = 0; i < definitions_.size(); ++i) {
        index_[definitions_[i].key] = i;
    }
    for (const auto& def : definitions_) {
        if (def.parent_key) {
            children_[*def.parent_key].push_back(def.key);
        }
    }
}

void KpiRegistry::validate_aggregates() const {
    std::unordered_set<std::string> names;
    for (const auto& agg : aggregates_) {
        if (agg.name.empty()) {
            throw ConfigurationError("aggregate with empty name");
        }
        if (!names.insert(agg.name).second) {
            throw ConfigurationError("duplicate aggregate '" + agg.name + "'");
        }
        if (agg.predicates.empty()) {
            throw ConfigurationError("aggregate '" + agg.name + "' has no line-item predicates");
        }
        for (const auto& p : agg.predicates) {
            if (p.line.empty() || p.column.empty()) {
                throw ConfigurationError("aggregate '" + agg.name + "' has an empty line or column pattern");
            }
        }
    }
}

void KpiRegistry::prepare_kpis() {
    for (size_t i = 0; i < definitions_.size(); ++i) {
        auto& def = definitions_[i];

        if (def.key.empty()) {
            throw ConfigurationError("KPI with empty key");
        }
        if (!index_.emplace(def.key, i).second) {
            throw ConfigurationError("duplicate KPI key '" + def.key + "'");
        }
        if (def.level < 1 || def.level > 3) {
            throw ConfigurationError("KPI '" + def.key + "' has level " +
                                     std::to_string(def.level) + " (expected 1, 2 or 3)");
        }
        if (def.decimals && (*def.decimals < 0 || *def.decimals > 12)) {
            throw ConfigurationError("KPI '" + def.key + "' has invalid decimals");
        }

        if (def.formula_text == constants::UNMAPPED_FORMULA) {
            def.formula = nullptr;
            def.dependencies.clear();
            continue;
        }
        if (def.formula_text.empty()) {
            throw ConfigurationError("KPI '" + def.key + "' has no formula (use " +
                                     std::string(constants::UNMAPPED_FORMULA) + ")");
        }

        try {
            def.formula = expr::parse_formula(def.formula_text);
        } catch (const std::invalid_argument& e) {
            throw ConfigurationError("KPI '" + def.key + "': " + e.what());
        }

        def.dependencies = def.formula->get_dependencies();
        for (const auto& dep : def.dependencies) {
            if (aggregate_index_.find(dep) == aggregate_index_.end()) {
                throw ConfigurationError("KPI '" + def.key + "' references undefined aggregate '" + dep + "'");
            }
        }
    }
}

void KpiRegistry::validate_hierarchy() const {
    // Parent presence and dangling references
    for (const auto& def : definitions_) {
        if (def.level == 1) {
            if (def.parent_key) {
                throw ConfigurationError("level-1 KPI '" + def.key + "' must not have a parent");
            }
            continue;
        }
        if (!def.parent_key) {
            throw ConfigurationError("level-" + std::to_string(def.level) + " KPI '" +
                                     def.key + "' has no parent");
        }
        if (index_.find(*def.parent_key) == index_.end()) {
            throw ConfigurationError("KPI '" + def.key + "' references unknown parent '" +
                                     *def.parent_key + "'");
        }
    }

    // Cycles
    for (const auto& def : definitions_) {
        std::unordered_set<KpiKey> visited;
        const KpiDefinition* node = &def;
        while (node->parent_key) {
            if (!visited.insert(node->key).second) {
                throw ConfigurationError("cycle in KPI hierarchy at '" + node->key + "'");
            }
            node = &definitions_[index_.at(*node->parent_key)];
        }
    }

    // Level consistency
    for (const auto& def : definitions_) {
        if (!def.parent_key) {
            continue;
        }
        const auto& parent = definitions_[index_.at(*def.parent_key)];
        if (parent.level != def.level - 1) {
            throw ConfigurationError("KPI '" + def.key + "' (level " + std::to_string(def.level) +
                                     ") has parent '" + parent.key + "' at level " +
                                     std::to_string(parent.level));
        }
    }
}

// ============================================================================
// Lookup
// ============================================================================

const KpiDefinition* KpiRegistry::find(const KpiKey& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &definitions_[it->second];
}

const KpiDefinition& KpiRegistry::get(const KpiKey& key) const {
    const KpiDefinition* def = find(key);
    if (!def) {
        throw std::out_of_range("Unknown KPI: " + key);
    }
    return *def;
}

const AggregateDefinition* KpiRegistry::find_aggregate(const std::string& name) const {
    auto it = aggregate_index_.find(name);
    return it == aggregate_index_.end() ? nullptr : &aggregates_[it->second];
}

std::vector<KpiKey> KpiRegistry::keys() const {
    std::vector<KpiKey> result;
    result.reserve(definitions_.size());
    for (const auto& def : definitions_) {
        result.push_back(def.key);
    }
    return result;
}

std::vector<std::string> KpiRegistry::required_aggregates() const {
    std::set<std::string> names;
    for (const auto& def : definitions_) {
        names.insert(def.dependencies.begin(), def.dependencies.end());
    }
    return std::vector<std::string>(names.begin(), names.end());
}

// ============================================================================
// Hierarchy Navigation
// ============================================================================

std::vector<KpiKey> KpiRegistry::children(const KpiKey& key) const {
    auto it = children_.find(key);
    return it == children_.end() ? std::vector<KpiKey>() : it->second;
}

std::optional<KpiKey> KpiRegistry::parent(const KpiKey& key) const {
    const KpiDefinition* def = find(key);
    return def ? def->parent_key : std::nullopt;
}

std::vector<KpiKey> KpiRegistry::lineage(const KpiKey& key) const {
    std::vector<KpiKey> path;
    const KpiDefinition* node = find(key);
    while (node) {
        path.push_back(node->key);
        node = node->parent_key ? find(*node->parent_key) : nullptr;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

std::vector<KpiKey> KpiRegistry::descendants(const KpiKey& key) const {
    std::vector<KpiKey> result;
    for (const auto& child : children(key)) {
        result.push_back(child);
        auto below = descendants(child);
        result.insert(result.end(), below.begin(), below.end());
    }
    return result;
}

std::vector<KpiKey> KpiRegistry::by_level(int level) const {
    std::vector<KpiKey> result;
    for (const auto& def : definitions_) {
        if (def.level == level) {
            result.push_back(def.key);
        }
    }
    return result;
}

} // namespace peerbench

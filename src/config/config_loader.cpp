#include "peerbench/config/config_loader.hpp"
#include "peerbench/core/engine_context.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/data/csv_loader.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <set>
#include <unordered_map>

namespace peerbench {

namespace {

CsvTable load_config_table(const std::string& path, const char* what) {
    if (path.empty()) {
        throw ConfigurationError(std::string("no ") + what + " file given");
    }
    try {
        return CsvLoader::load(path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
}

size_t require(const CsvTable& table, const std::string& column) {
    try {
        return table.require_column(column);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
}

bool parse_bool(const std::string& text, const std::string& location) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") return true;
    if (lower == "false" || lower == "0" || lower == "no") return false;
    throw ConfigurationError("Invalid boolean '" + text + "' at " + location);
}

int parse_int(const std::string& text, const std::string& field, const std::string& location) {
    int64_t value = 0;
    if (!CsvLoader::try_parse_int64(text, value) ||
        value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ConfigurationError("Invalid " + field + " '" + text + "' at " + location);
    }
    return static_cast<int>(value);
}

} // namespace

// ============================================================================
// Static Configuration
// ============================================================================

std::vector<AggregateDefinition> load_aggregates_csv(const std::string& path) {
    CsvTable table = load_config_table(path, "aggregates");
    const size_t name_col = require(table, "name");
    const size_t line_col = require(table, "line");
    const size_t column_col = require(table, "column");

    // Several rows per name; keep the order names first appear in
    std::vector<AggregateDefinition> aggregates;
    std::unordered_map<std::string, size_t> index;

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const std::string& name = row[name_col];
        if (name.empty()) {
            throw ConfigurationError("Empty aggregate name at " + table.location(r));
        }
        if (row[line_col].empty() || row[column_col].empty()) {
            throw ConfigurationError("Empty line or column pattern at " + table.location(r));
        }

        auto it = index.find(name);
        if (it == index.end()) {
            it = index.emplace(name, aggregates.size()).first;
            AggregateDefinition def;
            def.name = name;
            aggregates.push_back(std::move(def));
        }
        aggregates[it->second].predicates.emplace_back(row[line_col], row[column_col]);
    }

    std::cout << "[CONFIG] Loaded " << aggregates.size() << " aggregates from " << path << std::endl;
    return aggregates;
}

std::vector<KpiDefinition> load_kpis_csv(const std::string& path) {
    CsvTable table = load_config_table(path, "KPI definitions");
    const size_t key_col = require(table, "key");
    const size_t level_col = require(table, "level");
    const size_t parent_col = require(table, "parent_key");
    const size_t formula_col = require(table, "formula");
    const size_t unit_col = require(table, "unit");
    const size_t hib_col = require(table, "higher_is_better");
    const auto decimals_col = table.column_index("decimals");
    const auto label_col = table.column_index("label");

    std::vector<KpiDefinition> kpis;
    kpis.reserve(table.rows.size());

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const std::string location = table.location(r);

        KpiDefinition def;
        def.key = row[key_col];
        def.level = parse_int(row[level_col], "level", location);
        if (!row[parent_col].empty()) {
            def.parent_key = row[parent_col];
        }
        def.formula_text = row[formula_col];
        def.unit = row[unit_col];
        def.higher_is_better = parse_bool(row[hib_col], location);
        if (decimals_col && !row[*decimals_col].empty()) {
            def.decimals = parse_int(row[*decimals_col], "decimals", location);
        }
        def.label = label_col && !row[*label_col].empty() ? row[*label_col] : def.key;
        kpis.push_back(std::move(def));
    }

    std::cout << "[CONFIG] Loaded " << kpis.size() << " KPI definitions from " << path << std::endl;
    return kpis;
}

std::vector<BenchmarkScope> load_scopes_csv(const std::string& path) {
    CsvTable table = load_config_table(path, "scopes");
    const size_t id_col = require(table, "scope_id");
    const size_t dims_col = require(table, "dimensions");

    std::vector<BenchmarkScope> scopes;
    for (const auto& row : table.rows) {
        std::vector<std::string> dimensions;
        const std::string& text = row[dims_col];
        size_t start = 0;
        while (start <= text.size() && !text.empty()) {
            size_t end = text.find('+', start);
            if (end == std::string::npos) {
                end = text.size();
            }
            dimensions.push_back(CsvLoader::trim(text.substr(start, end - start)));
            start = end + 1;
        }
        scopes.emplace_back(row[id_col], std::move(dimensions));
    }

    std::cout << "[CONFIG] Loaded " << scopes.size() << " benchmark scopes from " << path << std::endl;
    return scopes;
}

KpiRegistry load_kpi_registry(const std::string& aggregates_path, const std::string& kpis_path) {
    return KpiRegistry(load_aggregates_csv(aggregates_path), load_kpis_csv(kpis_path));
}

// ============================================================================
// Engine Context
// ============================================================================

std::unique_ptr<EngineContext> load_engine_context(const EngineOptions& options) {
    KpiRegistry registry = load_kpi_registry(options.aggregates_path, options.kpis_path);

    ScopeRegistry scopes = options.scopes_path.empty()
        ? ScopeRegistry::defaults()
        : ScopeRegistry(load_scopes_csv(options.scopes_path));

    std::shared_ptr<const ILineItemSource> source;
    if (!options.line_items_path.empty()) {
        try {
            source = load_line_items_csv(options.line_items_path);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error(options.line_items_path + ": " + e.what());
        }
    }

    EntityDirectory directory = options.entities_path.empty()
        ? EntityDirectory()
        : EntityDirectory::load_csv(options.entities_path);

    if (options.derive_ccn_dimensions && source) {
        std::set<EntityId> entities;
        for (Period period : source->get_periods()) {
            for (const auto& entity_id : source->get_entities(period)) {
                entities.insert(entity_id);
            }
        }
        size_t added = directory.derive_from_provider_numbers(
            std::vector<EntityId>(entities.begin(), entities.end()));
        if (added > 0) {
            std::cout << "[CONFIG] Derived " << added
                      << " dimension values from provider numbers" << std::endl;
        }
    }

    return std::make_unique<EngineContext>(options, std::move(registry), std::move(scopes),
                                           std::move(directory), std::move(source));
}

} // namespace peerbench

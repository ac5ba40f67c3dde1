#pragma once

/**
 * @file config_loader.hpp
 * @brief Loaders for the static KPI, aggregate and scope configuration
 *
 * File formats (CSV with header, '#' comments allowed):
 * - aggregates: name,line,column            (one row per predicate)
 * - kpis:       key,level,parent_key,formula,unit,higher_is_better[,decimals][,label]
 * - scopes:     scope_id,dimensions         (dimensions joined by '+', empty = all)
 *
 * All loaders throw ConfigurationError; configuration problems are fatal at
 * startup.
 */

#include "peerbench/config/engine_options.hpp"
#include "peerbench/config/kpi_registry.hpp"
#include "peerbench/config/scope_registry.hpp"
#include <memory>
#include <string>
#include <vector>

namespace peerbench {

class EngineContext;

std::vector<AggregateDefinition> load_aggregates_csv(const std::string& path);

std::vector<KpiDefinition> load_kpis_csv(const std::string& path);

std::vector<BenchmarkScope> load_scopes_csv(const std::string& path);

/// Load aggregates and KPIs and build the validated registry
KpiRegistry load_kpi_registry(const std::string& aggregates_path, const std::string& kpis_path);

/**
 * @brief Build the engine context described by the options
 *
 * Loads the registries, the line items (if a path is given) and the entity
 * directory, then runs the initial capability detection.
 *
 * @throws ConfigurationError for invalid configuration
 * @throws std::runtime_error when the line items cannot be loaded
 */
std::unique_ptr<EngineContext> load_engine_context(const EngineOptions& options);

} // namespace peerbench

#pragma once

/**
 * @file scope_registry.hpp
 * @brief Benchmark scopes: partition functions over entity dimensions
 */

#include "peerbench/core/types.hpp"
#include "peerbench/data/entity_directory.hpp"
#include <optional>
#include <string>
#include <vector>

namespace peerbench {

/**
 * @brief One benchmark scope
 *
 * A scope without dimensions puts every entity in the single group "ALL".
 * Otherwise the scope key is the entity's dimension values joined with '|';
 * an entity missing any of the dimensions is not part of the scope.
 */
struct BenchmarkScope {
    std::string id;
    std::vector<std::string> dimensions;

    BenchmarkScope() = default;
    BenchmarkScope(std::string scope_id, std::vector<std::string> dims)
        : id(std::move(scope_id)), dimensions(std::move(dims)) {}

    std::optional<std::string> scope_key_for(const EntityId& entity_id,
                                             const EntityDirectory& directory) const;
};

class ScopeRegistry {
public:
    /// @throws ConfigurationError on empty or duplicate scope ids
    explicit ScopeRegistry(std::vector<BenchmarkScope> scopes);

    /// all, by-region, by-category, by-region-and-category
    static ScopeRegistry defaults();

    const BenchmarkScope* find(const std::string& scope_id) const;

    const std::vector<BenchmarkScope>& scopes() const { return scopes_; }

    size_t size() const { return scopes_.size(); }

private:
    std::vector<BenchmarkScope> scopes_;
};

} // namespace peerbench

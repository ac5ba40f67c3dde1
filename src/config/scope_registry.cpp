#include "peerbench/config/scope_registry.hpp"
#include "peerbench/core/errors.hpp"
#include <unordered_set>

namespace peerbench {

std::optional<std::string> BenchmarkScope::scope_key_for(const EntityId& entity_id,
                                                         const EntityDirectory& directory) const {
    if (dimensions.empty()) {
        return std::string(constants::ALL_SCOPE_KEY);
    }

    std::string key;
    for (size_t i = 0; i < dimensions.size(); ++i) {
        auto value = directory.get_attribute(entity_id, dimensions[i]);
        if (!value) {
            return std::nullopt;
        }
        if (i > 0) {
            key += constants::SCOPE_KEY_SEPARATOR;
        }
        key += *value;
    }
    return key;
}

ScopeRegistry::ScopeRegistry(std::vector<BenchmarkScope> scopes)
    : scopes_(std::move(scopes))
{
    std::unordered_set<std::string> ids;
    for (const auto& scope : scopes_) {
        if (scope.id.empty()) {
            throw ConfigurationError("benchmark scope with empty id");
        }
        if (!ids.insert(scope.id).second) {
            throw ConfigurationError("duplicate benchmark scope '" + scope.id + "'");
        }
        std::unordered_set<std::string> dims;
        for (const auto& dim : scope.dimensions) {
            if (dim.empty() || !dims.insert(dim).second) {
                throw ConfigurationError("scope '" + scope.id + "' has an empty or repeated dimension");
            }
        }
    }
}

ScopeRegistry ScopeRegistry::defaults() {
    return ScopeRegistry({
        BenchmarkScope("all", {}),
        BenchmarkScope("by-region", {dimensions::REGION}),
        BenchmarkScope("by-category", {dimensions::CATEGORY}),
        BenchmarkScope("by-region-and-category", {dimensions::REGION, dimensions::CATEGORY}),
    });
}

const BenchmarkScope* ScopeRegistry::find(const std::string& scope_id) const {
    for (const auto& scope : scopes_) {
        if (scope.id == scope_id) {
            return &scope;
        }
    }
    return nullptr;
}

} // namespace peerbench

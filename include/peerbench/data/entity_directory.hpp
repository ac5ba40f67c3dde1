#pragma once

/**
 * @file entity_directory.hpp
 * @brief Entity attributes used to partition peers into benchmark scopes
 *
 * Each entity carries named dimension values ("region", "category", ...).
 * Values come from an entities CSV and, for six-digit provider numbers
 * (CCN), can be derived: the first two digits are the state code and the
 * last four select the facility category.
 */

#include "peerbench/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerbench {

namespace dimensions {
    inline constexpr const char* REGION = "region";
    inline constexpr const char* CATEGORY = "category";
}

/// State code of a six-digit provider number (first two digits)
std::optional<std::string> state_code_from_ccn(const EntityId& entity_id);

/// Facility category of a six-digit provider number
std::optional<std::string> category_from_ccn(const EntityId& entity_id);

class EntityDirectory {
public:
    EntityDirectory() = default;

    /// Set (or overwrite) one dimension value
    void set_attribute(const EntityId& entity_id, const std::string& dimension,
                       const std::string& value);

    /// Dimension value of an entity, if known
    std::optional<std::string> get_attribute(const EntityId& entity_id,
                                             const std::string& dimension) const;

    bool contains(const EntityId& entity_id) const {
        return attributes_.find(entity_id) != attributes_.end();
    }

    size_t size() const { return attributes_.size(); }

    /// Dimension names seen so far, sorted
    std::vector<std::string> dimension_names() const;

    /**
     * @brief Derive region/category for provider-number ids
     *
     * Explicit values are never overwritten. Ids that are not six digits are
     * left alone.
     *
     * @return Number of dimension values added
     */
    size_t derive_from_provider_numbers(const std::vector<EntityId>& entities);

    /**
     * @brief Load "entity_id,<dimension>..." rows
     *
     * Every non-key header column is a dimension; empty cells are skipped.
     * @throws ConfigurationError on a missing entity_id column or duplicate rows
     */
    static EntityDirectory load_csv(const std::string& path);

private:
    std::unordered_map<EntityId, std::map<std::string, std::string>> attributes_;
};

} // namespace peerbench

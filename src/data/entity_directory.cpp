#include "peerbench/data/entity_directory.hpp"
#include "peerbench/data/csv_loader.hpp"
#include "peerbench/core/errors.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>

namespace peerbench {

namespace {

bool is_provider_number(const EntityId& entity_id) {
    return entity_id.size() == 6 &&
           std::all_of(entity_id.begin(), entity_id.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

std::optional<std::string> state_code_from_ccn(const EntityId& entity_id) {
    if (!is_provider_number(entity_id)) {
        return std::nullopt;
    }
    return entity_id.substr(0, 2);
}

std::optional<std::string> category_from_ccn(const EntityId& entity_id) {
    if (!is_provider_number(entity_id)) {
        return std::nullopt;
    }

    const int provider = std::stoi(entity_id.substr(2));

    // CMS provider-number ranges (last four digits)
    if (provider >= 1 && provider <= 899) return std::string("Short Term Acute Care");
    if (provider >= 3300 && provider <= 3399) return std::string("Children's");
    if (provider >= 1300 && provider <= 1399) return std::string("Critical Access");
    if (provider >= 2000 && provider <= 2299) return std::string("Long Term");
    if (provider >= 4000 && provider <= 4499) return std::string("Psychiatric");
    if (provider >= 3025 && provider <= 3099) return std::string("Rehabilitation");
    return std::string("Other");
}

void EntityDirectory::set_attribute(const EntityId& entity_id, const std::string& dimension,
                                    const std::string& value) {
    attributes_[entity_id][dimension] = value;
}

std::optional<std::string> EntityDirectory::get_attribute(const EntityId& entity_id,
                                                          const std::string& dimension) const {
    auto it = attributes_.find(entity_id);
    if (it == attributes_.end()) {
        return std::nullopt;
    }
    auto dim = it->second.find(dimension);
    if (dim == it->second.end()) {
        return std::nullopt;
    }
    return dim->second;
}

std::vector<std::string> EntityDirectory::dimension_names() const {
    std::set<std::string> names;
    for (const auto& [entity, dims] : attributes_) {
        for (const auto& [name, value] : dims) {
            names.insert(name);
        }
    }
    return std::vector<std::string>(names.begin(), names.end());
}

size_t EntityDirectory::derive_from_provider_numbers(const std::vector<EntityId>& entities) {
    size_t added = 0;
    for (const auto& entity : entities) {
        if (!get_attribute(entity, dimensions::REGION)) {
            if (auto state = state_code_from_ccn(entity)) {
                set_attribute(entity, dimensions::REGION, *state);
                ++added;
            }
        }
        if (!get_attribute(entity, dimensions::CATEGORY)) {
            if (auto category = category_from_ccn(entity)) {
                set_attribute(entity, dimensions::CATEGORY, *category);
                ++added;
            }
        }
    }
    return added;
}

EntityDirectory EntityDirectory::load_csv(const std::string& path) {
    CsvTable table;
    size_t entity_col = 0;
    try {
        table = CsvLoader::load(path);
        entity_col = table.require_column("entity_id");
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }

    EntityDirectory directory;
    std::set<EntityId> seen;

    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        const auto& entity = row[entity_col];
        if (entity.empty()) {
            throw ConfigurationError("Empty entity_id at " + table.location(r));
        }
        if (!seen.insert(entity).second) {
            throw ConfigurationError("Duplicate entity '" + entity + "' at " + table.location(r));
        }
        for (size_t c = 0; c < table.header.size(); ++c) {
            if (c == entity_col || row[c].empty()) {
                continue;
            }
            directory.set_attribute(entity, table.header[c], row[c]);
        }
    }

    std::cout << "[CONFIG] Loaded attributes for " << directory.size()
              << " entities from " << path << std::endl;
    return directory;
}

} // namespace peerbench

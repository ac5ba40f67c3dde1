#pragma once

/**
 * @file line_item_store.hpp
 * @brief In-memory columnar line-item store
 *
 * Line items are partitioned by period. Inside a partition the rows are
 * sorted by entity (then line, column) and kept as typed columns:
 * dictionary-encoded entity/line/column codes plus a Float64 value column.
 * An entity index per partition maps each entity to its contiguous row range,
 * so reading one entity/period is a binary search plus a zero-copy slice.
 *
 * The store is immutable once built and safe for concurrent readers.
 *
 * Example usage:
 * @code
 *   LineItemStore::Builder builder;
 *   builder.add("310001", 2024, "CA", "TOTAL", 3.0e9);
 *   builder.add("310001", 2024, "CL", "TOTAL", 5.21e8);
 *   auto store = builder.build();
 *   auto slice = store->read_entity_period("310001", 2024);
 * @endcode
 */

#include "peerbench/data/line_item_source.hpp"
#include "peerbench/data/column.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace peerbench {

class LineItemStore : public ILineItemSource {
    /// Restricts construction to Builder while still allowing make_shared
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    explicit LineItemStore(ConstructionTag) {}

    /**
     * @brief Collects line items and produces an immutable store
     */
    class Builder {
    public:
        void add(const LineItem& item) { items_.push_back(item); }

        void add(EntityId entity_id, Period period, std::string line,
                 std::string column, double value) {
            items_.emplace_back(std::move(entity_id), period, std::move(line),
                                std::move(column), value);
        }

        size_t size() const { return items_.size(); }

        /**
         * @brief Sort, validate and encode the collected items
         * @param source_path Description reported by get_source_path()
         * @throws std::invalid_argument on a duplicate
         *         (entity_id, period, line, column) tuple
         */
        std::shared_ptr<LineItemStore> build(std::string source_path = "memory");

    private:
        std::vector<LineItem> items_;
    };

    /// Convenience wrapper around Builder
    static std::shared_ptr<LineItemStore> from_items(const std::vector<LineItem>& items,
                                                     std::string source_path = "memory");

    // Non-copyable (slices point into the columns)
    LineItemStore(const LineItemStore&) = delete;
    LineItemStore& operator=(const LineItemStore&) = delete;

    // ========================================================================
    // ILineItemSource
    // ========================================================================

    std::vector<Period> get_periods() const override;
    std::vector<EntityId> get_entities(Period period) const override;
    LineItemSlice read_entity_period(const EntityId& entity_id, Period period) const override;
    uint64_t get_total_items() const override { return total_items_; }
    uint64_t get_snapshot_hash() const override { return snapshot_hash_; }
    std::string get_source_path() const override { return source_path_; }
    bool is_open() const override { return true; }

    /// Number of items in one period partition
    size_t get_period_item_count(Period period) const;

    /// Number of distinct entities across all periods
    size_t get_entity_count() const { return entities_.size(); }

private:
    struct EntityRange {
        uint32_t entity_code;
        size_t begin;
        size_t end;
    };

    struct Partition {
        CodeColumn entity_codes;
        CodeColumn line_codes;
        CodeColumn column_codes;
        Float64Column values;
        std::vector<EntityRange> index;     ///< Sorted by entity id
    };

    const EntityRange* find_range(const Partition& partition, const EntityId& entity_id) const;

    CategoryDictionary entities_;
    CategoryDictionary lines_;
    CategoryDictionary columns_;
    std::map<Period, Partition> partitions_;

    uint64_t total_items_ = 0;
    uint64_t snapshot_hash_ = 0;
    std::string source_path_;
};

} // namespace peerbench

#pragma once

/**
 * @file line_item_source.hpp
 * @brief Abstract line-item source interface
 *
 * Defines the ILineItemSource interface that the KPI build pipeline and the
 * RawFallback query path read from. The in-memory LineItemStore is the
 * standard implementation; tests and alternative backends provide others.
 */

#include "peerbench/core/types.hpp"
#include "peerbench/data/column.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peerbench {

// ============================================================================
// Line-Item Slice
// ============================================================================

/**
 * @brief Zero-copy view over the line items of one entity/period
 *
 * The views point into the owning source; a slice stays valid as long as the
 * source it was read from is alive.
 */
class LineItemSlice {
public:
    LineItemSlice() = default;

    LineItemSlice(std::span<const uint32_t> line_codes,
                  std::span<const uint32_t> column_codes,
                  std::span<const double> values,
                  const CategoryDictionary* lines,
                  const CategoryDictionary* columns)
        : line_codes_(line_codes)
        , column_codes_(column_codes)
        , values_(values)
        , lines_(lines)
        , columns_(columns) {}

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    std::string_view line_at(size_t i) const { return lines_->decode(line_codes_[i]); }
    std::string_view column_at(size_t i) const { return columns_->decode(column_codes_[i]); }
    double value_at(size_t i) const { return values_[i]; }

private:
    std::span<const uint32_t> line_codes_;
    std::span<const uint32_t> column_codes_;
    std::span<const double> values_;
    const CategoryDictionary* lines_ = nullptr;
    const CategoryDictionary* columns_ = nullptr;
};

// ============================================================================
// Source Interface
// ============================================================================

/**
 * @brief Abstract interface for line-item sources
 *
 * Implementations are read-only after construction and must allow
 * concurrent readers. Methods may throw StorageUnavailable when the
 * backing storage cannot be reached.
 */
class ILineItemSource {
public:
    virtual ~ILineItemSource() = default;

    /**
     * @brief Get all periods present, ascending
     */
    virtual std::vector<Period> get_periods() const = 0;

    /**
     * @brief Get entities reporting in a period, sorted by id
     */
    virtual std::vector<EntityId> get_entities(Period period) const = 0;

    /**
     * @brief Read the line items of one entity/period
     * @return Slice over the rows; empty if the entity did not report
     */
    virtual LineItemSlice read_entity_period(const EntityId& entity_id, Period period) const = 0;

    /// Total number of line items
    virtual uint64_t get_total_items() const = 0;

    /// Content hash, identical for identical inputs
    virtual uint64_t get_snapshot_hash() const = 0;

    /// Path or description of the backing data
    virtual std::string get_source_path() const = 0;

    /// Whether the source can currently serve reads
    virtual bool is_open() const = 0;
};

} // namespace peerbench

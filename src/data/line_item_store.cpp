#include "peerbench/data/line_item_store.hpp"
#include "peerbench/core/hashing.hpp"
#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace peerbench {

// ===== Builder =====

std::shared_ptr<LineItemStore> LineItemStore::Builder::build(std::string source_path) {
    std::sort(items_.begin(), items_.end(), [](const LineItem& a, const LineItem& b) {
        return std::tie(a.period, a.entity_id, a.line, a.column) <
               std::tie(b.period, b.entity_id, b.line, b.column);
    });

    for (size_t i = 1; i < items_.size(); ++i) {
        const auto& prev = items_[i - 1];
        const auto& cur = items_[i];
        if (prev.period == cur.period && prev.entity_id == cur.entity_id &&
            prev.line == cur.line && prev.column == cur.column) {
            throw std::invalid_argument(
                "Duplicate line item: entity=" + cur.entity_id +
                " period=" + std::to_string(cur.period) +
                " line=" + cur.line + " column=" + cur.column);
        }
    }

    auto store = std::make_shared<LineItemStore>(ConstructionTag());
    store->source_path_ = std::move(source_path);
    store->total_items_ = items_.size();

    Fnv1aHasher hasher;

    size_t begin = 0;
    while (begin < items_.size()) {
        const Period period = items_[begin].period;
        size_t end = begin;
        while (end < items_.size() && items_[end].period == period) {
            ++end;
        }

        const size_t count = end - begin;
        std::vector<uint32_t> entity_codes;
        std::vector<uint32_t> line_codes;
        std::vector<uint32_t> column_codes;
        std::vector<double> values;
        entity_codes.reserve(count);
        line_codes.reserve(count);
        column_codes.reserve(count);
        values.reserve(count);

        Partition partition;
        for (size_t i = begin; i < end; ++i) {
            const auto& item = items_[i];
            const uint32_t entity_code = store->entities_.encode(item.entity_id);
            const size_t row = i - begin;

            if (partition.index.empty() || partition.index.back().entity_code != entity_code) {
                partition.index.push_back({entity_code, row, row});
            }
            partition.index.back().end = row + 1;

            entity_codes.push_back(entity_code);
            line_codes.push_back(store->lines_.encode(item.line));
            column_codes.push_back(store->columns_.encode(item.column));
            values.push_back(item.value);

            hasher.update(item.entity_id);
            hasher.update(static_cast<int64_t>(item.period));
            hasher.update(item.line);
            hasher.update(item.column);
            hasher.update(item.value);
        }

        partition.entity_codes = CodeColumn("entity_id", std::move(entity_codes), ColumnType::CODE32);
        partition.line_codes = CodeColumn("line", std::move(line_codes), ColumnType::CODE32);
        partition.column_codes = CodeColumn("column", std::move(column_codes), ColumnType::CODE32);
        partition.values = Float64Column("value", std::move(values), ColumnType::FLOAT64);

        store->partitions_.emplace(period, std::move(partition));
        begin = end;
    }

    store->snapshot_hash_ = hasher.digest();
    items_.clear();
    return store;
}

std::shared_ptr<LineItemStore> LineItemStore::from_items(const std::vector<LineItem>& items,
                                                         std::string source_path) {
    Builder builder;
    for (const auto& item : items) {
        builder.add(item);
    }
    return builder.build(std::move(source_path));
}

// ===== Queries =====

std::vector<Period> LineItemStore::get_periods() const {
    std::vector<Period> periods;
    periods.reserve(partitions_.size());
    for (const auto& [period, partition] : partitions_) {
        periods.push_back(period);
    }
    return periods;
}

std::vector<EntityId> LineItemStore::get_entities(Period period) const {
    std::vector<EntityId> entities;
    auto it = partitions_.find(period);
    if (it == partitions_.end()) {
        return entities;
    }
    entities.reserve(it->second.index.size());
    for (const auto& range : it->second.index) {
        entities.push_back(entities_.decode(range.entity_code));
    }
    return entities;
}

LineItemSlice LineItemStore::read_entity_period(const EntityId& entity_id, Period period) const {
    auto it = partitions_.find(period);
    if (it == partitions_.end()) {
        return LineItemSlice();
    }

    const Partition& partition = it->second;
    const EntityRange* range = find_range(partition, entity_id);
    if (!range) {
        return LineItemSlice();
    }

    return LineItemSlice(
        partition.line_codes.slice(range->begin, range->end),
        partition.column_codes.slice(range->begin, range->end),
        partition.values.slice(range->begin, range->end),
        &lines_, &columns_);
}

size_t LineItemStore::get_period_item_count(Period period) const {
    auto it = partitions_.find(period);
    return it == partitions_.end() ? 0 : it->second.values.size();
}

const LineItemStore::EntityRange* LineItemStore::find_range(const Partition& partition,
                                                            const EntityId& entity_id) const {
    auto it = std::lower_bound(
        partition.index.begin(), partition.index.end(), entity_id,
        [this](const EntityRange& range, const EntityId& id) {
            return entities_.decode(range.entity_code) < id;
        });
    if (it == partition.index.end() || entities_.decode(it->entity_code) != entity_id) {
        return nullptr;
    }
    return &*it;
}

} // namespace peerbench

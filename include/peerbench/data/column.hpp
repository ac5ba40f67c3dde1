#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <span>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace peerbench {

/// Column data types
enum class ColumnType {
    FLOAT64,    ///< 64-bit floating point
    CODE32      ///< Dictionary code (uint32)
};

/// Abstract column interface
class IColumn {
public:
    virtual ~IColumn() = default;

    /// Get column type
    virtual ColumnType type() const = 0;

    /// Get number of elements
    virtual size_t size() const = 0;

    /// Get column name
    virtual std::string name() const = 0;
};

/// Typed column implementation
/// Stores data in contiguous memory for cache efficiency
template<typename T>
class TypedColumn : public IColumn {
private:
    std::string name_;
    std::vector<T> data_;
    ColumnType type_;

public:
    TypedColumn() : type_(ColumnType::FLOAT64) {}

    TypedColumn(std::string name, std::vector<T> data, ColumnType type)
        : name_(std::move(name))
        , data_(std::move(data))
        , type_(type)
    {}

    /// Get read-only view of data (zero-copy)
    std::span<const T> view() const {
        return std::span<const T>(data_.data(), data_.size());
    }

    /// Get read-only view of [begin, end)
    std::span<const T> slice(size_t begin, size_t end) const {
        return view().subspan(begin, end - begin);
    }

    const T& operator[](size_t i) const { return data_[i]; }

    ColumnType type() const override { return type_; }
    size_t size() const override { return data_.size(); }
    std::string name() const override { return name_; }
};

using Float64Column = TypedColumn<double>;
using CodeColumn = TypedColumn<uint32_t>;

/**
 * @brief Dictionary encoding for categorical string values
 *
 * Codes are assigned in insertion order and never reused. The dictionary is
 * frozen once the owning store is built; lookups are then read-only and
 * safe to share between threads.
 */
class CategoryDictionary {
public:
    /// Return the code of value, assigning a new one if needed
    uint32_t encode(const std::string& value);

    /// Return the code of value if known
    std::optional<uint32_t> find(std::string_view value) const;

    /// Return the string for a code (code must be valid)
    const std::string& decode(uint32_t code) const { return values_[code]; }

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::vector<std::string> values_;
    std::unordered_map<std::string, uint32_t> codes_;
};

} // namespace peerbench

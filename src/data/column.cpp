#include "peerbench/data/column.hpp"
#include <stdexcept>
#include <limits>

namespace peerbench {

uint32_t CategoryDictionary::encode(const std::string& value) {
    auto it = codes_.find(value);
    if (it != codes_.end()) {
        return it->second;
    }
    if (values_.size() >= std::numeric_limits<uint32_t>::max()) {
        throw std::runtime_error("Category dictionary is full");
    }
    uint32_t code = static_cast<uint32_t>(values_.size());
    values_.push_back(value);
    codes_.emplace(value, code);
    return code;
}

std::optional<uint32_t> CategoryDictionary::find(std::string_view value) const {
    auto it = codes_.find(std::string(value));
    if (it == codes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace peerbench

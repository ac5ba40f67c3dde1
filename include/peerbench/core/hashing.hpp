#pragma once

/**
 * @file hashing.hpp
 * @brief FNV-1a content hashing used for snapshot and generation checksums
 */

#include <cstdint>
#include <cstring>
#include <string_view>

namespace peerbench {

class Fnv1aHasher {
public:
    static constexpr uint64_t OFFSET_BASIS = 0xcbf29ce484222325ULL;
    static constexpr uint64_t PRIME = 0x100000001b3ULL;

    void update(const void* data, size_t size) {
        const auto* bytes = static_cast<const uint8_t*>(data);
        for (size_t i = 0; i < size; ++i) {
            hash_ ^= bytes[i];
            hash_ *= PRIME;
        }
    }

    /// Strings are length-prefixed so ("ab","c") and ("a","bc") differ
    void update(std::string_view text) {
        uint64_t length = text.size();
        update(&length, sizeof(length));
        update(text.data(), text.size());
    }

    void update(int64_t value) { update(&value, sizeof(value)); }

    void update(uint64_t value) { update(&value, sizeof(value)); }

    void update(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        update(bits);
    }

    uint64_t digest() const { return hash_; }

private:
    uint64_t hash_ = OFFSET_BASIS;
};

} // namespace peerbench

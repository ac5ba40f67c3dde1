#pragma once

/**
 * @file result_cache.hpp
 * @brief Sharded LRU cache for query results
 *
 * Caches KpiResponse and BenchmarkResponse values keyed by the operation key
 * the router builds ("kpis|<entity>|<period>", "bench|..."). Each key hashes
 * to one shard; a shard owns its own mutex, LRU list and map, so lookups on
 * unrelated keys do not contend.
 *
 * Features:
 * - Bounded entry count (the shard capacities sum to the total)
 * - Per-entry TTL, checked lazily on read
 * - Generation-scoped invalidation through an epoch counter
 * - Cache statistics
 *
 * Example usage:
 * @code
 *   ResultCache cache(4096, 16);
 *
 *   if (auto hit = cache.get(key)) {
 *       return std::get<KpiResponse>(*hit);
 *   }
 *   KpiResponse response = compute(...);
 *   cache.put(key, response, std::chrono::milliseconds(ttl_ms));
 * @endcode
 */

#include "peerbench/core/types.hpp"
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace peerbench {

/// Value stored in the result cache
using CachedResult = std::variant<KpiResponse, BenchmarkResponse>;

class ResultCache {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @brief Construct cache
     * @param capacity Maximum number of entries over all shards (at least 1)
     * @param shard_count Requested shard count; capped at the capacity
     */
    explicit ResultCache(size_t capacity = constants::DEFAULT_CACHE_CAPACITY,
                         size_t shard_count = constants::DEFAULT_CACHE_SHARDS);

    ~ResultCache() = default;

    // Non-copyable, non-movable (due to mutex)
    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;
    ResultCache(ResultCache&&) = delete;
    ResultCache& operator=(ResultCache&&) = delete;

    // ========================================================================
    // Cache Operations
    // ========================================================================

    /**
     * @brief Look up a result
     *
     * Expired entries and entries from an earlier epoch count as misses and
     * are removed on the spot.
     */
    std::optional<CachedResult> get(const std::string& key);

    /**
     * @brief Store a result, evicting the shard's least recently used entry
     * when the shard is full
     * @param ttl Time to live; a non-positive TTL stores nothing
     */
    void put(const std::string& key, CachedResult value, std::chrono::milliseconds ttl);

    /**
     * @brief Store a result computed while computed_epoch was current
     *
     * Nothing is stored when the epoch has moved since; the entry is stamped
     * with computed_epoch, so a bump racing with the insert still hides it.
     */
    void put(const std::string& key, CachedResult value, std::chrono::milliseconds ttl,
             uint64_t computed_epoch);

    bool remove(const std::string& key);

    /// Drop every entry written before this call (lazily, by epoch)
    void invalidate_all();

    /// Remove all entries immediately
    void clear();

    // ========================================================================
    // Statistics
    // ========================================================================

    /// Entries currently stored (stale entries included until touched)
    size_t size() const;

    size_t capacity() const { return capacity_; }

    size_t shard_count() const { return shards_.size(); }

    uint64_t epoch() const { return epoch_.load(std::memory_order_acquire); }

    CacheStats get_stats() const;

    void reset_stats();

private:
    struct Entry {
        CachedResult value;
        Clock::time_point inserted_at;
        Clock::time_point last_used_at;
        Clock::time_point expires_at;
        uint64_t epoch;
    };

    // LRU list: front = most recently used, back = least recently used
    using LRUList = std::list<std::pair<std::string, Entry>>;
    using LRUIterator = LRUList::iterator;

    struct Shard {
        size_t capacity = 0;
        LRUList lru;
        std::unordered_map<std::string, LRUIterator> map;
        mutable std::mutex mutex;
    };

    Shard& shard_for(const std::string& key);

    size_t capacity_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<uint64_t> epoch_{0};

    // Statistics
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> evictions_{0};
    std::atomic<size_t> expirations_{0};
};

} // namespace peerbench

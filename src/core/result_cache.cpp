/**
 * @file result_cache.cpp
 * @brief Implementation of the sharded result cache
 */

#include "peerbench/core/result_cache.hpp"
#include <algorithm>
#include <functional>

namespace peerbench {

ResultCache::ResultCache(size_t capacity, size_t shard_count)
    : capacity_(std::max<size_t>(capacity, 1))
{
    size_t count = std::min(std::max<size_t>(shard_count, 1), capacity_);
    shards_.reserve(count);

    // Spread the capacity so the shard capacities add up to the total
    size_t base = capacity_ / count;
    size_t remainder = capacity_ % count;
    for (size_t i = 0; i < count; ++i) {
        auto shard = std::make_unique<Shard>();
        shard->capacity = base + (i < remainder ? 1 : 0);
        shards_.push_back(std::move(shard));
    }
}

ResultCache::Shard& ResultCache::shard_for(const std::string& key) {
    size_t index = std::hash<std::string>()(key) % shards_.size();
    return *shards_[index];
}

std::optional<CachedResult> ResultCache::get(const std::string& key) {
    Shard& shard = shard_for(key);
    const auto now = Clock::now();
    const uint64_t current_epoch = epoch();

    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.map.find(key);
    if (it == shard.map.end()) {
        ++misses_;
        return std::nullopt;
    }

    Entry& entry = it->second->second;
    if (entry.epoch != current_epoch || now >= entry.expires_at) {
        shard.lru.erase(it->second);
        shard.map.erase(it);
        ++expirations_;
        ++misses_;
        return std::nullopt;
    }

    entry.last_used_at = now;
    shard.lru.splice(shard.lru.begin(), shard.lru, it->second);
    ++hits_;
    return entry.value;
}

void ResultCache::put(const std::string& key, CachedResult value, std::chrono::milliseconds ttl) {
    put(key, std::move(value), ttl, epoch());
}

void ResultCache::put(const std::string& key, CachedResult value, std::chrono::milliseconds ttl,
                      uint64_t computed_epoch) {
    if (ttl.count() <= 0 || computed_epoch != epoch()) {
        return;
    }

    Shard& shard = shard_for(key);
    const auto now = Clock::now();

    Entry entry{std::move(value), now, now, now + ttl, computed_epoch};

    std::lock_guard<std::mutex> lock(shard.mutex);

    auto existing = shard.map.find(key);
    if (existing != shard.map.end()) {
        existing->second->second = std::move(entry);
        shard.lru.splice(shard.lru.begin(), shard.lru, existing->second);
        return;
    }

    while (shard.map.size() >= shard.capacity && !shard.lru.empty()) {
        auto& back = shard.lru.back();
        shard.map.erase(back.first);
        shard.lru.pop_back();
        ++evictions_;
    }

    shard.lru.emplace_front(key, std::move(entry));
    shard.map[key] = shard.lru.begin();
}

bool ResultCache::remove(const std::string& key) {
    Shard& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);

    auto it = shard.map.find(key);
    if (it == shard.map.end()) {
        return false;
    }
    shard.lru.erase(it->second);
    shard.map.erase(it);
    return true;
}

void ResultCache::invalidate_all() {
    epoch_.fetch_add(1, std::memory_order_acq_rel);
}

void ResultCache::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->map.clear();
        shard->lru.clear();
    }
}

size_t ResultCache::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        total += shard->map.size();
    }
    return total;
}

CacheStats ResultCache::get_stats() const {
    CacheStats stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.evictions = evictions_.load();
    stats.expirations = expirations_.load();
    stats.entries = size();
    stats.capacity = capacity_;
    stats.update_hit_rate();
    return stats;
}

void ResultCache::reset_stats() {
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    expirations_ = 0;
}

} // namespace peerbench

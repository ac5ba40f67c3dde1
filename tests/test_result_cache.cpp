/**
 * @file test_result_cache.cpp
 * @brief Tests for the sharded LRU + TTL result cache
 */

#include "peerbench/core/result_cache.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace peerbench;
using namespace std::chrono_literals;

namespace {

KpiResponse kpi_response(double value) {
    KpiResponse response;
    response.values["current_ratio"] = value;
    response.provenance = Provenance::Precomputed;
    return response;
}

double cached_ratio(const std::optional<CachedResult>& result) {
    return *std::get<KpiResponse>(*result).values.at("current_ratio");
}

} // namespace

void test_put_get() {
    std::cout << "Testing put/get... ";

    ResultCache cache(16, 4);
    assert(cache.shard_count() == 4);
    assert(!cache.get("missing"));

    cache.put("a", kpi_response(1.0), 1h);
    auto hit = cache.get("a");
    assert(hit);
    assert(cached_ratio(hit) == 1.0);

    BenchmarkResponse bench;
    bench.provenance = Provenance::RawFallback;
    cache.put("b", bench, 1h);
    auto b = cache.get("b");
    assert(b);
    assert(std::holds_alternative<BenchmarkResponse>(*b));
    assert(!std::get<BenchmarkResponse>(*b).stat);

    // Overwrite keeps one entry
    cache.put("a", kpi_response(2.0), 1h);
    assert(cached_ratio(cache.get("a")) == 2.0);
    assert(cache.size() == 2);

    assert(cache.remove("a"));
    assert(!cache.remove("a"));
    assert(!cache.get("a"));

    CacheStats stats = cache.get_stats();
    assert(stats.hits == 3);
    assert(stats.misses == 2);
    assert(stats.entries == 1);
    assert(stats.capacity == 16);

    std::cout << "PASSED\n";
}

void test_lru_eviction() {
    std::cout << "Testing LRU eviction... ";

    // One shard so the eviction order is fully determined
    ResultCache cache(3, 1);
    cache.put("a", kpi_response(1.0), 1h);
    cache.put("b", kpi_response(2.0), 1h);
    cache.put("c", kpi_response(3.0), 1h);

    // Touch "a" so "b" becomes least recently used
    assert(cache.get("a"));
    cache.put("d", kpi_response(4.0), 1h);

    assert(cache.size() == 3);
    assert(cache.get("a"));
    assert(!cache.get("b"));
    assert(cache.get("c"));
    assert(cache.get("d"));
    assert(cache.get_stats().evictions == 1);

    std::cout << "PASSED\n";
}

void test_capacity_bound() {
    std::cout << "Testing capacity bound... ";

    ResultCache cache(10, 16);
    // Shard count is capped by capacity
    assert(cache.shard_count() == 10);

    for (int i = 0; i < 1000; ++i) {
        cache.put("key-" + std::to_string(i), kpi_response(i), 1h);
        assert(cache.size() <= 10);
    }
    assert(cache.get_stats().evictions >= 990);

    std::cout << "PASSED\n";
}

void test_ttl_expiry() {
    std::cout << "Testing TTL expiry... ";

    ResultCache cache(8, 2);
    cache.put("short", kpi_response(1.0), 30ms);
    cache.put("long", kpi_response(2.0), 1h);

    // Non-positive TTL stores nothing
    cache.put("never", kpi_response(3.0), 0ms);
    assert(!cache.get("never"));

    assert(cache.get("short"));
    std::this_thread::sleep_for(60ms);
    assert(!cache.get("short"));
    assert(cache.get("long"));
    assert(cache.get_stats().expirations == 1);

    std::cout << "PASSED\n";
}

void test_epoch_invalidation() {
    std::cout << "Testing epoch invalidation... ";

    ResultCache cache(8, 2);
    cache.put("a", kpi_response(1.0), 1h);
    cache.put("b", kpi_response(2.0), 1h);

    const uint64_t before = cache.epoch();
    cache.invalidate_all();
    assert(cache.epoch() == before + 1);

    assert(!cache.get("a"));
    assert(!cache.get("b"));

    // Entries written after the bump are served
    cache.put("a", kpi_response(3.0), 1h);
    assert(cached_ratio(cache.get("a")) == 3.0);

    cache.clear();
    assert(cache.size() == 0);

    cache.reset_stats();
    assert(cache.get_stats().hits == 0);

    std::cout << "PASSED\n";
}

void test_put_after_epoch_moved() {
    std::cout << "Testing put of a result computed before invalidation... ";

    ResultCache cache(8, 2);
    const uint64_t computed_at = cache.epoch();
    cache.invalidate_all();

    cache.put("a", kpi_response(1.0), 1h, computed_at);
    assert(!cache.get("a"));
    assert(cache.size() == 0);

    cache.put("a", kpi_response(2.0), 1h, cache.epoch());
    assert(cached_ratio(cache.get("a")) == 2.0);

    std::cout << "PASSED\n";
}

void test_concurrent_access() {
    std::cout << "Testing concurrent access... ";

    ResultCache cache(64, 8);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 2000; ++i) {
                const std::string key = "k" + std::to_string((i * 7 + t) % 200);
                if (auto hit = cache.get(key)) {
                    assert(std::holds_alternative<KpiResponse>(*hit));
                } else {
                    cache.put(key, kpi_response(i), 1h);
                }
                if (i % 500 == 0) {
                    cache.invalidate_all();
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    assert(cache.size() <= 64);
    CacheStats stats = cache.get_stats();
    assert(stats.hits + stats.misses == 8 * 2000);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Result Cache Test Suite ===\n\n";

    try {
        test_put_get();
        test_lru_eviction();
        test_capacity_bound();
        test_ttl_expiry();
        test_epoch_invalidation();
        test_put_after_epoch_moved();
        test_concurrent_access();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

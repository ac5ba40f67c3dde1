/**
 * @file test_query_router.cpp
 * @brief Tests for tiered query serving: cache, precomputed tables, raw fallback
 */

#include "peerbench/core/errors.hpp"
#include "peerbench/pipeline/build_pipeline.hpp"
#include "peerbench/serving/fallback_executor.hpp"
#include "peerbench/serving/query_router.hpp"
#include "peerbench/storage/generation.hpp"
#include "test_fixtures.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace peerbench;
using namespace peerbench::testing;

namespace fs = std::filesystem;

namespace {

template <typename F>
bool throws_invalid_argument(F&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Fallback Executor
// ============================================================================

void test_fallback_executor() {
    std::cout << "Testing fallback executor... ";

    FallbackExecutor executor(2);
    assert(executor.worker_count() == 2);

    auto a = executor.submit([]() { return 21 * 2; });
    auto b = executor.submit([]() -> int { throw StorageUnavailable("offline"); });
    assert(a.get() == 42);

    bool threw = false;
    try {
        b.get();
    } catch (const StorageUnavailable&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

// ============================================================================
// KPI Queries
// ============================================================================

void test_kpis_from_raw_fallback() {
    std::cout << "Testing KPI queries on raw fallback... ";

    auto context = make_context();
    QueryRouter router(*context);

    KpiResponse response = router.get_kpis("310001", 2024);
    assert(response.available());
    assert(response.provenance == Provenance::RawFallback);
    assert(response.values.size() == 5);
    assert(response.values.at("current_ratio") == KpiValue(5.76));

    // Zero denominator: key present, value null
    KpiResponse zero = router.get_kpis("311300", 2024);
    assert(zero.values.count("current_ratio") == 1);
    assert(!zero.values.at("current_ratio"));

    // Entity with no filing: available, no values
    KpiResponse absent = router.get_kpis("999999", 2024);
    assert(absent.available());
    assert(absent.values.empty());

    std::cout << "PASSED\n";
}

void test_kpis_from_precomputed() {
    std::cout << "Testing KPI queries on precomputed tables... ";

    auto context = make_context();
    QueryRouter router(*context);

    KpiResponse raw = router.get_kpis("050003", 2024);
    assert(raw.provenance == Provenance::RawFallback);

    BuildPipeline(*context).run();

    // Installing the generation invalidated the cached raw answer
    KpiResponse precomputed = router.get_kpis("050003", 2024);
    assert(precomputed.provenance == Provenance::Precomputed);
    assert(precomputed.values == raw.values);

    KpiResponse absent = router.get_kpis("999999", 2024);
    assert(absent.available());
    assert(absent.values.empty());

    std::cout << "PASSED\n";
}

void test_kpis_for_level() {
    std::cout << "Testing KPI level filter... ";

    auto context = make_context();
    QueryRouter router(*context);

    KpiResponse level1 = router.get_kpis_for_level("310001", 2024, 1);
    assert(level1.values.size() == 3);
    assert(level1.values.count("current_ratio") == 1);

    KpiResponse level3 = router.get_kpis_for_level("310001", 2024, 3);
    assert(level3.values.size() == 1);
    assert(level3.values.count("salary_pct_of_expenses") == 1);

    assert(throws_invalid_argument([&]() { router.get_kpis_for_level("310001", 2024, 0); }));
    assert(throws_invalid_argument([&]() { router.get_kpis_for_level("310001", 2024, 4); }));

    std::cout << "PASSED\n";
}

// ============================================================================
// Benchmark Queries
// ============================================================================

void test_benchmarks_equivalent_across_paths() {
    std::cout << "Testing benchmark equivalence across paths... ";

    auto context = make_context();
    QueryRouter router(*context);

    BenchmarkResponse raw_all = router.get_benchmarks("current_ratio", "all", "ALL", 2024);
    BenchmarkResponse raw_region = router.get_benchmarks("current_ratio", "by-region", "31", 2024);
    assert(raw_all.provenance == Provenance::RawFallback);
    assert(raw_all.stat);
    assert(raw_all.stat->sample_count == 3);
    assert(approx(raw_all.stat->p75, 3.955));
    assert(approx(raw_region.stat->p25, 2.565));

    BuildPipeline(*context).run();

    BenchmarkResponse pre_all = router.get_benchmarks("current_ratio", "all", "ALL", 2024);
    BenchmarkResponse pre_region = router.get_benchmarks("current_ratio", "by-region", "31", 2024);
    assert(pre_all.provenance == Provenance::Precomputed);
    assert(*pre_all.stat == *raw_all.stat);
    assert(*pre_region.stat == *raw_region.stat);

    // Group without samples: available, no stat
    BenchmarkResponse empty = router.get_benchmarks("current_ratio", "by-region", "99", 2024);
    assert(empty.available());
    assert(!empty.stat);

    assert(throws_invalid_argument([&]() { router.get_benchmarks("no_such_kpi", "all", "ALL", 2024); }));
    assert(throws_invalid_argument([&]() { router.get_benchmarks("current_ratio", "by-size", "L", 2024); }));

    std::cout << "PASSED\n";
}

void test_fallback_after_table_loss() {
    std::cout << "Testing fallback after persisted tables are lost... ";

    TempDir dir("pb-router");
    EngineOptions options = memory_options();
    options.store_root = dir.path();

    auto context = make_context(options);
    QueryRouter router(*context);
    BuildReport report = BuildPipeline(*context).run();

    KpiResponse pre_kpis = router.get_kpis("310002", 2024);
    BenchmarkResponse pre_bench = router.get_benchmarks("current_ratio", "by-region", "31", 2024);
    assert(pre_kpis.provenance == Provenance::Precomputed);
    assert(pre_bench.provenance == Provenance::Precomputed);

    const fs::path gen_dir = fs::path(dir.path()) / GenerationStore::GENERATIONS_DIR / report.generation_id;
    fs::remove(gen_dir / GenerationStore::KPI_TABLE_FILE);
    fs::remove(gen_dir / GenerationStore::BENCHMARK_TABLE_FILE);

    CapabilityModes modes = context->refresh("tables removed");
    assert(modes.kpi_values == AccessMode::RawFallback);
    assert(modes.benchmarks == AccessMode::RawFallback);
    context->cache().clear();

    KpiResponse raw_kpis = router.get_kpis("310002", 2024);
    BenchmarkResponse raw_bench = router.get_benchmarks("current_ratio", "by-region", "31", 2024);
    assert(raw_kpis.provenance == Provenance::RawFallback);
    assert(raw_bench.provenance == Provenance::RawFallback);
    assert(raw_kpis.values == pre_kpis.values);
    assert(*raw_bench.stat == *pre_bench.stat);

    std::cout << "PASSED\n";
}

// ============================================================================
// No-Data Answers
// ============================================================================

void test_unavailable_answers() {
    std::cout << "Testing unavailable answers... ";

    auto context = make_context(memory_options(), nullptr);
    QueryRouter router(*context);

    KpiResponse kpis = router.get_kpis("310001", 2024);
    assert(!kpis.available());
    assert(kpis.provenance == Provenance::None);
    assert(kpis.values.empty());

    BenchmarkResponse bench = router.get_benchmarks("current_ratio", "all", "ALL", 2024);
    assert(!bench.available());
    assert(!bench.stat);

    assert(router.list_entities(2024).empty());

    std::cout << "PASSED\n";
}

void test_fallback_timeout() {
    std::cout << "Testing fallback timeout... ";

    auto source = std::make_shared<ControlledSource>(sample_store());
    EngineOptions options = memory_options();
    options.fallback_timeout_ms = 20;
    options.fallback_workers = 2;

    auto context = make_context(options, source);
    QueryRouter router(*context);

    source->delay_ms = 300;
    const auto start = std::chrono::steady_clock::now();
    KpiResponse response = router.get_kpis("310001", 2024);
    const auto waited = std::chrono::steady_clock::now() - start;

    assert(response.provenance == Provenance::None);
    assert(waited < std::chrono::milliseconds(250));

    // The abandoned task keeps one worker busy; the other serves the next request
    source->delay_ms = 0;
    KpiResponse later = router.get_kpis("310002", 2024);
    assert(later.provenance == Provenance::RawFallback);

    std::cout << "PASSED\n";
}

void test_source_failure_reported() {
    std::cout << "Testing source failure during fallback... ";

    auto source = std::make_shared<ControlledSource>(sample_store());
    auto context = make_context(memory_options(), source);
    QueryRouter router(*context);

    source->offline = true;
    KpiResponse response = router.get_kpis("310001", 2024);
    assert(response.provenance == Provenance::None);
    assert(context->detector().is_stale());

    BenchmarkResponse bench = router.get_benchmarks("current_ratio", "all", "ALL", 2024);
    assert(!bench.available());

    // Back online; the stale flag forces a re-probe and the query succeeds
    source->offline = false;
    context->cache().clear();
    KpiResponse recovered = router.get_kpis("310001", 2024);
    assert(recovered.provenance == Provenance::RawFallback);

    std::cout << "PASSED\n";
}

// ============================================================================
// Cache, Comparison, Listing
// ============================================================================

void test_cache_first() {
    std::cout << "Testing cache-first lookup... ";

    auto context = make_context();
    QueryRouter router(*context);

    router.get_kpis("310001", 2024);
    CacheStats before = router.cache_stats();
    router.get_kpis("310001", 2024);
    CacheStats after = router.cache_stats();
    assert(after.hits == before.hits + 1);

    assert(QueryRouter::kpi_cache_key("310001", 2024) == "kpis|310001|2024");
    assert(QueryRouter::benchmark_cache_key("current_ratio", "by-region", "31", 2024) ==
           "bench|current_ratio|by-region|31|2024");

    // Negative answers are cached under the short TTL only
    EngineOptions options = memory_options();
    options.negative_ttl_ms = 0;
    auto bare = make_context(options, nullptr);
    QueryRouter bare_router(*bare);
    bare_router.get_kpis("310001", 2024);
    assert(bare->cache().size() == 0);

    std::cout << "PASSED\n";
}

void test_publish_during_fallback() {
    std::cout << "Testing publish while a fallback answer is in flight... ";

    auto source = std::make_shared<ControlledSource>(sample_store());
    auto context = make_context(memory_options(), source);
    QueryRouter router(*context);

    source->delay_ms = 400;
    KpiResponse in_flight;
    std::thread reader([&]() { in_flight = router.get_kpis("310001", 2024); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    std::vector<KpiValueRecord> rows = {{"310001", 2024, "current_ratio", 99.0}};
    context->install_generation(std::make_shared<const Generation>(
        "gen-000001", std::move(rows), std::vector<BenchmarkRecord>{}));
    reader.join();
    source->delay_ms = 0;

    // The slow answer was computed from line items before the publish
    assert(in_flight.provenance == Provenance::RawFallback);
    assert(in_flight.values.at("current_ratio") == KpiValue(5.76));

    // It must not outlive the publish in the cache
    KpiResponse after = router.get_kpis("310001", 2024);
    assert(context->mode(QueryKind::KpiValues) == AccessMode::Precomputed);
    assert(after.provenance == Provenance::Precomputed);
    assert(after.values.at("current_ratio") == KpiValue(99.0));

    std::cout << "PASSED\n";
}

void test_compare_to_peers() {
    std::cout << "Testing peer comparison... ";

    auto context = make_context();
    BuildPipeline(*context).run();
    QueryRouter router(*context);

    PeerComparison cmp = router.compare_to_peers("310002", 2024, "current_ratio", "by-region");
    assert(cmp.scope_key == std::optional<std::string>("31"));
    assert(cmp.value == KpiValue(1.5));
    assert(cmp.stat);
    assert(approx(cmp.stat->median, 3.63));
    assert(cmp.band == std::optional<QuartileBand>(QuartileBand::BottomQuartile));
    assert(approx(*cmp.gap, 2.13));
    assert(cmp.underperforming);
    assert(cmp.kpi_provenance == Provenance::Precomputed);
    assert(cmp.benchmark_provenance == Provenance::Precomputed);

    PeerComparison top = router.compare_to_peers("310001", 2024, "current_ratio", "all");
    assert(top.band == std::optional<QuartileBand>(QuartileBand::TopQuartile));
    assert(!top.underperforming);

    // Null KPI value: benchmark still reported, no position
    PeerComparison null_value = router.compare_to_peers("311300", 2024, "current_ratio", "all");
    assert(!null_value.value);
    assert(null_value.stat);
    assert(!null_value.band);

    // Entity without region is outside the scope
    PeerComparison outside = router.compare_to_peers("HOSP-1", 2024, "current_ratio", "by-region");
    assert(!outside.scope_key);
    assert(!outside.stat);

    assert(throws_invalid_argument([&]() { router.compare_to_peers("310001", 2024, "x", "all"); }));

    std::cout << "PASSED\n";
}

void test_list_entities() {
    std::cout << "Testing entity listing... ";

    auto context = make_context();
    QueryRouter router(*context);

    auto raw = router.list_entities(2024);
    assert(raw.size() == 4);

    BuildPipeline(*context).run();
    auto precomputed = router.list_entities(2024);
    assert(precomputed == raw);
    assert(router.list_entities(2023).size() == 1);
    assert(router.list_entities(1999).empty());

    std::cout << "PASSED\n";
}

void test_concurrent_queries_during_rebuild() {
    std::cout << "Testing concurrent queries during rebuild... ";

    auto context = make_context();
    QueryRouter router(*context);
    BuildPipeline pipeline(*context);
    pipeline.run();

    std::atomic<bool> done{false};
    std::vector<std::thread> readers;
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&]() {
            while (!done.load()) {
                KpiResponse kpis = router.get_kpis("310001", 2024);
                assert(kpis.available());
                assert(kpis.values.at("current_ratio") == KpiValue(5.76));

                BenchmarkResponse bench = router.get_benchmarks("current_ratio", "all", "ALL", 2024);
                assert(bench.stat);
                assert(bench.stat->sample_count == 3);
            }
        });
    }

    for (int i = 0; i < 3; ++i) {
        pipeline.run();
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Query Router Test Suite ===\n\n";

    try {
        test_fallback_executor();

        std::cout << "\n";

        test_kpis_from_raw_fallback();
        test_kpis_from_precomputed();
        test_kpis_for_level();
        test_benchmarks_equivalent_across_paths();
        test_fallback_after_table_loss();

        std::cout << "\n";

        test_unavailable_answers();
        test_fallback_timeout();
        test_source_failure_reported();

        std::cout << "\n";

        test_cache_first();
        test_publish_during_fallback();
        test_compare_to_peers();
        test_list_entities();
        test_concurrent_queries_during_rebuild();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @file test_build_pipeline.cpp
 * @brief Tests for the staged precomputation pipeline
 */

#include "peerbench/core/errors.hpp"
#include "peerbench/pipeline/build_pipeline.hpp"
#include "peerbench/storage/generation_store.hpp"
#include "test_fixtures.hpp"

#include <cassert>
#include <filesystem>
#include <future>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace peerbench;
using namespace peerbench::testing;

namespace fs = std::filesystem;

namespace {

BuildFailure expect_build_failure(BuildPipeline& pipeline) {
    try {
        pipeline.run();
    } catch (const BuildFailure& e) {
        return e;
    }
    assert(false && "build was expected to fail");
    return BuildFailure("", "", "");
}

} // namespace

void test_in_memory_build() {
    std::cout << "Testing in-memory build... ";

    auto context = make_context();
    BuildPipeline pipeline(*context);

    std::vector<std::string> stages_seen;
    BuildReport report = pipeline.run([&stages_seen](const std::string& stage, int pct) {
        if (pct == 100) {
            stages_seen.push_back(stage);
        }
    });

    assert(report.generation_id == "gen-000001");
    assert(!report.persisted);
    assert(report.entity_period_count == 5);
    assert(report.kpi_rows == 5 * 5);
    // current_ratio null for 311300, medicare_ccr null everywhere
    assert(report.non_null_kpi_rows == 19);
    assert(report.benchmark_rows > 0);
    assert(report.source_snapshot_hash == context->source()->get_snapshot_hash());

    assert(stages_seen.size() == 5);
    assert(stages_seen[0] == stages::LOAD);
    assert(stages_seen[4] == stages::PUBLISH);
    assert(report.stage_ms.size() == 5);

    auto generation = context->current_generation();
    assert(generation);
    assert(generation->id() == report.generation_id);
    assert(generation->content_checksum() == report.content_checksum);
    assert(context->mode(QueryKind::KpiValues) == AccessMode::Precomputed);
    assert(context->mode(QueryKind::Benchmarks) == AccessMode::Precomputed);

    std::cout << "PASSED\n";
}

void test_built_values() {
    std::cout << "Testing built tables... ";

    auto context = make_context();
    BuildPipeline(*context).run();
    auto generation = context->current_generation();

    assert(generation->find_kpi("310001", 2024, "current_ratio") == std::optional<KpiValue>(5.76));
    assert(generation->find_kpi("310001", 2023, "current_ratio") == std::optional<KpiValue>(5.19));

    // Null is stored as a row, not dropped
    auto null_ratio = generation->find_kpi("311300", 2024, "current_ratio");
    assert(null_ratio.has_value());
    assert(!null_ratio->has_value());

    auto all = generation->find_benchmark(BenchmarkKey("current_ratio", "all", "ALL", 2024));
    assert(all);
    assert(all->sample_count == 3);
    assert(approx(all->p25, 1.825));
    assert(approx(all->median, 2.15));
    assert(approx(all->p75, 3.955));

    auto region = generation->find_benchmark(BenchmarkKey("current_ratio", "by-region", "31", 2024));
    assert(region);
    assert(region->sample_count == 2);
    assert(approx(region->median, 3.63));

    auto combined = generation->find_benchmark(
        BenchmarkKey("current_ratio", "by-region-and-category", "31|Short Term Acute Care", 2024));
    assert(combined);
    assert(combined->sample_count == 2);

    // Only null samples: no row
    assert(!generation->find_benchmark(BenchmarkKey("current_ratio", "by-category", "Critical Access", 2024)));
    assert(!generation->find_benchmark(BenchmarkKey("medicare_ccr", "all", "ALL", 2024)));

    std::cout << "PASSED\n";
}

void test_rebuild_is_deterministic() {
    std::cout << "Testing deterministic rebuild... ";

    auto context = make_context();
    BuildPipeline pipeline(*context);

    BuildReport first = pipeline.run();
    BuildReport second = pipeline.run();
    assert(second.generation_id == "gen-000002");
    assert(first.content_checksum == second.content_checksum);
    assert(first.kpi_rows == second.kpi_rows);
    assert(first.benchmark_rows == second.benchmark_rows);

    // Independent context over the same inputs
    auto other = make_context();
    BuildReport third = BuildPipeline(*other).run();
    assert(third.content_checksum == first.content_checksum);

    std::cout << "PASSED\n";
}

void test_persisted_build() {
    std::cout << "Testing persisted build... ";

    TempDir dir("pb-build");
    EngineOptions options = memory_options();
    options.store_root = dir.path();

    uint64_t checksum = 0;
    {
        auto context = make_context(options);
        BuildReport report = BuildPipeline(*context).run();
        assert(report.persisted);
        assert(report.generation_id == "gen-000001");
        checksum = report.content_checksum;

        const fs::path gen_dir = fs::path(dir.path()) / GenerationStore::GENERATIONS_DIR / "gen-000001";
        assert(fs::exists(gen_dir / GenerationStore::KPI_TABLE_FILE));
        assert(fs::exists(gen_dir / GenerationStore::BENCHMARK_TABLE_FILE));
        assert(context->store()->current_generation_id() == std::optional<std::string>("gen-000001"));
    }

    // A fresh context serves the persisted generation without rebuilding
    auto restarted = make_context(options, nullptr);
    assert(restarted->mode(QueryKind::KpiValues) == AccessMode::Precomputed);
    auto generation = restarted->current_generation();
    assert(generation);
    assert(generation->content_checksum() == checksum);

    std::cout << "PASSED\n";
}

void test_failure_without_source() {
    std::cout << "Testing build without a source... ";

    auto context = make_context(memory_options(), nullptr);
    BuildPipeline pipeline(*context);

    BuildFailure failure = expect_build_failure(pipeline);
    assert(failure.stage() == stages::LOAD);
    assert(context->current_generation() == nullptr);

    std::cout << "PASSED\n";
}

void test_failure_keeps_previous_generation() {
    std::cout << "Testing failed build keeps previous generation... ";

    auto source = std::make_shared<ControlledSource>(sample_store());
    auto context = make_context(memory_options(), source);
    BuildPipeline pipeline(*context);

    BuildReport good = pipeline.run();

    source->reads_fail = true;
    BuildFailure failure = expect_build_failure(pipeline);
    assert(failure.stage() == stages::COMPUTE_KPIS);
    // Lowest failing slot: the single 2023 entity
    assert(failure.subject() == "310001/2023");
    assert(context->current_generation()->id() == good.generation_id);

    source->reads_fail = false;
    source->offline = true;
    failure = expect_build_failure(pipeline);
    assert(failure.stage() == stages::LOAD);
    assert(context->current_generation()->id() == good.generation_id);

    std::cout << "PASSED\n";
}

void test_concurrent_build_rejected() {
    std::cout << "Testing concurrent build rejection... ";

    auto context = make_context();
    BuildPipeline pipeline(*context);

    // Another thread holds the build lock
    std::promise<void> locked;
    std::promise<void> release;
    std::thread holder([&]() {
        auto held = context->try_lock_build();
        assert(held.owns_lock());
        locked.set_value();
        release.get_future().wait();
    });
    locked.get_future().wait();

    BuildFailure failure = expect_build_failure(pipeline);
    assert(failure.stage() == stages::LOAD);
    assert(failure.subject() == "engine");

    release.set_value();
    holder.join();

    // Lock released: the next run goes through
    BuildReport report = pipeline.run();
    assert(report.generation_id == "gen-000001");

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Build Pipeline Test Suite ===\n\n";

    try {
        test_in_memory_build();
        test_built_values();
        test_rebuild_is_deterministic();
        test_persisted_build();

        std::cout << "\n";

        test_failure_without_source();
        test_failure_keeps_previous_generation();
        test_concurrent_build_rejected();

        std::cout << "\n=== All tests PASSED ===\n\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << "\n";
        return 1;
    }
}

/**
 * @file build_pipeline.cpp
 * @brief Implementation of the precomputation pipeline
 */

#include "peerbench/pipeline/build_pipeline.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/processing/benchmark_aggregator.hpp"
#include "peerbench/processing/kpi_calculator.hpp"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace peerbench {

namespace {

using Clock = std::chrono::steady_clock;

struct EntityPeriod {
    EntityId entity_id;
    Period period;
};

struct BenchmarkTask {
    size_t kpi_index;
    size_t scope_index;
    size_t period_index;
};

std::string describe(const EntityPeriod& item) {
    return item.entity_id + "/" + std::to_string(item.period);
}

double elapsed_ms(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

/// Per-slot failure record for the parallel loops
struct SlotError {
    bool failed = false;
    std::string message;
};

/// Lowest failing index, so the reported subject does not depend on scheduling
const SlotError* first_failure(const std::vector<SlotError>& errors, size_t& index) {
    for (size_t i = 0; i < errors.size(); ++i) {
        if (errors[i].failed) {
            index = i;
            return &errors[i];
        }
    }
    return nullptr;
}

} // namespace

BuildPipeline::BuildPipeline(EngineContext& context)
    : context_(context)
{
}

BuildReport BuildPipeline::run(ProgressCallback progress) {
    auto report_progress = [&](const char* stage, int pct) {
        if (progress) {
            progress(stage, pct);
        }
    };

    BuildReport report;
    const auto build_start = Clock::now();

    // ========================================================================
    // load
    // ========================================================================

    auto stage_start = Clock::now();
    report_progress(stages::LOAD, 0);

    auto build_lock = context_.try_lock_build();
    if (!build_lock.owns_lock()) {
        throw BuildFailure(stages::LOAD, "engine", "another build is already running");
    }

    auto source = context_.source();
    if (!source) {
        throw BuildFailure(stages::LOAD, "line items", "no line-item source configured");
    }

    std::vector<Period> periods;
    std::vector<EntityPeriod> items;
    try {
        if (!source->is_open()) {
            throw StorageUnavailable(source->get_source_path() + " is not open");
        }
        periods = source->get_periods();
        for (Period period : periods) {
            for (auto& entity_id : source->get_entities(period)) {
                items.push_back(EntityPeriod{std::move(entity_id), period});
            }
        }
        report.source_snapshot_hash = source->get_snapshot_hash();
    } catch (const StorageUnavailable& e) {
        throw BuildFailure(stages::LOAD, source->get_source_path(), e.what());
    }

    report.entity_period_count = items.size();
    std::cout << "[BUILD] Loaded " << items.size() << " entity/period pairs over "
              << periods.size() << " periods from " << source->get_source_path() << std::endl;
    report.stage_ms[stages::LOAD] = elapsed_ms(stage_start);
    report_progress(stages::LOAD, 100);

    // ========================================================================
    // compute-kpis
    // ========================================================================

    stage_start = Clock::now();
    report_progress(stages::COMPUTE_KPIS, 0);

    const KpiRegistry& registry = context_.registry();
    const auto& definitions = registry.definitions();
    KpiCalculator calculator(registry);

    std::vector<std::vector<KpiResult>> results(items.size());
    std::vector<SlotError> kpi_errors(items.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int64_t i = 0; i < static_cast<int64_t>(items.size()); ++i) {
        const auto& item = items[static_cast<size_t>(i)];
        try {
            LineItemSlice slice = source->read_entity_period(item.entity_id, item.period);
            results[static_cast<size_t>(i)] = calculator.compute_all(slice);
        } catch (const std::exception& e) {
            kpi_errors[static_cast<size_t>(i)] = SlotError{true, e.what()};
        }
    }

    size_t failed_index = 0;
    if (const SlotError* error = first_failure(kpi_errors, failed_index)) {
        throw BuildFailure(stages::COMPUTE_KPIS, describe(items[failed_index]), error->message);
    }

    std::vector<KpiValueRecord> kpi_rows;
    kpi_rows.reserve(items.size() * definitions.size());

    // values_by_kpi[kpi][period index] feeds the benchmark stage
    std::map<Period, size_t> period_index;
    for (size_t p = 0; p < periods.size(); ++p) {
        period_index[periods[p]] = p;
    }
    std::vector<std::vector<std::vector<EntityKpiValue>>> values_by_kpi(
        definitions.size(), std::vector<std::vector<EntityKpiValue>>(periods.size()));

    for (size_t i = 0; i < items.size(); ++i) {
        const size_t p = period_index.at(items[i].period);
        for (size_t k = 0; k < definitions.size(); ++k) {
            KpiValue value = results[i][k].as_value();
            kpi_rows.push_back(KpiValueRecord{items[i].entity_id, items[i].period,
                                              definitions[k].key, value});
            values_by_kpi[k][p].push_back(EntityKpiValue{items[i].entity_id, value});
        }
    }
    results.clear();

    report.stage_ms[stages::COMPUTE_KPIS] = elapsed_ms(stage_start);
    std::cout << "[BUILD] Computed " << kpi_rows.size() << " KPI values in "
              << std::fixed << std::setprecision(1) << report.stage_ms[stages::COMPUTE_KPIS]
              << " ms" << std::endl;
    report_progress(stages::COMPUTE_KPIS, 100);

    // ========================================================================
    // compute-benchmarks
    // ========================================================================

    stage_start = Clock::now();
    report_progress(stages::COMPUTE_BENCHMARKS, 0);

    const auto& scopes = context_.scopes().scopes();
    BenchmarkAggregator aggregator(context_.directory());

    std::vector<BenchmarkTask> tasks;
    tasks.reserve(definitions.size() * scopes.size() * periods.size());
    for (size_t k = 0; k < definitions.size(); ++k) {
        for (size_t s = 0; s < scopes.size(); ++s) {
            for (size_t p = 0; p < periods.size(); ++p) {
                tasks.push_back(BenchmarkTask{k, s, p});
            }
        }
    }

    std::vector<std::vector<BenchmarkRecord>> task_rows(tasks.size());
    std::vector<SlotError> benchmark_errors(tasks.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic)
#endif
    for (int64_t t = 0; t < static_cast<int64_t>(tasks.size()); ++t) {
        const auto& task = tasks[static_cast<size_t>(t)];
        try {
            task_rows[static_cast<size_t>(t)] = aggregator.aggregate_records(
                definitions[task.kpi_index].key, scopes[task.scope_index],
                periods[task.period_index], values_by_kpi[task.kpi_index][task.period_index]);
        } catch (const std::exception& e) {
            benchmark_errors[static_cast<size_t>(t)] = SlotError{true, e.what()};
        }
    }

    if (const SlotError* error = first_failure(benchmark_errors, failed_index)) {
        const auto& task = tasks[failed_index];
        throw BuildFailure(stages::COMPUTE_BENCHMARKS,
                           definitions[task.kpi_index].key + "/" + scopes[task.scope_index].id +
                               "/" + std::to_string(periods[task.period_index]),
                           error->message);
    }

    std::vector<BenchmarkRecord> benchmark_rows;
    for (auto& rows : task_rows) {
        for (auto& row : rows) {
            benchmark_rows.push_back(std::move(row));
        }
    }
    task_rows.clear();

    report.stage_ms[stages::COMPUTE_BENCHMARKS] = elapsed_ms(stage_start);
    std::cout << "[BUILD] Computed " << benchmark_rows.size() << " benchmark rows from "
              << tasks.size() << " groups in " << report.stage_ms[stages::COMPUTE_BENCHMARKS]
              << " ms" << std::endl;
    report_progress(stages::COMPUTE_BENCHMARKS, 100);

    // ========================================================================
    // build-indexes
    // ========================================================================

    stage_start = Clock::now();
    report_progress(stages::BUILD_INDEXES, 0);

    GenerationStore* store = context_.store();
    std::string generation_id;
    if (store) {
        generation_id = store->next_generation_id();
    } else {
        uint64_t sequence = 0;
        if (auto current = context_.current_generation()) {
            sequence = parse_generation_id(current->id()).value_or(0);
        }
        generation_id = format_generation_id(sequence + 1);
    }

    std::shared_ptr<const Generation> generation;
    try {
        generation = std::make_shared<const Generation>(generation_id, std::move(kpi_rows),
                                                        std::move(benchmark_rows));
    } catch (const std::invalid_argument& e) {
        throw BuildFailure(stages::BUILD_INDEXES, generation_id, e.what());
    }

    report.generation_id = generation->id();
    report.kpi_rows = generation->kpi_row_count();
    report.non_null_kpi_rows = generation->non_null_kpi_count();
    report.benchmark_rows = generation->benchmark_row_count();
    report.content_checksum = generation->content_checksum();
    report.stage_ms[stages::BUILD_INDEXES] = elapsed_ms(stage_start);
    report_progress(stages::BUILD_INDEXES, 100);

    // ========================================================================
    // publish
    // ========================================================================

    stage_start = Clock::now();
    report_progress(stages::PUBLISH, 0);

    if (store) {
        try {
            store->publish(*generation);
            report.persisted = true;
        } catch (const StorageUnavailable& e) {
            throw BuildFailure(stages::PUBLISH, store->root(), e.what());
        }
    }
    context_.install_generation(generation);

    report.stage_ms[stages::PUBLISH] = elapsed_ms(stage_start);
    report_progress(stages::PUBLISH, 100);

    report.elapsed_ms = elapsed_ms(build_start);

    std::ostringstream checksum;
    checksum << std::hex << std::setw(16) << std::setfill('0') << report.content_checksum;
    std::cout << "[BUILD] Generation " << report.generation_id << " ready: "
              << report.kpi_rows << " KPI rows (" << report.non_null_kpi_rows << " non-null), "
              << report.benchmark_rows << " benchmark rows, checksum " << checksum.str()
              << ", " << std::fixed << std::setprecision(1) << report.elapsed_ms << " ms" << std::endl;

    return report;
}

} // namespace peerbench

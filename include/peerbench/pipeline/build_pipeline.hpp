#pragma once

/**
 * @file build_pipeline.hpp
 * @brief Offline precomputation of the kpi_values and benchmark_stats tables
 *
 * Stages, in order:
 *
 *   load               enumerate the (entity, period) pairs of the source
 *   compute-kpis       every KPI for every pair (parallel per pair)
 *   compute-benchmarks every KPI x scope x period (parallel per task)
 *   build-indexes      assemble the immutable Generation
 *   publish            persist (if a store is configured) and install
 *
 * A failing stage throws BuildFailure and nothing is published; the previous
 * generation keeps serving. With unchanged inputs a rerun produces the same
 * content checksum.
 *
 * Usage:
 * @code
 *   BuildPipeline pipeline(*context);
 *   BuildReport report = pipeline.run([](const std::string& stage, int pct) {
 *       std::cout << stage << " " << pct << "%\n";
 *   });
 * @endcode
 */

#include "peerbench/core/engine_context.hpp"
#include "peerbench/core/types.hpp"
#include <map>
#include <memory>
#include <string>

namespace peerbench {

/// Stage names as reported in BuildFailure and BuildReport
namespace stages {
    inline constexpr const char* LOAD = "load";
    inline constexpr const char* COMPUTE_KPIS = "compute-kpis";
    inline constexpr const char* COMPUTE_BENCHMARKS = "compute-benchmarks";
    inline constexpr const char* BUILD_INDEXES = "build-indexes";
    inline constexpr const char* PUBLISH = "publish";
}

/// Summary of a successful run
struct BuildReport {
    std::string generation_id;
    size_t entity_period_count = 0;
    size_t kpi_rows = 0;
    size_t non_null_kpi_rows = 0;
    size_t benchmark_rows = 0;
    uint64_t source_snapshot_hash = 0;
    uint64_t content_checksum = 0;
    bool persisted = false;                     ///< Written to the generation store
    std::map<std::string, double> stage_ms;     ///< Elapsed time per stage
    double elapsed_ms = 0.0;
};

class BuildPipeline {
public:
    explicit BuildPipeline(EngineContext& context);

    BuildPipeline(const BuildPipeline&) = delete;
    BuildPipeline& operator=(const BuildPipeline&) = delete;

    /**
     * @brief Run every stage and install the new generation
     * @param progress Optional callback receiving (stage, percentage)
     * @throws BuildFailure with the failing stage and subject
     */
    BuildReport run(ProgressCallback progress = nullptr);

private:
    EngineContext& context_;
};

} // namespace peerbench

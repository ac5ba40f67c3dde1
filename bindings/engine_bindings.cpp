/**
 * @file engine_bindings.cpp
 * @brief Python bindings for the engine (context, build pipeline, router)
 *
 * Exposes:
 * - EngineOptions: Paths and tuning knobs
 * - EngineContext: Loaded engine (load_engine_context)
 * - BuildPipeline / BuildReport: Offline precomputation
 * - QueryRouter: get_kpis, get_benchmarks, compare_to_peers, ...
 * - Response and statistics types
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "peerbench/config/config_loader.hpp"
#include "peerbench/core/engine_context.hpp"
#include "peerbench/core/errors.hpp"
#include "peerbench/pipeline/build_pipeline.hpp"
#include "peerbench/serving/query_router.hpp"

namespace py = pybind11;

namespace peerbench {

/**
 * @brief Initialize engine bindings
 */
void init_engine_bindings(py::module& m) {
    // ========================================================================
    // Exceptions
    // ========================================================================
    py::register_exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<StorageUnavailable>(m, "StorageUnavailable", PyExc_IOError);
    py::register_exception<TableFormatError>(m, "TableFormatError", PyExc_IOError);
    py::register_exception<BuildFailure>(m, "BuildFailure", PyExc_RuntimeError);

    // ========================================================================
    // Enums
    // ========================================================================
    py::enum_<AccessMode>(m, "AccessMode")
        .value("Precomputed", AccessMode::Precomputed)
        .value("RawFallback", AccessMode::RawFallback)
        .value("Unavailable", AccessMode::Unavailable);

    py::enum_<QueryKind>(m, "QueryKind")
        .value("KpiValues", QueryKind::KpiValues)
        .value("Benchmarks", QueryKind::Benchmarks);

    py::enum_<Provenance>(m, "Provenance")
        .value("Precomputed", Provenance::Precomputed)
        .value("RawFallback", Provenance::RawFallback)
        .value("None_", Provenance::None);

    py::enum_<QuartileBand>(m, "QuartileBand")
        .value("BottomQuartile", QuartileBand::BottomQuartile)
        .value("BelowMedian", QuartileBand::BelowMedian)
        .value("AboveMedian", QuartileBand::AboveMedian)
        .value("TopQuartile", QuartileBand::TopQuartile);

    // ========================================================================
    // EngineOptions
    // ========================================================================
    py::class_<EngineOptions>(m, "EngineOptions",
        "Engine configuration (paths and tuning knobs)")

        .def(py::init<>())

        .def_readwrite("line_items_path", &EngineOptions::line_items_path)
        .def_readwrite("aggregates_path", &EngineOptions::aggregates_path)
        .def_readwrite("kpis_path", &EngineOptions::kpis_path)
        .def_readwrite("scopes_path", &EngineOptions::scopes_path)
        .def_readwrite("entities_path", &EngineOptions::entities_path)
        .def_readwrite("derive_ccn_dimensions", &EngineOptions::derive_ccn_dimensions)
        .def_readwrite("store_root", &EngineOptions::store_root)
        .def_readwrite("generations_to_keep", &EngineOptions::generations_to_keep)
        .def_readwrite("compression_level", &EngineOptions::compression_level)
        .def_readwrite("cache_capacity", &EngineOptions::cache_capacity)
        .def_readwrite("cache_shards", &EngineOptions::cache_shards)
        .def_readwrite("cache_ttl_ms", &EngineOptions::cache_ttl_ms)
        .def_readwrite("negative_ttl_ms", &EngineOptions::negative_ttl_ms)
        .def_readwrite("fallback_timeout_ms", &EngineOptions::fallback_timeout_ms)
        .def_readwrite("fallback_workers", &EngineOptions::fallback_workers)
        .def_readwrite("reprobe_interval_ms", &EngineOptions::reprobe_interval_ms);

    // ========================================================================
    // Results
    // ========================================================================
    py::class_<BenchmarkStat>(m, "BenchmarkStat",
        "Percentile summary of one peer group")

        .def_readonly("p25", &BenchmarkStat::p25)
        .def_readonly("median", &BenchmarkStat::median)
        .def_readonly("p75", &BenchmarkStat::p75)
        .def_readonly("mean", &BenchmarkStat::mean)
        .def_readonly("sample_count", &BenchmarkStat::sample_count)
        .def("__repr__", [](const BenchmarkStat& s) {
            return "<BenchmarkStat p25=" + std::to_string(s.p25) +
                   " median=" + std::to_string(s.median) +
                   " p75=" + std::to_string(s.p75) +
                   " n=" + std::to_string(s.sample_count) + ">";
        });

    py::class_<KpiResponse>(m, "KpiResponse",
        "KPI values of one entity/period")

        .def_readonly("values", &KpiResponse::values,
            "KPI key -> value (None for insufficient data)")
        .def_readonly("provenance", &KpiResponse::provenance)
        .def("available", &KpiResponse::available,
            "False for the explicit 'no data' answer")
        .def("has_values", &KpiResponse::has_values);

    py::class_<BenchmarkResponse>(m, "BenchmarkResponse",
        "Benchmark of one KPI for one peer group")

        .def_readonly("stat", &BenchmarkResponse::stat)
        .def_readonly("provenance", &BenchmarkResponse::provenance)
        .def("available", &BenchmarkResponse::available);

    py::class_<PeerComparison>(m, "PeerComparison",
        "Position of an entity's KPI value inside its peer group")

        .def_readonly("entity_id", &PeerComparison::entity_id)
        .def_readonly("period", &PeerComparison::period)
        .def_readonly("kpi_key", &PeerComparison::kpi_key)
        .def_readonly("scope", &PeerComparison::scope)
        .def_readonly("scope_key", &PeerComparison::scope_key)
        .def_readonly("value", &PeerComparison::value)
        .def_readonly("stat", &PeerComparison::stat)
        .def_readonly("band", &PeerComparison::band)
        .def_readonly("gap", &PeerComparison::gap)
        .def_readonly("underperforming", &PeerComparison::underperforming)
        .def_readonly("kpi_provenance", &PeerComparison::kpi_provenance)
        .def_readonly("benchmark_provenance", &PeerComparison::benchmark_provenance);

    py::class_<CacheStats>(m, "CacheStats",
        "Statistics about cache performance")

        .def_readonly("hits", &CacheStats::hits, "Number of cache hits")
        .def_readonly("misses", &CacheStats::misses, "Number of cache misses")
        .def_readonly("evictions", &CacheStats::evictions)
        .def_readonly("expirations", &CacheStats::expirations)
        .def_readonly("entries", &CacheStats::entries, "Current entry count")
        .def_readonly("capacity", &CacheStats::capacity)
        .def_readonly("hit_rate", &CacheStats::hit_rate, "Hit rate (0.0 - 1.0)");

    py::class_<BuildReport>(m, "BuildReport",
        "Summary of a successful build")

        .def_readonly("generation_id", &BuildReport::generation_id)
        .def_readonly("entity_period_count", &BuildReport::entity_period_count)
        .def_readonly("kpi_rows", &BuildReport::kpi_rows)
        .def_readonly("non_null_kpi_rows", &BuildReport::non_null_kpi_rows)
        .def_readonly("benchmark_rows", &BuildReport::benchmark_rows)
        .def_readonly("content_checksum", &BuildReport::content_checksum)
        .def_readonly("persisted", &BuildReport::persisted)
        .def_readonly("stage_ms", &BuildReport::stage_ms)
        .def_readonly("elapsed_ms", &BuildReport::elapsed_ms);

    // ========================================================================
    // EngineContext
    // ========================================================================
    py::class_<EngineContext, std::unique_ptr<EngineContext>>(m, "EngineContext",
        "Loaded engine: registries, line items, cache and generation store")

        .def("mode", &EngineContext::mode, py::arg("kind"),
            "Current access mode of a query kind")
        .def("refresh",
            [](EngineContext& ctx) {
                CapabilityModes modes = ctx.refresh("python");
                return py::make_tuple(modes.kpi_values, modes.benchmarks);
            },
            "Re-probe the store; returns (kpi_values mode, benchmarks mode)")
        .def_property_readonly("generation_id",
            [](const EngineContext& ctx) -> py::object {
                auto generation = ctx.current_generation();
                if (!generation) return py::none();
                return py::str(generation->id());
            })
        .def_property_readonly("kpi_keys",
            [](const EngineContext& ctx) { return ctx.registry().keys(); })
        .def_property_readonly("scope_ids",
            [](const EngineContext& ctx) {
                std::vector<std::string> ids;
                for (const auto& scope : ctx.scopes().scopes()) ids.push_back(scope.id);
                return ids;
            });

    m.def("load_engine_context", &load_engine_context, py::arg("options"),
        "Load configuration and line items and probe the generation store");

    // ========================================================================
    // BuildPipeline
    // ========================================================================
    py::class_<BuildPipeline>(m, "BuildPipeline",
        "Offline precomputation of KPI values and benchmarks")

        .def(py::init<EngineContext&>(), py::arg("context"), py::keep_alive<1, 2>())
        .def("run", &BuildPipeline::run, py::arg("progress") = nullptr,
            py::call_guard<py::gil_scoped_release>(),
            "Run every stage and install the new generation");

    // ========================================================================
    // QueryRouter
    // ========================================================================
    py::class_<QueryRouter>(m, "QueryRouter",
        "Tiered KPI and benchmark queries")

        .def(py::init<EngineContext&>(), py::arg("context"), py::keep_alive<1, 2>())
        .def("get_kpis", &QueryRouter::get_kpis,
            py::arg("entity_id"), py::arg("period"),
            py::call_guard<py::gil_scoped_release>())
        .def("get_benchmarks", &QueryRouter::get_benchmarks,
            py::arg("kpi_key"), py::arg("scope"), py::arg("scope_key"), py::arg("period"),
            py::call_guard<py::gil_scoped_release>())
        .def("get_kpis_for_level", &QueryRouter::get_kpis_for_level,
            py::arg("entity_id"), py::arg("period"), py::arg("level"),
            py::call_guard<py::gil_scoped_release>())
        .def("compare_to_peers", &QueryRouter::compare_to_peers,
            py::arg("entity_id"), py::arg("period"), py::arg("kpi_key"), py::arg("scope"),
            py::call_guard<py::gil_scoped_release>())
        .def("list_entities", &QueryRouter::list_entities, py::arg("period"),
            py::call_guard<py::gil_scoped_release>())
        .def("cache_stats", &QueryRouter::cache_stats);
}

} // namespace peerbench

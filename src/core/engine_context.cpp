/**
 * @file engine_context.cpp
 * @brief Implementation of EngineContext
 */

#include "peerbench/core/engine_context.hpp"
#include "peerbench/core/errors.hpp"
#include <chrono>
#include <iostream>

namespace peerbench {

EngineContext::EngineContext(EngineOptions options,
                             KpiRegistry registry,
                             ScopeRegistry scopes,
                             EntityDirectory directory,
                             std::shared_ptr<const ILineItemSource> source)
    : options_(std::move(options))
    , registry_(std::move(registry))
    , scopes_(std::move(scopes))
    , directory_(std::move(directory))
    , source_(std::move(source))
    , cache_(options_.cache_capacity, options_.cache_shards)
{
    if (!options_.store_root.empty()) {
        store_ = std::make_unique<GenerationStore>(options_.store_root,
                                                   options_.compression_level,
                                                   options_.generations_to_keep);
    }
    refresh("startup");
}

// ============================================================================
// Generations
// ============================================================================

std::shared_ptr<const Generation> EngineContext::current_generation() const {
    std::shared_lock<std::shared_mutex> lock(generation_mutex_);
    return generation_;
}

void EngineContext::swap_generation(std::shared_ptr<const Generation> generation) {
    std::unique_lock<std::shared_mutex> lock(generation_mutex_);
    generation_ = std::move(generation);
}

void EngineContext::install_generation(std::shared_ptr<const Generation> generation) {
    const std::string id = generation ? generation->id() : std::string("<none>");

    std::lock_guard<std::mutex> lock(refresh_mutex_);
    swap_generation(std::move(generation));
    detector_.evaluate(gather_signals(), "generation " + id + " installed");
    // Modes now describe the new generation; only then retire cached answers
    cache_.invalidate_all();
}

CapabilityModes EngineContext::reevaluate(const std::string& reason) {
    auto before = current_generation();
    CapabilityModes modes = detector_.evaluate(gather_signals(), reason);
    if (current_generation() != before) {
        cache_.invalidate_all();
    }
    return modes;
}

// ============================================================================
// Capability
// ============================================================================

bool EngineContext::needs_refresh() const {
    if (detector_.never_evaluated() || detector_.is_stale()) {
        return true;
    }
    if (detector_.modes().all_precomputed()) {
        return false;
    }
    auto elapsed = CapabilityDetector::Clock::now() - detector_.last_evaluated();
    return elapsed >= std::chrono::milliseconds(options_.reprobe_interval_ms);
}

AccessMode EngineContext::mode(QueryKind kind) {
    if (needs_refresh()) {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        // Another caller may have re-probed while this one waited
        if (needs_refresh()) {
            reevaluate(detector_.is_stale() ? "io-failure" : "re-probe");
        }
    }
    return detector_.mode(kind);
}

CapabilitySignals EngineContext::gather_signals() {
    CapabilitySignals signals;
    signals.raw_reachable = source_ != nullptr && source_->is_open();

    if (!store_) {
        // In-memory only: whatever the last build installed is the store
        auto generation = current_generation();
        signals.storage_reachable = generation != nullptr;
        signals.kpi_table_ready = generation && generation->has_kpi_table();
        signals.benchmark_table_ready = generation && generation->has_benchmark_table();
        return signals;
    }

    StorageProbe probe = store_->probe();
    signals.storage_reachable = probe.reachable;
    if (!probe.detail.empty()) {
        std::cerr << "[CAPABILITY] Store probe: " << probe.detail << std::endl;
    }
    if (!probe.reachable || !probe.any_table_ready()) {
        return signals;
    }

    auto generation = current_generation();
    const bool same_id = generation && generation->id() == *probe.generation_id;
    const bool has_needed_tables = same_id &&
        (!probe.kpi_table_ready || generation->has_kpi_table()) &&
        (!probe.benchmark_table_ready || generation->has_benchmark_table());

    if (!has_needed_tables) {
        try {
            generation = store_->load(probe);
            swap_generation(generation);
        } catch (const StorageUnavailable& e) {
            std::cerr << "[CAPABILITY] Failed to load generation: " << e.what() << std::endl;
            return signals;
        } catch (const TableFormatError& e) {
            std::cerr << "[CAPABILITY] Failed to load generation: " << e.what() << std::endl;
            return signals;
        }
    }

    signals.kpi_table_ready = probe.kpi_table_ready && generation && generation->has_kpi_table();
    signals.benchmark_table_ready =
        probe.benchmark_table_ready && generation && generation->has_benchmark_table();
    return signals;
}

CapabilityModes EngineContext::refresh(const std::string& reason) {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return reevaluate(reason);
}

void EngineContext::report_io_failure(QueryKind kind, const std::string& detail) {
    std::cerr << "[CAPABILITY] I/O failure on " << to_string(kind) << ": " << detail << std::endl;
    detector_.mark_stale();
}

} // namespace peerbench

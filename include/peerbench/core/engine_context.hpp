#pragma once

/**
 * @file engine_context.hpp
 * @brief Explicit engine handle shared by the router and the build pipeline
 *
 * EngineContext owns everything a query or a build needs: the configuration
 * registries, the entity directory, the line-item source, the result cache,
 * the generation store and the capability detector. It is created once (see
 * load_engine_context()) and passed by reference; there is no global state.
 *
 * Usage:
 * @code
 *   auto context = load_engine_context(options);
 *
 *   BuildPipeline pipeline(*context);
 *   BuildReport report = pipeline.run();
 *
 *   QueryRouter router(*context);
 *   KpiResponse kpis = router.get_kpis("310001", 2024);
 * @endcode
 *
 * Thread Safety:
 * - The installed generation is swapped under a shared_mutex; readers copy
 *   the shared_ptr and keep a consistent view for the whole request
 * - Capability refreshes are serialized; mode lookups are lock-cheap
 */

#include "peerbench/config/engine_options.hpp"
#include "peerbench/config/kpi_registry.hpp"
#include "peerbench/config/scope_registry.hpp"
#include "peerbench/core/result_cache.hpp"
#include "peerbench/data/entity_directory.hpp"
#include "peerbench/data/line_item_source.hpp"
#include "peerbench/serving/capability_detector.hpp"
#include "peerbench/storage/generation.hpp"
#include "peerbench/storage/generation_store.hpp"
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace peerbench {

class EngineContext {
public:
    // ========================================================================
    // Construction
    // ========================================================================

    /**
     * @brief Assemble a context and run the startup capability probe
     * @param source Line-item source; may be null when only persisted tables
     *        are served
     */
    EngineContext(EngineOptions options,
                  KpiRegistry registry,
                  ScopeRegistry scopes,
                  EntityDirectory directory,
                  std::shared_ptr<const ILineItemSource> source);

    ~EngineContext() = default;

    // Non-copyable, non-movable (router and pipeline hold references)
    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;
    EngineContext(EngineContext&&) = delete;
    EngineContext& operator=(EngineContext&&) = delete;

    // ========================================================================
    // Components
    // ========================================================================

    const EngineOptions& options() const { return options_; }
    const KpiRegistry& registry() const { return registry_; }
    const ScopeRegistry& scopes() const { return scopes_; }
    const EntityDirectory& directory() const { return directory_; }

    /// Line-item source, or nullptr when none is configured
    std::shared_ptr<const ILineItemSource> source() const { return source_; }

    ResultCache& cache() { return cache_; }

    /// Generation store, or nullptr when running in-memory only
    GenerationStore* store() { return store_.get(); }

    const CapabilityDetector& detector() const { return detector_; }

    // ========================================================================
    // Generations
    // ========================================================================

    /// Currently installed generation (may be null)
    std::shared_ptr<const Generation> current_generation() const;

    /**
     * @brief Make a generation current
     *
     * Swaps the pointer, re-evaluates the access modes and then invalidates
     * the result cache. Readers holding the previous generation are unaffected.
     */
    void install_generation(std::shared_ptr<const Generation> generation);

    // ========================================================================
    // Capability
    // ========================================================================

    /**
     * @brief Access mode for a query kind
     *
     * Re-probes first when the detector is stale (an I/O failure was
     * reported) or when the kind is degraded and the re-probe interval has
     * elapsed.
     */
    AccessMode mode(QueryKind kind);

    /**
     * @brief Probe the store and source and re-evaluate the modes
     *
     * Loads the store's current generation when it differs from the
     * installed one. Never throws; failures downgrade the mode.
     */
    CapabilityModes refresh(const std::string& reason);

    /// Record an I/O failure seen while serving; the next lookup re-probes
    void report_io_failure(QueryKind kind, const std::string& detail);

    // ========================================================================
    // Build Coordination
    // ========================================================================

    /// Non-blocking attempt to become the only running build
    std::unique_lock<std::mutex> try_lock_build() {
        return std::unique_lock<std::mutex>(build_mutex_, std::try_to_lock);
    }

private:
    void swap_generation(std::shared_ptr<const Generation> generation);

    /// Probe and evaluate; invalidates the cache when a new generation was loaded.
    /// Caller holds refresh_mutex_.
    CapabilityModes reevaluate(const std::string& reason);
    bool needs_refresh() const;
    CapabilitySignals gather_signals();

    EngineOptions options_;
    KpiRegistry registry_;
    ScopeRegistry scopes_;
    EntityDirectory directory_;
    std::shared_ptr<const ILineItemSource> source_;

    ResultCache cache_;
    std::unique_ptr<GenerationStore> store_;
    CapabilityDetector detector_;

    std::shared_ptr<const Generation> generation_;
    mutable std::shared_mutex generation_mutex_;

    std::mutex refresh_mutex_;
    std::mutex build_mutex_;
};

} // namespace peerbench

#pragma once

/**
 * @file capability_detector.hpp
 * @brief Decides, per query kind, which data path can serve requests
 *
 * The detector turns a set of availability signals into an AccessMode for
 * each QueryKind:
 *
 *   table ready         -> Precomputed
 *   raw source reachable -> RawFallback
 *   otherwise           -> Unavailable
 *
 * It holds no I/O of its own; EngineContext gathers the signals (store probe,
 * installed generation, line-item source) and feeds them in. Every mode change
 * is recorded and logged.
 */

#include "peerbench/core/types.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace peerbench {

/// Availability observed by one probe
struct CapabilitySignals {
    bool storage_reachable = false;     ///< Store root (or in-memory generation) usable
    bool kpi_table_ready = false;
    bool benchmark_table_ready = false;
    bool raw_reachable = false;         ///< Line-item source open
};

/// Modes of both query kinds
struct CapabilityModes {
    AccessMode kpi_values = AccessMode::Unavailable;
    AccessMode benchmarks = AccessMode::Unavailable;

    AccessMode of(QueryKind kind) const {
        return kind == QueryKind::KpiValues ? kpi_values : benchmarks;
    }

    bool all_precomputed() const {
        return kpi_values == AccessMode::Precomputed && benchmarks == AccessMode::Precomputed;
    }
};

/// One recorded mode change
struct ModeTransition {
    QueryKind kind;
    AccessMode from;
    AccessMode to;
    std::string reason;
};

class CapabilityDetector {
public:
    using Clock = std::chrono::steady_clock;

    CapabilityDetector() = default;

    CapabilityDetector(const CapabilityDetector&) = delete;
    CapabilityDetector& operator=(const CapabilityDetector&) = delete;

    /// Pure mapping from signals to modes
    static CapabilityModes classify(const CapabilitySignals& signals);

    /**
     * @brief Apply a fresh set of signals
     *
     * Records a transition for each kind whose mode changed and clears the
     * stale flag.
     *
     * @param reason Why the probe ran ("startup", "io-failure", ...)
     * @return The new modes
     */
    CapabilityModes evaluate(const CapabilitySignals& signals, const std::string& reason);

    AccessMode mode(QueryKind kind) const;

    CapabilityModes modes() const;

    /// Request re-evaluation on the next mode lookup (after an I/O failure)
    void mark_stale();

    bool is_stale() const;

    /// True until the first evaluate() call
    bool never_evaluated() const;

    /// Time of the last evaluate() call
    Clock::time_point last_evaluated() const;

    std::vector<ModeTransition> transitions() const;

private:
    mutable std::mutex mutex_;
    CapabilityModes modes_;
    std::vector<ModeTransition> transitions_;
    Clock::time_point last_evaluated_{};
    bool stale_ = false;
    bool evaluated_ = false;
};

} // namespace peerbench

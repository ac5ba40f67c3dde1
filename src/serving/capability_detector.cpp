#include "peerbench/serving/capability_detector.hpp"
#include <iostream>

namespace peerbench {

namespace {

AccessMode mode_for(bool table_ready, const CapabilitySignals& signals) {
    if (signals.storage_reachable && table_ready) {
        return AccessMode::Precomputed;
    }
    if (signals.raw_reachable) {
        return AccessMode::RawFallback;
    }
    return AccessMode::Unavailable;
}

} // namespace

CapabilityModes CapabilityDetector::classify(const CapabilitySignals& signals) {
    CapabilityModes modes;
    modes.kpi_values = mode_for(signals.kpi_table_ready, signals);
    modes.benchmarks = mode_for(signals.benchmark_table_ready, signals);
    return modes;
}

CapabilityModes CapabilityDetector::evaluate(const CapabilitySignals& signals,
                                             const std::string& reason) {
    CapabilityModes next = classify(signals);

    std::lock_guard<std::mutex> lock(mutex_);

    auto record = [&](QueryKind kind, AccessMode from, AccessMode to) {
        if (evaluated_ && from == to) {
            return;
        }
        transitions_.push_back(ModeTransition{kind, from, to, reason});
        auto& stream = to == AccessMode::Precomputed ? std::cout : std::cerr;
        stream << "[CAPABILITY] " << to_string(kind) << ": " << to_string(from)
               << " -> " << to_string(to) << " (" << reason << ")" << std::endl;
    };

    record(QueryKind::KpiValues, modes_.kpi_values, next.kpi_values);
    record(QueryKind::Benchmarks, modes_.benchmarks, next.benchmarks);

    modes_ = next;
    stale_ = false;
    evaluated_ = true;
    last_evaluated_ = Clock::now();
    return modes_;
}

AccessMode CapabilityDetector::mode(QueryKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modes_.of(kind);
}

CapabilityModes CapabilityDetector::modes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return modes_;
}

void CapabilityDetector::mark_stale() {
    std::lock_guard<std::mutex> lock(mutex_);
    stale_ = true;
}

bool CapabilityDetector::is_stale() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stale_;
}

bool CapabilityDetector::never_evaluated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !evaluated_;
}

CapabilityDetector::Clock::time_point CapabilityDetector::last_evaluated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_evaluated_;
}

std::vector<ModeTransition> CapabilityDetector::transitions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transitions_;
}

} // namespace peerbench

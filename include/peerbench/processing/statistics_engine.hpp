#pragma once

/**
 * @file statistics_engine.hpp
 * @brief Percentile and mean computation for benchmark groups
 *
 * Percentiles use the continuous definition (linear interpolation between
 * closest ranks, rank = p * (n - 1)), the same as SQL PERCENTILE_CONT. One
 * method is used everywhere so precomputed and on-the-fly benchmarks agree.
 */

#include "peerbench/core/cancellation.hpp"
#include "peerbench/core/types.hpp"
#include <optional>
#include <span>
#include <vector>

namespace peerbench {

class StatisticsEngine {
public:
    StatisticsEngine() = delete;  // Static class, no instances

    /**
     * @brief Continuous percentile of sorted data
     * @param sorted Ascending samples (non-empty)
     * @param fraction Percentile in [0, 1]
     * @throws std::invalid_argument for empty data or fraction out of range
     */
    static double percentile_cont(std::span<const double> sorted, double fraction);

    /**
     * @brief Arithmetic mean
     *
     * Uses Arrow compute for large inputs when built with Arrow, a plain
     * ordered sum otherwise. Returns 0 for empty input.
     */
    static double calculate_mean(const double* data, size_t length);

    /// Summary of already sorted samples; nullopt when empty
    static std::optional<BenchmarkStat> summarize_sorted(std::span<const double> sorted);

    /**
     * @brief Sort samples once and summarize them
     * @throws OperationCancelled if token is cancelled before the sort
     */
    static std::optional<BenchmarkStat> summarize(std::vector<double> samples,
                                                  const CancellationToken* token = nullptr);
};

} // namespace peerbench

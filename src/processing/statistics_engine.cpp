/**
 * @file statistics_engine.cpp
 * @brief Percentile and mean computation
 */

#include "peerbench/processing/statistics_engine.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/compute/api.h>
#endif

namespace peerbench {

double StatisticsEngine::percentile_cont(std::span<const double> sorted, double fraction) {
  if (sorted.empty()) {
    throw std::invalid_argument("percentile of empty data");
  }
  if (fraction < 0.0 || fraction > 1.0) {
    throw std::invalid_argument("percentile fraction must be in [0, 1]");
  }

  const double rank = fraction * static_cast<double>(sorted.size() - 1);
  const size_t lower = static_cast<size_t>(std::floor(rank));
  const size_t upper = static_cast<size_t>(std::ceil(rank));
  const double weight = rank - static_cast<double>(lower);

  if (lower == upper) {
    return sorted[lower];
  }
  return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

double StatisticsEngine::calculate_mean(const double *data, size_t length) {
  if (length == 0) {
    return 0.0;
  }

#ifdef HAVE_ARROW
  // Arrow Compute for large groups
  if (length >= constants::ARROW_MEAN_THRESHOLD) {
    arrow::DoubleBuilder builder;
    auto status = builder.AppendValues(data, static_cast<int64_t>(length));
    if (status.ok()) {
      auto maybe_array = builder.Finish();
      if (maybe_array.ok()) {
        arrow::compute::ExecContext ctx;
        auto result = arrow::compute::CallFunction(
            "mean", {maybe_array.ValueOrDie()}, &ctx);
        if (result.ok()) {
          return result.ValueOrDie().scalar_as<arrow::DoubleScalar>().value;
        }
      }
    }
    // Fall through to the scalar path
  }
#endif

  double sum = 0.0;
  for (size_t i = 0; i < length; ++i) {
    sum += data[i];
  }
  return sum / static_cast<double>(length);
}

std::optional<BenchmarkStat> StatisticsEngine::summarize_sorted(std::span<const double> sorted) {
  if (sorted.empty()) {
    return std::nullopt;
  }

  BenchmarkStat stat;
  stat.p25 = percentile_cont(sorted, 0.25);
  stat.median = percentile_cont(sorted, 0.50);
  stat.p75 = percentile_cont(sorted, 0.75);
  stat.mean = calculate_mean(sorted.data(), sorted.size());
  stat.sample_count = sorted.size();
  return stat;
}

std::optional<BenchmarkStat> StatisticsEngine::summarize(std::vector<double> samples,
                                                         const CancellationToken *token) {
  if (samples.empty()) {
    return std::nullopt;
  }
  check_cancelled(token, "percentile sort");
  std::sort(samples.begin(), samples.end());
  return summarize_sorted(samples);
}

} // namespace peerbench

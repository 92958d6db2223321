#pragma once

#include <array>
#include <cstddef>
#include <utility>
#include <vector>

namespace triage::stats {

// All functions return 0 for empty input. Order statistics work on a sorted
// copy and never reorder the caller's data.
double mean(const std::vector<double>& x) noexcept;
// Sample variance with divisor n - 1; 0 when n < 2.
double variance(const std::vector<double>& x) noexcept;
double stddev(const std::vector<double>& x) noexcept;
double standard_error(const std::vector<double>& x) noexcept;
// Normal approximation mean +/- 1.96 * SE; {0, 0} when n < 2.
std::pair<double, double> ci95(const std::vector<double>& x) noexcept;
double median(const std::vector<double>& x);
// Linear interpolation between order statistics; 0 when p is outside [0, 100].
double percentile(const std::vector<double>& x, double p);
double min(const std::vector<double>& x) noexcept;
double max(const std::vector<double>& x) noexcept;
double sum(const std::vector<double>& x) noexcept;

struct ScoreStats {
  std::size_t n{0};
  double mean{0.0};
  double stddev{0.0};
  double se{0.0};
  double ci95_low{0.0};
  double ci95_high{0.0};
  double min{0.0};
  double max{0.0};
  double p25{0.0};
  double p50{0.0};
  double p75{0.0};
};

ScoreStats score_stats(const std::vector<double>& scores);

// Index 0 unused; values outside 1..5 are ignored.
struct LevelStats {
  std::array<std::size_t, 6> counts{};
  std::size_t total{0};
  std::array<double, 6> proportions{};
};

LevelStats level_stats(const std::vector<int>& levels) noexcept;

// 0 on mismatched lengths, n < 2 or zero variance in either series.
double pearson(const std::vector<double>& x, const std::vector<double>& y) noexcept;
double rmse(const std::vector<double>& predicted, const std::vector<double>& reference) noexcept;
double mae(const std::vector<double>& predicted, const std::vector<double>& reference) noexcept;
double within_tolerance(const std::vector<double>& predicted, const std::vector<double>& reference,
                        double tolerance) noexcept;
double exact_agreement(const std::vector<int>& predicted, const std::vector<int>& reference) noexcept;
// Fraction of pairs at most one level apart.
double within_one_level(const std::vector<int>& predicted, const std::vector<int>& reference) noexcept;

}  // namespace triage::stats

#include "stats/descriptive.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace triage::stats {

namespace {

constexpr double kZ95 = 1.96;

std::vector<double> sorted_copy(const std::vector<double>& x) {
  std::vector<double> out(x);
  std::sort(out.begin(), out.end());
  return out;
}

bool paired(const std::size_t a, const std::size_t b) noexcept {
  return a == b && a != 0;
}

}  // namespace

double mean(const std::vector<double>& x) noexcept {
  if (x.empty()) {
    return 0.0;
  }
  return sum(x) / static_cast<double>(x.size());
}

double variance(const std::vector<double>& x) noexcept {
  if (x.size() < 2) {
    return 0.0;
  }
  const double mu = mean(x);
  double acc = 0.0;
  for (const double v : x) {
    const double d = v - mu;
    acc += d * d;
  }
  return acc / static_cast<double>(x.size() - 1);
}

double stddev(const std::vector<double>& x) noexcept {
  return std::sqrt(variance(x));
}

double standard_error(const std::vector<double>& x) noexcept {
  if (x.size() < 2) {
    return 0.0;
  }
  return stddev(x) / std::sqrt(static_cast<double>(x.size()));
}

std::pair<double, double> ci95(const std::vector<double>& x) noexcept {
  if (x.size() < 2) {
    return {0.0, 0.0};
  }
  const double mu = mean(x);
  const double se = standard_error(x);
  return {mu - kZ95 * se, mu + kZ95 * se};
}

double median(const std::vector<double>& x) {
  if (x.empty()) {
    return 0.0;
  }
  const std::vector<double> s = sorted_copy(x);
  const std::size_t n = s.size();
  if (n % 2 == 1) {
    return s[n / 2];
  }
  return (s[n / 2 - 1] + s[n / 2]) / 2.0;
}

double percentile(const std::vector<double>& x, const double p) {
  if (x.empty() || !(p >= 0.0 && p <= 100.0)) {
    return 0.0;
  }
  const std::vector<double> s = sorted_copy(x);
  const double idx = p / 100.0 * static_cast<double>(s.size() - 1);
  const auto i = static_cast<std::size_t>(idx);
  if (i >= s.size() - 1) {
    return s.back();
  }
  const double w = idx - static_cast<double>(i);
  return s[i] * (1.0 - w) + s[i + 1] * w;
}

double min(const std::vector<double>& x) noexcept {
  if (x.empty()) {
    return 0.0;
  }
  return *std::min_element(x.begin(), x.end());
}

double max(const std::vector<double>& x) noexcept {
  if (x.empty()) {
    return 0.0;
  }
  return *std::max_element(x.begin(), x.end());
}

double sum(const std::vector<double>& x) noexcept {
  double acc = 0.0;
  for (const double v : x) {
    acc += v;
  }
  return acc;
}

ScoreStats score_stats(const std::vector<double>& scores) {
  ScoreStats out{};
  out.n = scores.size();
  if (scores.empty()) {
    return out;
  }
  out.mean = mean(scores);
  out.stddev = stddev(scores);
  out.se = standard_error(scores);
  const auto [low, high] = ci95(scores);
  out.ci95_low = low;
  out.ci95_high = high;
  out.min = stats::min(scores);
  out.max = stats::max(scores);
  out.p25 = percentile(scores, 25.0);
  out.p50 = percentile(scores, 50.0);
  out.p75 = percentile(scores, 75.0);
  return out;
}

LevelStats level_stats(const std::vector<int>& levels) noexcept {
  LevelStats out{};
  for (const int level : levels) {
    if (level >= 1 && level <= 5) {
      ++out.counts[static_cast<std::size_t>(level)];
      ++out.total;
    }
  }
  if (out.total > 0) {
    for (std::size_t i = 1; i <= 5; ++i) {
      out.proportions[i] = static_cast<double>(out.counts[i]) / static_cast<double>(out.total);
    }
  }
  return out;
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) noexcept {
  if (x.size() != y.size() || x.size() < 2) {
    return 0.0;
  }
  const double mx = mean(x);
  const double my = mean(y);
  double sxy = 0.0;
  double sxx = 0.0;
  double syy = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) {
    const double dx = x[i] - mx;
    const double dy = y[i] - my;
    sxy += dx * dy;
    sxx += dx * dx;
    syy += dy * dy;
  }
  if (sxx == 0.0 || syy == 0.0) {
    return 0.0;
  }
  return sxy / (std::sqrt(sxx) * std::sqrt(syy));
}

double rmse(const std::vector<double>& predicted, const std::vector<double>& reference) noexcept {
  if (!paired(predicted.size(), reference.size())) {
    return 0.0;
  }
  double acc = 0.0;
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    const double d = predicted[i] - reference[i];
    acc += d * d;
  }
  return std::sqrt(acc / static_cast<double>(predicted.size()));
}

double mae(const std::vector<double>& predicted, const std::vector<double>& reference) noexcept {
  if (!paired(predicted.size(), reference.size())) {
    return 0.0;
  }
  double acc = 0.0;
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    acc += std::abs(predicted[i] - reference[i]);
  }
  return acc / static_cast<double>(predicted.size());
}

double within_tolerance(const std::vector<double>& predicted, const std::vector<double>& reference,
                        const double tolerance) noexcept {
  if (!paired(predicted.size(), reference.size())) {
    return 0.0;
  }
  std::size_t hits = 0;
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    if (std::abs(predicted[i] - reference[i]) <= tolerance) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(predicted.size());
}

double exact_agreement(const std::vector<int>& predicted, const std::vector<int>& reference) noexcept {
  if (!paired(predicted.size(), reference.size())) {
    return 0.0;
  }
  std::size_t hits = 0;
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    if (predicted[i] == reference[i]) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(predicted.size());
}

double within_one_level(const std::vector<int>& predicted, const std::vector<int>& reference) noexcept {
  if (!paired(predicted.size(), reference.size())) {
    return 0.0;
  }
  std::size_t hits = 0;
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    if (std::abs(predicted[i] - reference[i]) <= 1) {
      ++hits;
    }
  }
  return static_cast<double>(hits) / static_cast<double>(predicted.size());
}

}  // namespace triage::stats

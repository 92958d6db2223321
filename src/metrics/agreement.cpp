#include "metrics/agreement.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace triage::metrics {

namespace {

constexpr int kLevels = 5;

bool in_level_range(const int level) noexcept {
  return level >= 1 && level <= kLevels;
}

double ratio(const int num, const int den) noexcept {
  if (den == 0) {
    return 0.0;
  }
  return static_cast<double>(num) / static_cast<double>(den);
}

double harmonic(const double a, const double b) noexcept {
  if (a + b == 0.0) {
    return 0.0;
  }
  return 2.0 * a * b / (a + b);
}

double kappa_weight(const int p, const int r) noexcept {
  const double w = 1.0 - std::abs(static_cast<double>(p - r)) / 4.0;
  return w < 0.0 ? 0.0 : w;
}

int level_or_middle(const int level) noexcept {
  return in_level_range(level) ? level : 3;
}

}  // namespace

ConfusionMatrix::ConfusionMatrix(const std::vector<int>& predicted, const std::vector<int>& reference) {
  if (predicted.size() != reference.size()) {
    return;
  }
  for (std::size_t k = 0; k < predicted.size(); ++k) {
    const int p = predicted[k];
    const int r = reference[k];
    if (!in_level_range(p) || !in_level_range(r)) {
      continue;
    }
    ++counts_[static_cast<std::size_t>(r - 1)][static_cast<std::size_t>(p - 1)];
    ++total_;
  }
}

int ConfusionMatrix::count(const int reference_level, const int predicted_level) const noexcept {
  if (!in_level_range(reference_level) || !in_level_range(predicted_level)) {
    return 0;
  }
  return counts_[static_cast<std::size_t>(reference_level - 1)][static_cast<std::size_t>(predicted_level - 1)];
}

int ConfusionMatrix::tp(const int level) const noexcept {
  return count(level, level);
}

int ConfusionMatrix::fp(const int level) const noexcept {
  if (!in_level_range(level)) {
    return 0;
  }
  int sum = 0;
  for (int r = 1; r <= kLevels; ++r) {
    if (r != level) {
      sum += count(r, level);
    }
  }
  return sum;
}

int ConfusionMatrix::fn(const int level) const noexcept {
  if (!in_level_range(level)) {
    return 0;
  }
  int sum = 0;
  for (int p = 1; p <= kLevels; ++p) {
    if (p != level) {
      sum += count(level, p);
    }
  }
  return sum;
}

int ConfusionMatrix::tn(const int level) const noexcept {
  if (!in_level_range(level)) {
    return 0;
  }
  int sum = 0;
  for (int r = 1; r <= kLevels; ++r) {
    for (int p = 1; p <= kLevels; ++p) {
      if (r != level && p != level) {
        sum += count(r, p);
      }
    }
  }
  return sum;
}

double ConfusionMatrix::sensitivity(const int level) const noexcept {
  return ratio(tp(level), tp(level) + fn(level));
}

double ConfusionMatrix::specificity(const int level) const noexcept {
  return ratio(tn(level), tn(level) + fp(level));
}

double ConfusionMatrix::ppv(const int level) const noexcept {
  return ratio(tp(level), tp(level) + fp(level));
}

double ConfusionMatrix::npv(const int level) const noexcept {
  return ratio(tn(level), tn(level) + fn(level));
}

double ConfusionMatrix::f1(const int level) const noexcept {
  return harmonic(ppv(level), sensitivity(level));
}

double ConfusionMatrix::accuracy(const int level) const noexcept {
  return ratio(tp(level) + tn(level), total_);
}

double ConfusionMatrix::macro_sensitivity() const noexcept {
  double sum = 0.0;
  for (int level = 1; level <= kLevels; ++level) {
    sum += sensitivity(level);
  }
  return sum / kLevels;
}

double ConfusionMatrix::macro_specificity() const noexcept {
  double sum = 0.0;
  for (int level = 1; level <= kLevels; ++level) {
    sum += specificity(level);
  }
  return sum / kLevels;
}

double ConfusionMatrix::overall_accuracy() const noexcept {
  int diagonal = 0;
  for (int level = 1; level <= kLevels; ++level) {
    diagonal += tp(level);
  }
  return ratio(diagonal, total_);
}

double ConfusionMatrix::cohen_kappa() const noexcept {
  if (total_ == 0) {
    return 0.0;
  }
  const double n = static_cast<double>(total_);
  std::array<double, kLevels> predicted_marginal{};
  std::array<double, kLevels> reference_marginal{};
  double observed = 0.0;
  for (std::size_t r = 0; r < kLevels; ++r) {
    for (std::size_t p = 0; p < kLevels; ++p) {
      predicted_marginal[p] += counts_[r][p];
      reference_marginal[r] += counts_[r][p];
    }
    observed += counts_[r][r];
  }
  observed /= n;

  double expected = 0.0;
  for (std::size_t i = 0; i < kLevels; ++i) {
    expected += predicted_marginal[i] * reference_marginal[i] / (n * n);
  }
  if (expected >= 1.0) {
    return 0.0;
  }
  return (observed - expected) / (1.0 - expected);
}

double BinaryConfusion::sensitivity() const noexcept {
  return ratio(tp, tp + fn);
}

double BinaryConfusion::specificity() const noexcept {
  return ratio(tn, tn + fp);
}

double BinaryConfusion::ppv() const noexcept {
  return ratio(tp, tp + fp);
}

double BinaryConfusion::npv() const noexcept {
  return ratio(tn, tn + fn);
}

double BinaryConfusion::f1() const noexcept {
  return harmonic(sensitivity(), ppv());
}

double BinaryConfusion::accuracy() const noexcept {
  return ratio(tp + tn, tp + tn + fp + fn);
}

BinaryConfusion binary_confusion(const std::vector<int>& predicted, const std::vector<int>& reference,
                                 const std::vector<int>& positive_levels) {
  BinaryConfusion out{};
  if (predicted.size() != reference.size()) {
    return out;
  }
  const auto is_positive = [&positive_levels](const int level) {
    return std::find(positive_levels.begin(), positive_levels.end(), level) != positive_levels.end();
  };
  for (std::size_t k = 0; k < predicted.size(); ++k) {
    const int p = predicted[k];
    const int r = reference[k];
    if (!in_level_range(p) || !in_level_range(r)) {
      continue;
    }
    const bool p_pos = is_positive(p);
    const bool r_pos = is_positive(r);
    if (r_pos && p_pos) {
      ++out.tp;
    } else if (p_pos) {
      ++out.fp;
    } else if (r_pos) {
      ++out.fn;
    } else {
      ++out.tn;
    }
  }
  return out;
}

double auc(const std::vector<double>& scores, const std::vector<int>& outcomes) {
  if (scores.size() != outcomes.size() || scores.empty()) {
    return 0.0;
  }
  std::vector<std::pair<double, int>> pairs;
  pairs.reserve(scores.size());
  for (std::size_t i = 0; i < scores.size(); ++i) {
    pairs.emplace_back(scores[i], outcomes[i]);
  }
  std::stable_sort(pairs.begin(), pairs.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });

  std::size_t positives = 0;
  for (const auto& [score, outcome] : pairs) {
    if (outcome == 1) {
      ++positives;
    }
  }
  const std::size_t negatives = pairs.size() - positives;
  if (positives == 0 || negatives == 0) {
    return 0.5;
  }

  // Each positive contributes the number of negatives ranked below it.
  double sum = 0.0;
  std::size_t seen_positive = 0;
  for (std::size_t i = 0; i < pairs.size(); ++i) {
    if (pairs[i].second == 1) {
      sum += static_cast<double>(i - seen_positive);
      ++seen_positive;
    }
  }
  return sum / (static_cast<double>(positives) * static_cast<double>(negatives));
}

double calibration_error(const std::vector<double>& scores, const std::vector<int>& outcomes) {
  if (scores.size() != outcomes.size() || scores.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < scores.size(); ++i) {
    const double observed = outcomes[i] == 1 ? 1.0 : 0.0;
    const double s = std::clamp(scores[i], 0.0, 1.0);
    sum += std::abs(s - observed);
  }
  return sum / static_cast<double>(scores.size());
}

double weighted_kappa(const std::vector<int>& predicted, const std::vector<int>& reference) {
  if (predicted.size() != reference.size() || predicted.empty()) {
    return 0.0;
  }
  const double n = static_cast<double>(predicted.size());
  double observed = 0.0;
  std::array<double, kLevels + 1> predicted_count{};
  std::array<double, kLevels + 1> reference_count{};
  for (std::size_t i = 0; i < predicted.size(); ++i) {
    observed += kappa_weight(level_or_middle(predicted[i]), level_or_middle(reference[i]));
    if (in_level_range(predicted[i])) {
      ++predicted_count[static_cast<std::size_t>(predicted[i])];
    }
    if (in_level_range(reference[i])) {
      ++reference_count[static_cast<std::size_t>(reference[i])];
    }
  }
  observed /= n;

  double expected = 0.0;
  for (int i = 1; i <= kLevels; ++i) {
    for (int j = 1; j <= kLevels; ++j) {
      expected += (predicted_count[static_cast<std::size_t>(i)] / n) *
                  (reference_count[static_cast<std::size_t>(j)] / n) * kappa_weight(i, j);
    }
  }
  if (expected >= 1.0) {
    return 0.0;
  }
  return (observed - expected) / (1.0 - expected);
}

}  // namespace triage::metrics

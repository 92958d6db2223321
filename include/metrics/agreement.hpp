#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace triage::metrics {

// 5x5 counts of predicted vs reference levels. counts[r][p] holds samples
// whose reference level was r + 1 and predicted level was p + 1. Pairs with a
// level outside 1..5 are skipped and not included in total.
class ConfusionMatrix {
 public:
  ConfusionMatrix() = default;
  // Empty matrix when the sequences differ in length.
  ConfusionMatrix(const std::vector<int>& predicted, const std::vector<int>& reference);

  [[nodiscard]] int count(int reference_level, int predicted_level) const noexcept;
  [[nodiscard]] int total() const noexcept { return total_; }

  // One-vs-rest counts for a level in 1..5; 0 for any other level.
  [[nodiscard]] int tp(int level) const noexcept;
  [[nodiscard]] int fp(int level) const noexcept;
  [[nodiscard]] int fn(int level) const noexcept;
  [[nodiscard]] int tn(int level) const noexcept;

  [[nodiscard]] double sensitivity(int level) const noexcept;
  [[nodiscard]] double specificity(int level) const noexcept;
  [[nodiscard]] double ppv(int level) const noexcept;
  [[nodiscard]] double npv(int level) const noexcept;
  [[nodiscard]] double f1(int level) const noexcept;
  [[nodiscard]] double accuracy(int level) const noexcept;

  [[nodiscard]] double macro_sensitivity() const noexcept;
  [[nodiscard]] double macro_specificity() const noexcept;
  [[nodiscard]] double overall_accuracy() const noexcept;
  [[nodiscard]] double cohen_kappa() const noexcept;

 private:
  std::array<std::array<int, 5>, 5> counts_{};
  int total_{0};
};

// 2x2 matrix where every level listed in positive_levels counts as positive.
struct BinaryConfusion {
  int tp{0};
  int fp{0};
  int fn{0};
  int tn{0};

  [[nodiscard]] double sensitivity() const noexcept;
  [[nodiscard]] double specificity() const noexcept;
  [[nodiscard]] double ppv() const noexcept;
  [[nodiscard]] double npv() const noexcept;
  [[nodiscard]] double f1() const noexcept;
  [[nodiscard]] double accuracy() const noexcept;
};

BinaryConfusion binary_confusion(const std::vector<int>& predicted, const std::vector<int>& reference,
                                 const std::vector<int>& positive_levels);

// Rank-based area under the ROC curve for scores against 0/1 outcomes.
// 0 on empty or mismatched input, 0.5 when either class is absent.
double auc(const std::vector<double>& scores, const std::vector<int>& outcomes);

// Mean absolute difference between scores clamped to [0, 1] and 0/1 outcomes.
double calibration_error(const std::vector<double>& scores, const std::vector<int>& outcomes);

// Linearly weighted kappa with weight max(0, 1 - |p - r| / 4). Out-of-range
// levels score as 3 for observed agreement and are left out of the marginals.
double weighted_kappa(const std::vector<int>& predicted, const std::vector<int>& reference);

}  // namespace triage::metrics

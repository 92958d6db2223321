#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "model/triage_level.hpp"
#include "model/vitals.hpp"

namespace triage::core {

using WeightVector = std::array<double, model::kNumVitals>;

struct LevelBand {
  double low{0.0};
  double high{0.0};
};

// Complete scoring configuration. Construction never validates: callers
// build or tune a set freely and must check validate() before scoring with it.
//
//   vital_weights    each in [0, 1], order HR RR SBP DBP Temp SpO2 GCS
//   max_resources    >= 0
//   resource_weight  >= 0
//   t1 > t2 > t3 > t4 > 0, t1 <= 1
struct Params {
  WeightVector vital_weights{};
  int max_resources{0};
  double resource_weight{0.0};
  double t1{0.0};
  double t2{0.0};
  double t3{0.0};
  double t4{0.0};

  [[nodiscard]] bool validate() const noexcept;
  [[nodiscard]] double weight_sum() const noexcept;
  // Normalisation denominator shared by every score computed with this set.
  [[nodiscard]] double divisor() const noexcept;

  [[nodiscard]] std::array<double, 4> thresholds() const noexcept { return {t1, t2, t3, t4}; }
  void set_thresholds(double new_t1, double new_t2, double new_t3, double new_t4) noexcept;
  // No-op unless exactly four values are given.
  void set_all_thresholds(const std::vector<double>& values) noexcept;
  // No-op for out-of-range indices.
  void set_vital_weight(std::size_t index, double weight) noexcept;
  void copy_weights_from(const Params& other) noexcept { vital_weights = other.vital_weights; }

  // Score interval [low, high) covered by level; level 1 extends to 1.0.
  [[nodiscard]] LevelBand threshold_for_level(model::triage_level level) const noexcept;

  // Piecewise-linear level in [1, 5] for display; classification uses from_score.
  [[nodiscard]] double score_to_level_continuous(double score) const noexcept;

  // Multiplies every weight by factor then rescales so the largest is 1.
  void scale_weights(double factor) noexcept;
  // Rescales weights to sum to 1; no-op when the sum is not positive.
  void normalize_weights() noexcept;
  void uniform_weights() noexcept;
  // Log-spaced thresholds between min and max; no-op unless 0 < min < max <= 1.
  void geometric_thresholds(double min, double max) noexcept;

  // True when every threshold is lower than other's, i.e. more patients land
  // in the high-acuity levels.
  [[nodiscard]] bool is_stricter_than(const Params& other) const noexcept;

  bool operator==(const Params&) const = default;
};

Params default_params() noexcept;
// Lower thresholds: more patients classified as high acuity.
Params preset_strict() noexcept;
// Higher thresholds: fewer patients classified as highest acuity.
Params preset_lenient() noexcept;
// Equal-width bands of 0.2 for balanced research cohorts.
Params preset_research() noexcept;

std::optional<Params> preset_by_name(const std::string& name);

// Same checks as Params::validate(), routed through validate::validate_params.
bool validate_params_external(const Params& params) noexcept;

model::triage_level from_score(double score, const Params& params) noexcept;

}  // namespace triage::core

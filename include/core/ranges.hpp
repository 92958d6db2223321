#pragma once

#include <array>
#include <cstddef>

#include "model/vitals.hpp"

namespace triage::core {

// Normal band for one vital: deviation reaches 1 at mid +/- half_width.
// A half_width <= 0 removes the vital from scoring.
struct ReferenceRange {
  double mid{0.0};
  double half_width{0.0};

  bool operator==(const ReferenceRange&) const = default;
};

struct Bounds {
  double min{0.0};
  double max{0.0};
};

struct WeightedDeviation {
  double sum{0.0};
  double weight_sum{0.0};
};

// Per-vital reference ranges in model::kVital* index order.
class ReferenceRanges {
 public:
  ReferenceRanges() = default;
  explicit ReferenceRanges(const std::array<ReferenceRange, model::kNumVitals>& entries) : entries_(entries) {}

  // Out-of-range indices yield {0, 0}.
  [[nodiscard]] ReferenceRange at(std::size_t index) const noexcept;
  // No-op for out-of-range indices.
  void set(std::size_t index, double mid, double half_width) noexcept;

  [[nodiscard]] bool valid() const noexcept;

  // Takes every entry of other whose half_width > 0.
  void merge_with(const ReferenceRanges& other) noexcept;
  void scale_half_widths(double factor) noexcept;

  [[nodiscard]] double deviation_of(std::size_t index, double value) const noexcept;

  // Sum of weight * deviation and of weight over present vitals with positive
  // weight and positive half_width.
  [[nodiscard]] WeightedDeviation weighted_deviation_sum(const model::vital_values& values,
                                                         const std::array<double, model::kNumVitals>& weights) const noexcept;

  [[nodiscard]] const std::array<ReferenceRange, model::kNumVitals>& entries() const noexcept { return entries_; }

  bool operator==(const ReferenceRanges&) const = default;

 private:
  std::array<ReferenceRange, model::kNumVitals> entries_{};
};

ReferenceRanges adult_ranges() noexcept;
ReferenceRanges pediatric_ranges() noexcept;

// min(1, |value - mid| / half_width); 0 when half_width <= 0.
double deviation(double value, double mid, double half_width) noexcept;

// Maps [low, high] onto [0, 1] with clamping; 0 when low >= high.
double normalize_linear(double x, double low, double high) noexcept;
// Returns low when low > high.
double clamp_to_range(double x, double low, double high) noexcept;
bool in_range(double x, double low, double high) noexcept;

// Conservative physiological bounds used to flag implausible inputs.
Bounds critical_bounds(std::size_t index) noexcept;
bool within_critical_bounds(std::size_t index, double value) noexcept;

}  // namespace triage::core

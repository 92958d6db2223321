#include "core/ranges.hpp"

#include <cmath>

namespace triage::core {

ReferenceRange ReferenceRanges::at(const std::size_t index) const noexcept {
  if (index >= entries_.size()) {
    return {};
  }
  return entries_[index];
}

void ReferenceRanges::set(const std::size_t index, const double mid, const double half_width) noexcept {
  if (index >= entries_.size()) {
    return;
  }
  entries_[index] = ReferenceRange{mid, half_width};
}

bool ReferenceRanges::valid() const noexcept {
  for (const auto& entry : entries_) {
    if (!std::isfinite(entry.mid) || !std::isfinite(entry.half_width) || entry.half_width < 0.0) {
      return false;
    }
  }
  return true;
}

void ReferenceRanges::merge_with(const ReferenceRanges& other) noexcept {
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    if (other.entries_[i].half_width > 0.0) {
      entries_[i] = other.entries_[i];
    }
  }
}

void ReferenceRanges::scale_half_widths(const double factor) noexcept {
  if (factor <= 0.0) {
    return;
  }
  for (auto& entry : entries_) {
    entry.half_width *= factor;
  }
}

double ReferenceRanges::deviation_of(const std::size_t index, const double value) const noexcept {
  const ReferenceRange range = at(index);
  return deviation(value, range.mid, range.half_width);
}

WeightedDeviation ReferenceRanges::weighted_deviation_sum(
    const model::vital_values& values, const std::array<double, model::kNumVitals>& weights) const noexcept {
  WeightedDeviation out{};
  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    if (weights[i] <= 0.0 || !model::present(values[i], i)) {
      continue;
    }
    const ReferenceRange& range = entries_[i];
    if (range.half_width <= 0.0) {
      continue;
    }
    out.sum += weights[i] * deviation(values[i], range.mid, range.half_width);
    out.weight_sum += weights[i];
  }
  return out;
}

ReferenceRanges adult_ranges() noexcept {
  return ReferenceRanges(std::array<ReferenceRange, model::kNumVitals>{{
      {80.0, 40.0},   // HR
      {16.0, 10.0},   // RR
      {120.0, 40.0},  // SBP
      {80.0, 30.0},   // DBP
      {37.0, 2.0},    // Temp
      {98.0, 8.0},    // SpO2
      {15.0, 6.0},    // GCS
  }});
}

// Illustrative paediatric bands; calibrate against the local protocol.
ReferenceRanges pediatric_ranges() noexcept {
  return ReferenceRanges(std::array<ReferenceRange, model::kNumVitals>{{
      {100.0, 50.0},
      {24.0, 14.0},
      {90.0, 30.0},
      {60.0, 25.0},
      {37.0, 2.0},
      {98.0, 8.0},
      {15.0, 6.0},
  }});
}

double deviation(const double value, const double mid, const double half_width) noexcept {
  if (half_width <= 0.0) {
    return 0.0;
  }
  const double d = std::fabs(value - mid) / half_width;
  if (d > 1.0) {
    return 1.0;
  }
  return d;
}

double normalize_linear(const double x, const double low, const double high) noexcept {
  if (low >= high) {
    return 0.0;
  }
  if (x <= low) {
    return 0.0;
  }
  if (x >= high) {
    return 1.0;
  }
  return (x - low) / (high - low);
}

double clamp_to_range(const double x, const double low, const double high) noexcept {
  if (low > high) {
    return low;
  }
  if (x < low) {
    return low;
  }
  if (x > high) {
    return high;
  }
  return x;
}

bool in_range(const double x, const double low, const double high) noexcept {
  if (low > high) {
    return false;
  }
  return x >= low && x <= high;
}

Bounds critical_bounds(const std::size_t index) noexcept {
  switch (index) {
    case model::kVitalHr:
      return {20.0, 300.0};
    case model::kVitalRr:
      return {0.0, 60.0};
    case model::kVitalSbp:
      return {40.0, 300.0};
    case model::kVitalDbp:
      return {20.0, 200.0};
    case model::kVitalTemp:
      return {30.0, 45.0};
    case model::kVitalSpo2:
      return {0.0, 100.0};
    case model::kVitalGcs:
      return {3.0, 15.0};
    default:
      return {};
  }
}

bool within_critical_bounds(const std::size_t index, const double value) noexcept {
  const Bounds bounds = critical_bounds(index);
  return value >= bounds.min && value <= bounds.max;
}

}  // namespace triage::core

#pragma once

#include <algorithm>
#include <cmath>

namespace triage::core {

inline constexpr double clamp01(const double value) noexcept {
  return std::clamp(value, 0.0, 1.0);
}

inline double finite_or_zero(const double value) noexcept {
  return std::isfinite(value) ? value : 0.0;
}

}  // namespace triage::core

#include "score/acuity.hpp"

#include "core/math.hpp"

namespace triage::score {

double vital_component(const model::vitals& v, const core::WeightVector& weights,
                       const core::ReferenceRanges& ranges) noexcept {
  const model::vital_values raw_values = model::values(v);
  double weighted_sum = 0.0;
  double weight_sum = 0.0;

  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    if (!model::present(raw_values[i], i)) {
      continue;
    }
    const core::ReferenceRange range = ranges.at(i);
    if (range.half_width <= 0.0) {
      continue;
    }
    weighted_sum += weights[i] * core::deviation(raw_values[i], range.mid, range.half_width);
    weight_sum += weights[i];
  }

  if (weight_sum <= 0.0) {
    return 0.0;
  }
  return core::clamp01(core::finite_or_zero(weighted_sum / weight_sum));
}

double resource_component(const int resource_count, const int max_resources, const double resource_weight) noexcept {
  if (max_resources <= 0 || !(resource_weight > 0.0) || resource_count <= 0) {
    return 0.0;
  }
  double ratio = static_cast<double>(resource_count) / static_cast<double>(max_resources);
  if (ratio > 1.0) {
    ratio = 1.0;
  }
  return resource_weight * ratio;
}

double normalize(const double raw, const double divisor) noexcept {
  if (!(divisor > 0.0)) {
    return 0.0;
  }
  return core::clamp01(core::finite_or_zero(raw / divisor));
}

ScoreBreakdown score_breakdown(const model::vitals& v, const int resource_count, const core::Params& params,
                               const core::ReferenceRanges& ranges) noexcept {
  ScoreBreakdown out{};
  out.vital_component = vital_component(v, params.vital_weights, ranges);
  out.resource_component = resource_component(resource_count, params.max_resources, params.resource_weight);
  out.raw = out.vital_component + out.resource_component;
  out.divisor = params.divisor();
  out.score = normalize(out.raw, out.divisor);
  return out;
}

double acuity(const model::vitals& v, const int resource_count, const core::Params& params,
              const core::ReferenceRanges& ranges) noexcept {
  return score_breakdown(v, resource_count, params, ranges).score;
}

}  // namespace triage::score

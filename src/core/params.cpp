#include "core/params.hpp"

#include <cmath>

#include "validate/input_checks.hpp"

namespace triage::core {

namespace {

constexpr WeightVector kDefaultWeights = {0.18, 0.22, 0.16, 0.10, 0.08, 0.16, 0.10};

}  // namespace

bool Params::validate() const noexcept {
  if (max_resources < 0 || !(resource_weight >= 0.0)) {
    return false;
  }
  for (const double w : vital_weights) {
    if (!(w >= 0.0 && w <= 1.0)) {
      return false;
    }
  }
  return t1 > t2 && t2 > t3 && t3 > t4 && t4 > 0.0 && t1 <= 1.0;
}

double Params::weight_sum() const noexcept {
  double sum = 0.0;
  for (const double w : vital_weights) {
    sum += w;
  }
  return sum;
}

double Params::divisor() const noexcept {
  return weight_sum() + resource_weight;
}

void Params::set_thresholds(const double new_t1, const double new_t2, const double new_t3, const double new_t4) noexcept {
  t1 = new_t1;
  t2 = new_t2;
  t3 = new_t3;
  t4 = new_t4;
}

void Params::set_all_thresholds(const std::vector<double>& values) noexcept {
  if (values.size() != 4) {
    return;
  }
  set_thresholds(values[0], values[1], values[2], values[3]);
}

void Params::set_vital_weight(const std::size_t index, const double weight) noexcept {
  if (index >= vital_weights.size()) {
    return;
  }
  vital_weights[index] = weight;
}

LevelBand Params::threshold_for_level(const model::triage_level level) const noexcept {
  switch (level) {
    case model::triage_level::RESUSCITATION:
      return {t1, 1.0};
    case model::triage_level::EMERGENT:
      return {t2, t1};
    case model::triage_level::URGENT:
      return {t3, t2};
    case model::triage_level::LESS_URGENT:
      return {t4, t3};
    case model::triage_level::NON_URGENT:
      return {0.0, t4};
  }
  return {};
}

double Params::score_to_level_continuous(const double score) const noexcept {
  if (score >= t1) {
    return 1.0 + (1.0 - score) / (1.0 - t1) * 0.5;
  }
  if (score >= t2) {
    return 1.5 + (t1 - score) / (t1 - t2) * 0.5;
  }
  if (score >= t3) {
    return 2.0 + (t2 - score) / (t2 - t3) * 0.5;
  }
  if (score >= t4) {
    return 2.5 + (t3 - score) / (t3 - t4) * 0.5;
  }
  return 3.0 + (t4 - score) / t4 * 2.0;
}

void Params::scale_weights(const double factor) noexcept {
  if (factor <= 0.0) {
    return;
  }
  double max_weight = 0.0;
  for (double& w : vital_weights) {
    w *= factor;
    if (w > max_weight) {
      max_weight = w;
    }
  }
  if (max_weight <= 0.0) {
    return;
  }
  for (double& w : vital_weights) {
    w /= max_weight;
  }
}

void Params::normalize_weights() noexcept {
  const double sum = weight_sum();
  if (sum <= 0.0) {
    return;
  }
  for (double& w : vital_weights) {
    w /= sum;
  }
}

void Params::uniform_weights() noexcept {
  vital_weights.fill(1.0 / static_cast<double>(model::kNumVitals));
}

void Params::geometric_thresholds(const double min, const double max) noexcept {
  if (min <= 0.0 || max <= min || max > 1.0) {
    return;
  }
  const double log_min = std::log(min);
  const double step = (std::log(max) - log_min) / 5.0;
  t4 = std::exp(log_min + step);
  t3 = std::exp(log_min + 2.0 * step);
  t2 = std::exp(log_min + 3.0 * step);
  t1 = std::exp(log_min + 4.0 * step);
  if (t1 > 1.0) {
    t1 = 1.0;
  }
}

bool Params::is_stricter_than(const Params& other) const noexcept {
  return t1 < other.t1 && t2 < other.t2 && t3 < other.t3 && t4 < other.t4;
}

Params default_params() noexcept {
  return Params{
      .vital_weights = kDefaultWeights,
      .max_resources = 6,
      .resource_weight = 0.25,
      .t1 = 0.85,
      .t2 = 0.60,
      .t3 = 0.35,
      .t4 = 0.15,
  };
}

Params preset_strict() noexcept {
  Params params = default_params();
  params.set_thresholds(0.80, 0.55, 0.30, 0.12);
  return params;
}

Params preset_lenient() noexcept {
  Params params = default_params();
  params.set_thresholds(0.90, 0.68, 0.42, 0.18);
  return params;
}

Params preset_research() noexcept {
  Params params = default_params();
  params.set_thresholds(0.80, 0.60, 0.40, 0.20);
  return params;
}

std::optional<Params> preset_by_name(const std::string& name) {
  if (name == "default") {
    return default_params();
  }
  if (name == "strict") {
    return preset_strict();
  }
  if (name == "lenient") {
    return preset_lenient();
  }
  if (name == "research") {
    return preset_research();
  }
  return std::nullopt;
}

bool validate_params_external(const Params& params) noexcept {
  const validate::ParamsDescription description{
      .vital_weights = params.vital_weights,
      .max_resources = params.max_resources,
      .resource_weight = params.resource_weight,
      .t1 = params.t1,
      .t2 = params.t2,
      .t3 = params.t3,
      .t4 = params.t4,
  };
  return validate::params_valid(description);
}

model::triage_level from_score(const double score, const Params& params) noexcept {
  if (score >= params.t1) {
    return model::triage_level::RESUSCITATION;
  }
  if (score >= params.t2) {
    return model::triage_level::EMERGENT;
  }
  if (score >= params.t3) {
    return model::triage_level::URGENT;
  }
  if (score >= params.t4) {
    return model::triage_level::LESS_URGENT;
  }
  return model::triage_level::NON_URGENT;
}

}  // namespace triage::core

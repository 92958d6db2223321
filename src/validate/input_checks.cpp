#include "validate/input_checks.hpp"

#include <cmath>

#include "core/ranges.hpp"

namespace triage::validate {

namespace {

vital_status check_field(const double value, const std::size_t index, bool& valid) {
  if (value == 0.0) {
    return vital_status::MISSING;
  }
  if (!core::within_critical_bounds(index, value)) {
    valid = false;
    return vital_status::INVALID;
  }
  return vital_status::OK;
}

int clamp_int(const int value, const std::size_t index) {
  if (value == 0) {
    return value;
  }
  const core::Bounds bounds = core::critical_bounds(index);
  return static_cast<int>(core::clamp_to_range(static_cast<double>(value), bounds.min, bounds.max));
}

double clamp_double(const double value, const std::size_t index) {
  if (value == 0.0) {
    return value;
  }
  const core::Bounds bounds = core::critical_bounds(index);
  return core::clamp_to_range(value, bounds.min, bounds.max);
}

}  // namespace

const char* status_name(const vital_status status) noexcept {
  switch (status) {
    case vital_status::OK:
      return "ok";
    case vital_status::CLAMPED:
      return "clamped";
    case vital_status::INVALID:
      return "invalid";
    case vital_status::MISSING:
      return "missing";
  }
  return "unknown";
}

VitalsReport validate_vitals(const model::vitals& v) noexcept {
  VitalsReport report{};
  report.clamped = clamp_vitals(v);
  const model::vital_values raw = model::values(v);
  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    report.status[i] = check_field(raw[i], i, report.valid);
  }
  return report;
}

model::vitals clamp_vitals(const model::vitals& v) noexcept {
  return model::vitals{
      .hr = clamp_int(v.hr, model::kVitalHr),
      .rr = clamp_int(v.rr, model::kVitalRr),
      .sbp = clamp_int(v.sbp, model::kVitalSbp),
      .dbp = clamp_int(v.dbp, model::kVitalDbp),
      .temp = clamp_double(v.temp, model::kVitalTemp),
      .spo2 = clamp_int(v.spo2, model::kVitalSpo2),
      .gcs = clamp_int(v.gcs, model::kVitalGcs),
  };
}

bool vitals_valid(const model::vitals& v) noexcept {
  return validate_vitals(v).valid;
}

int clamp_resource_count(const int count, const int max_resources) noexcept {
  if (max_resources <= 0 || count < 0) {
    return 0;
  }
  if (count > max_resources) {
    return max_resources;
  }
  return count;
}

bool vitals_and_resources_valid(const model::vitals& v, const int resource_count, const int max_resources) noexcept {
  if (!vitals_valid(v)) {
    return false;
  }
  if (max_resources <= 0) {
    return resource_count == 0;
  }
  return resource_count >= 0 && resource_count <= max_resources;
}

SanitizedVitals sanitize_vitals(const model::vitals& v) noexcept {
  const VitalsReport report = validate_vitals(v);
  SanitizedVitals out{v, false, report.status};
  if (report.valid) {
    return out;
  }
  out.vitals = report.clamped;
  out.clamped = true;
  for (auto& status : out.status) {
    if (status == vital_status::INVALID) {
      status = vital_status::CLAMPED;
    }
  }
  return out;
}

bool at_least_one_vital(const model::vitals& v) noexcept {
  return model::present_count(v) > 0;
}

ParamsReport validate_params(const ParamsDescription& params) noexcept {
  ParamsReport report{};

  report.weights_ok = true;
  for (const double w : params.vital_weights) {
    if (!std::isfinite(w) || w < 0.0 || w > 1.0) {
      report.weights_ok = false;
      break;
    }
  }

  report.max_resources_ok = params.max_resources >= 0;
  report.resource_weight_ok = std::isfinite(params.resource_weight) && params.resource_weight >= 0.0;
  report.thresholds_ok = params.t1 > params.t2 && params.t2 > params.t3 && params.t3 > params.t4 &&
                         params.t4 > 0.0 && params.t1 <= 1.0;

  report.valid = report.weights_ok && report.max_resources_ok && report.resource_weight_ok && report.thresholds_ok;
  return report;
}

bool params_valid(const ParamsDescription& params) noexcept {
  return validate_params(params).valid;
}

}  // namespace triage::validate

#pragma once

#include <array>
#include <cstdint>

#include "model/vitals.hpp"

namespace triage::validate {

enum class vital_status : std::uint8_t {
  OK = 0,
  CLAMPED = 1,
  INVALID = 2,
  MISSING = 3,
};

const char* status_name(vital_status status) noexcept;

struct VitalsReport {
  bool valid{true};
  std::array<vital_status, model::kNumVitals> status{};
  // v with every INVALID field forced into bounds.
  model::vitals clamped{};
};

// Classifies each field against the critical bounds without modifying v.
VitalsReport validate_vitals(const model::vitals& v) noexcept;

// Forces present values into bounds; missing (zero) values stay zero.
model::vitals clamp_vitals(const model::vitals& v) noexcept;

bool vitals_valid(const model::vitals& v) noexcept;

// Clamps to [0, max_resources]; 0 when max_resources <= 0.
int clamp_resource_count(int count, int max_resources) noexcept;

bool vitals_and_resources_valid(const model::vitals& v, int resource_count, int max_resources) noexcept;

struct SanitizedVitals {
  model::vitals vitals{};
  bool clamped{false};
  // Fields that were out of bounds are reported as CLAMPED.
  std::array<vital_status, model::kNumVitals> status{};
};

SanitizedVitals sanitize_vitals(const model::vitals& v) noexcept;

bool at_least_one_vital(const model::vitals& v) noexcept;

// Mirrors core::Params field for field so the checks below can be shared
// without this module depending on the scoring engine.
struct ParamsDescription {
  std::array<double, model::kNumVitals> vital_weights{};
  int max_resources{0};
  double resource_weight{0.0};
  double t1{0.0};
  double t2{0.0};
  double t3{0.0};
  double t4{0.0};
};

struct ParamsReport {
  bool valid{false};
  bool weights_ok{false};
  bool thresholds_ok{false};
  bool max_resources_ok{false};
  bool resource_weight_ok{false};
};

ParamsReport validate_params(const ParamsDescription& params) noexcept;
bool params_valid(const ParamsDescription& params) noexcept;

}  // namespace triage::validate

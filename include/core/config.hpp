#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/params.hpp"
#include "core/ranges.hpp"
#include "model/vitals.hpp"

namespace triage::core {

enum class output_format : std::uint8_t {
  CSV = 0,
  JSON = 1,
  NONE = 2,
};

// Values read from the scorer YAML file. Weight, threshold, resource and
// range entries are overrides applied on top of the chosen preset and
// population; unset entries keep the preset value.
struct ScorerConfig {
  std::string preset{"default"};
  std::string population{"adult"};
  std::array<std::optional<double>, model::kNumVitals> weight_overrides{};
  std::array<std::optional<double>, 4> threshold_overrides{};
  std::optional<int> max_resources{};
  std::optional<double> resource_weight{};
  std::array<std::optional<ReferenceRange>, model::kNumVitals> range_overrides{};
  bool clamp_input{true};
  std::size_t batch_workers{1};
  output_format output{output_format::CSV};
  bool debug_records{false};
};

// Throws std::runtime_error naming the offending key.
ScorerConfig load_scorer_config(const std::string& path);

// Preset plus overrides; throws std::runtime_error when the preset is unknown
// or the resulting set fails validation.
Params build_params(const ScorerConfig& config);

// Population ranges plus overrides; throws std::runtime_error when the
// population is unknown.
ReferenceRanges build_ranges(const ScorerConfig& config);

const char* output_format_name(output_format format) noexcept;

}  // namespace triage::core

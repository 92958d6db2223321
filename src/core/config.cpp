#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace triage::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string to_lower(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = to_lower(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  if (consumed != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a number, got '" + value + "'");
  }
  return parsed;
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

std::optional<std::size_t> vital_index(const std::string& name) {
  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    if (name == model::vital_name(i)) {
      return i;
    }
  }
  return std::nullopt;
}

std::size_t require_vital(const std::string& key, const std::string& name) {
  const auto index = vital_index(name);
  if (!index.has_value()) {
    throw std::runtime_error(key + ": unknown vital '" + name + "'");
  }
  return *index;
}

ReferenceRange parse_range(const std::string& key, const std::string& value) {
  const auto comma = value.find(',');
  if (comma == std::string::npos) {
    throw std::runtime_error(key + " must be 'mid,half_width'");
  }
  ReferenceRange range{};
  range.mid = parse_double(key, trim(value.substr(0, comma)));
  range.half_width = parse_double(key, trim(value.substr(comma + 1)));
  if (range.half_width < 0.0) {
    throw std::runtime_error(key + " half_width must be greater than or equal to 0");
  }
  return range;
}

void apply_key_value(ScorerConfig& config, const std::string& key, const std::string& value) {
  if (key == "preset") {
    const std::string name = to_lower(value);
    if (!preset_by_name(name).has_value()) {
      throw std::runtime_error("preset must be one of default, strict, lenient, research");
    }
    config.preset = name;
    return;
  }

  if (key == "population") {
    const std::string name = to_lower(value);
    if (name != "adult" && name != "pediatric") {
      throw std::runtime_error("population must be adult or pediatric");
    }
    config.population = name;
    return;
  }

  if (key.rfind("weights.", 0) == 0) {
    const std::size_t index = require_vital(key, key.substr(std::string("weights.").size()));
    const double weight = parse_double(key, value);
    if (weight < 0.0 || weight > 1.0) {
      throw std::runtime_error(key + " must be in range 0..1");
    }
    config.weight_overrides[index] = weight;
    return;
  }

  if (key.rfind("thresholds.", 0) == 0) {
    const std::string name = key.substr(std::string("thresholds.").size());
    if (name.size() != 2 || name[0] != 't' || name[1] < '1' || name[1] > '4') {
      throw std::runtime_error(key + ": expected one of t1, t2, t3, t4");
    }
    const double threshold = parse_double(key, value);
    if (threshold <= 0.0 || threshold > 1.0) {
      throw std::runtime_error(key + " must be in range (0, 1]");
    }
    config.threshold_overrides[static_cast<std::size_t>(name[1] - '1')] = threshold;
    return;
  }

  if (key == "resources.max") {
    const auto parsed = parse_integer(key, value);
    if (parsed < 0 || parsed > 1000) {
      throw std::runtime_error("resources.max must be in range 0..1000");
    }
    config.max_resources = static_cast<int>(parsed);
    return;
  }

  if (key == "resources.weight") {
    const double weight = parse_double(key, value);
    if (weight < 0.0) {
      throw std::runtime_error("resources.weight must be greater than or equal to 0");
    }
    config.resource_weight = weight;
    return;
  }

  if (key.rfind("ranges.", 0) == 0) {
    const std::size_t index = require_vital(key, key.substr(std::string("ranges.").size()));
    config.range_overrides[index] = parse_range(key, value);
    return;
  }

  if (key == "input.clamp") {
    config.clamp_input = parse_bool(value);
    return;
  }

  if (key == "batch.workers") {
    const auto parsed = parse_integer(key, value);
    if (parsed <= 0 || parsed > 256) {
      throw std::runtime_error("batch.workers must be in range 1..256");
    }
    config.batch_workers = static_cast<std::size_t>(parsed);
    return;
  }

  if (key == "output.format") {
    const std::string name = to_lower(value);
    if (name == "csv") {
      config.output = output_format::CSV;
    } else if (name == "json") {
      config.output = output_format::JSON;
    } else if (name == "none") {
      config.output = output_format::NONE;
    } else {
      throw std::runtime_error("output.format must be csv, json or none");
    }
    return;
  }

  if (key == "output.debug") {
    config.debug_records = parse_bool(value);
  }
}

}  // namespace

ScorerConfig load_scorer_config(const std::string& path) {
  ScorerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

Params build_params(const ScorerConfig& config) {
  const auto preset = preset_by_name(config.preset);
  if (!preset.has_value()) {
    throw std::runtime_error("unknown preset: " + config.preset);
  }

  Params params = *preset;
  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    if (config.weight_overrides[i].has_value()) {
      params.set_vital_weight(i, *config.weight_overrides[i]);
    }
  }

  std::array<double, 4> thresholds = params.thresholds();
  for (std::size_t i = 0; i < thresholds.size(); ++i) {
    if (config.threshold_overrides[i].has_value()) {
      thresholds[i] = *config.threshold_overrides[i];
    }
  }
  params.set_thresholds(thresholds[0], thresholds[1], thresholds[2], thresholds[3]);

  if (config.max_resources.has_value()) {
    params.max_resources = *config.max_resources;
  }
  if (config.resource_weight.has_value()) {
    params.resource_weight = *config.resource_weight;
  }

  if (!params.validate()) {
    throw std::runtime_error("parameter set is invalid: thresholds must satisfy t1 > t2 > t3 > t4 > 0");
  }
  return params;
}

ReferenceRanges build_ranges(const ScorerConfig& config) {
  ReferenceRanges ranges;
  if (config.population == "adult") {
    ranges = adult_ranges();
  } else if (config.population == "pediatric") {
    ranges = pediatric_ranges();
  } else {
    throw std::runtime_error("unknown population: " + config.population);
  }

  for (std::size_t i = 0; i < model::kNumVitals; ++i) {
    if (config.range_overrides[i].has_value()) {
      ranges.set(i, config.range_overrides[i]->mid, config.range_overrides[i]->half_width);
    }
  }
  return ranges;
}

const char* output_format_name(const output_format format) noexcept {
  switch (format) {
    case output_format::CSV:
      return "csv";
    case output_format::JSON:
      return "json";
    case output_format::NONE:
      return "none";
  }
  return "unknown";
}

}  // namespace triage::core

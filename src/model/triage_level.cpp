#include "model/triage_level.hpp"

#include <cctype>

namespace triage::model {

namespace {

std::string to_lower(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

}  // namespace

const char* label(const triage_level level) noexcept {
  switch (level) {
    case triage_level::RESUSCITATION:
      return "Resuscitation";
    case triage_level::EMERGENT:
      return "Emergent";
    case triage_level::URGENT:
      return "Urgent";
    case triage_level::LESS_URGENT:
      return "Less urgent";
    case triage_level::NON_URGENT:
      return "Non-urgent";
  }
  return "Unknown";
}

const char* short_code(const triage_level level) noexcept {
  switch (level) {
    case triage_level::RESUSCITATION:
      return "R";
    case triage_level::EMERGENT:
      return "E";
    case triage_level::URGENT:
      return "U";
    case triage_level::LESS_URGENT:
      return "L";
    case triage_level::NON_URGENT:
      return "N";
  }
  return "?";
}

const char* description(const triage_level level) noexcept {
  switch (level) {
    case triage_level::RESUSCITATION:
      return "Requires immediate life-saving intervention; do not delay.";
    case triage_level::EMERGENT:
      return "High risk; should be seen within 15 minutes.";
    case triage_level::URGENT:
      return "Urgent but stable; target within 60 minutes.";
    case triage_level::LESS_URGENT:
      return "Less urgent; target within 120 minutes.";
    case triage_level::NON_URGENT:
      return "Non-urgent; target within 240 minutes.";
  }
  return "Unknown level.";
}

// Guidance only; institutional protocols take precedence.
int wait_time_minutes(const triage_level level) noexcept {
  switch (level) {
    case triage_level::RESUSCITATION:
      return 0;
    case triage_level::EMERGENT:
      return 15;
    case triage_level::URGENT:
      return 60;
    case triage_level::LESS_URGENT:
      return 120;
    case triage_level::NON_URGENT:
      return 240;
  }
  return 240;
}

std::vector<std::string> recommended_actions(const triage_level level) {
  switch (level) {
    case triage_level::RESUSCITATION:
      return {"Immediate assessment", "Life-saving interventions as indicated", "Continuous monitoring"};
    case triage_level::EMERGENT:
      return {"Rapid assessment", "Stabilisation", "Re-evaluate within 15 min"};
    case triage_level::URGENT:
      return {"Assessment within 60 min", "Routine monitoring", "Re-evaluate as needed"};
    case triage_level::LESS_URGENT:
      return {"Assessment within 120 min", "Routine care", "Re-evaluate if condition changes"};
    case triage_level::NON_URGENT:
      return {"Assessment within 240 min", "Routine care", "May use fast-track if available"};
  }
  return {};
}

std::optional<triage_level> level_from_int(const int value) noexcept {
  if (value < 1 || value > 5) {
    return std::nullopt;
  }
  return static_cast<triage_level>(value);
}

std::optional<triage_level> parse_level(std::string_view text) {
  const std::string lower = to_lower(text);
  for (const auto level : kAllLevels) {
    if (lower == std::to_string(level_number(level)) || lower == to_lower(label(level)) ||
        lower == to_lower(short_code(level))) {
      return level;
    }
  }
  return std::nullopt;
}

level_counts_t level_counts(const std::vector<triage_level>& levels) noexcept {
  level_counts_t counts{};
  for (const auto level : levels) {
    const int n = level_number(level);
    if (n >= 1 && n <= 5) {
      ++counts[static_cast<std::size_t>(n)];
    }
  }
  return counts;
}

level_proportions_t level_proportions(const std::vector<triage_level>& levels) noexcept {
  level_proportions_t proportions{};
  const level_counts_t counts = level_counts(levels);
  std::size_t total = 0;
  for (std::size_t i = 1; i <= 5; ++i) {
    total += counts[i];
  }
  if (total == 0) {
    return proportions;
  }
  for (std::size_t i = 1; i <= 5; ++i) {
    proportions[i] = static_cast<double>(counts[i]) / static_cast<double>(total);
  }
  return proportions;
}

}  // namespace triage::model

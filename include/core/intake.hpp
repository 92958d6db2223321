#pragma once

#include <istream>
#include <string>
#include <vector>

#include "model/vitals.hpp"

namespace triage::core {

struct IntakeRow {
  std::string id{};
  model::vitals vitals{};
  int resource_count{0};
};

// Column order of an intake file. The header line is optional.
inline constexpr const char* kIntakeColumns[] = {"id", "hr", "rr", "sbp", "dbp", "temp", "spo2", "gcs",
                                                 "resource_count"};

// Splits one CSV line, honouring double-quoted fields with "" escapes.
std::vector<std::string> split_csv_line(const std::string& line);

// Empty vital fields read as 0 (not measured). Blank lines and lines starting
// with '#' are skipped. Throws std::runtime_error naming the line number on a
// wrong column count or unparsable number.
std::vector<IntakeRow> read_intake(std::istream& input);
std::vector<IntakeRow> read_intake_file(const std::string& path);

}  // namespace triage::core

#include "core/intake.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace triage::core {
namespace {

constexpr std::size_t kColumnCount = std::size(kIntakeColumns);

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string line_error(const std::size_t line_number, const std::string& message) {
  return "intake line " + std::to_string(line_number) + ": " + message;
}

int parse_int_field(const std::string& field, const char* column, const std::size_t line_number) {
  if (field.empty()) {
    return 0;
  }
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(field, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(line_error(line_number, std::string(column) + " is not an integer: '" + field + "'"));
  }
  if (consumed != field.size()) {
    throw std::runtime_error(line_error(line_number, std::string(column) + " is not an integer: '" + field + "'"));
  }
  return parsed;
}

double parse_double_field(const std::string& field, const char* column, const std::size_t line_number) {
  if (field.empty()) {
    return 0.0;
  }
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(field, &consumed);
  } catch (const std::logic_error&) {
    throw std::runtime_error(line_error(line_number, std::string(column) + " is not a number: '" + field + "'"));
  }
  if (consumed != field.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(line_error(line_number, std::string(column) + " is not a number: '" + field + "'"));
  }
  return parsed;
}

bool is_header(const std::vector<std::string>& fields) {
  return !fields.empty() && fields.front() == kIntakeColumns[0];
}

}  // namespace

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string current;
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quoted) {
      if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
        current.push_back('"');
        ++i;
      } else if (c == '"') {
        quoted = false;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.push_back(trim(current));
      current.clear();
    } else if (c != '\r') {
      current.push_back(c);
    }
  }
  fields.push_back(trim(current));
  return fields;
}

std::vector<IntakeRow> read_intake(std::istream& input) {
  std::vector<IntakeRow> rows;
  std::string line;
  std::size_t line_number = 0;
  bool first_content_line = true;

  while (std::getline(input, line)) {
    ++line_number;
    const std::string stripped = trim(line);
    if (stripped.empty() || stripped.front() == '#') {
      continue;
    }

    const std::vector<std::string> fields = split_csv_line(stripped);
    if (first_content_line) {
      first_content_line = false;
      if (is_header(fields)) {
        continue;
      }
    }

    if (fields.size() != kColumnCount) {
      throw std::runtime_error(line_error(line_number, "expected " + std::to_string(kColumnCount) + " columns, got " +
                                                           std::to_string(fields.size())));
    }

    IntakeRow row{};
    row.id = fields[0];
    row.vitals.hr = parse_int_field(fields[1], kIntakeColumns[1], line_number);
    row.vitals.rr = parse_int_field(fields[2], kIntakeColumns[2], line_number);
    row.vitals.sbp = parse_int_field(fields[3], kIntakeColumns[3], line_number);
    row.vitals.dbp = parse_int_field(fields[4], kIntakeColumns[4], line_number);
    row.vitals.temp = parse_double_field(fields[5], kIntakeColumns[5], line_number);
    row.vitals.spo2 = parse_int_field(fields[6], kIntakeColumns[6], line_number);
    row.vitals.gcs = parse_int_field(fields[7], kIntakeColumns[7], line_number);
    row.resource_count = parse_int_field(fields[8], kIntakeColumns[8], line_number);
    rows.push_back(std::move(row));
  }

  return rows;
}

std::vector<IntakeRow> read_intake_file(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open intake file: " + path);
  }
  return read_intake(input);
}

}  // namespace triage::core

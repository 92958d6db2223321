#include "sinks/result_record.hpp"

#include <algorithm>
#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace triage::sinks {
namespace {

int require_int(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number_integer()) {
    throw std::invalid_argument(std::string(key) + " must be an integer");
  }
  return it->get<int>();
}

double require_number(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    throw std::invalid_argument(std::string(key) + " must be a number");
  }
  return it->get<double>();
}

std::string optional_string(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw std::invalid_argument(std::string(key) + " must be a string");
  }
  return it->get<std::string>();
}

std::string format_fixed(const double value, const int precision) {
  const int length = std::snprintf(nullptr, 0, "%.*f", precision, value);
  if (length < 0) {
    return {};
  }
  std::string out(static_cast<std::size_t>(length) + 1, '\0');
  std::snprintf(out.data(), out.size(), "%.*f", precision, value);
  out.resize(static_cast<std::size_t>(length));
  return out;
}

bool needs_quoting(const std::string& field) {
  return field.find_first_of(",\"\r\n") != std::string::npos;
}

}  // namespace

ResultRecord make_record(const model::vitals& v, const int resource_count, const score::Evaluation& evaluation,
                         std::string id, std::string timestamp) {
  return ResultRecord{
      .hr = v.hr,
      .rr = v.rr,
      .sbp = v.sbp,
      .dbp = v.dbp,
      .temp = v.temp,
      .spo2 = v.spo2,
      .gcs = v.gcs,
      .resource_count = resource_count,
      .acuity = evaluation.acuity,
      .level = model::level_number(evaluation.level),
      .level_label = model::label(evaluation.level),
      .timestamp = std::move(timestamp),
      .id = std::move(id),
  };
}

model::vitals record_to_vitals(const ResultRecord& record) noexcept {
  return model::vitals{
      .hr = record.hr,
      .rr = record.rr,
      .sbp = record.sbp,
      .dbp = record.dbp,
      .temp = record.temp,
      .spo2 = record.spo2,
      .gcs = record.gcs,
  };
}

std::string format_number(const double value) {
  char buffer[64];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::fixed);
  if (result.ec != std::errc()) {
    // Magnitudes too wide for plain notation; shortest general form always fits.
    result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::general);
  }
  return std::string(buffer, result.ptr);
}

nlohmann::json record_to_json(const ResultRecord& record) {
  nlohmann::json object{{"hr", record.hr},
                        {"rr", record.rr},
                        {"sbp", record.sbp},
                        {"dbp", record.dbp},
                        {"temp", record.temp},
                        {"spo2", record.spo2},
                        {"gcs", record.gcs},
                        {"resource_count", record.resource_count},
                        {"acuity", record.acuity},
                        {"level", record.level},
                        {"level_label", record.level_label}};
  if (!record.timestamp.empty()) {
    object["timestamp"] = record.timestamp;
  }
  if (!record.id.empty()) {
    object["id"] = record.id;
  }
  return object;
}

ResultRecord record_from_json(const nlohmann::json& object) {
  if (!object.is_object()) {
    throw std::invalid_argument("result record must be a JSON object");
  }

  ResultRecord record{
      .hr = require_int(object, "hr"),
      .rr = require_int(object, "rr"),
      .sbp = require_int(object, "sbp"),
      .dbp = require_int(object, "dbp"),
      .temp = require_number(object, "temp"),
      .spo2 = require_int(object, "spo2"),
      .gcs = require_int(object, "gcs"),
      .resource_count = require_int(object, "resource_count"),
      .acuity = require_number(object, "acuity"),
      .level = require_int(object, "level"),
      .level_label = optional_string(object, "level_label"),
      .timestamp = optional_string(object, "timestamp"),
      .id = optional_string(object, "id"),
  };
  if (record.level_label.empty()) {
    if (const auto level = model::level_from_int(record.level)) {
      record.level_label = model::label(*level);
    }
  }
  return record;
}

const std::vector<std::string>& csv_header() {
  static const std::vector<std::string> kHeader = {
      "hr",    "rr",    "sbp",         "dbp",       "temp", "spo2", "gcs", "resource_count",
      "acuity", "level", "level_label", "timestamp", "id",
  };
  return kHeader;
}

std::vector<std::string> csv_row(const ResultRecord& record) {
  return {
      std::to_string(record.hr),
      std::to_string(record.rr),
      std::to_string(record.sbp),
      std::to_string(record.dbp),
      format_number(record.temp),
      std::to_string(record.spo2),
      std::to_string(record.gcs),
      std::to_string(record.resource_count),
      format_number(record.acuity),
      std::to_string(record.level),
      record.level_label,
      record.timestamp,
      record.id,
  };
}

void write_csv_line(std::ostream& out, const std::vector<std::string>& fields) {
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i != 0) {
      out << ',';
    }
    const std::string& field = fields[i];
    if (!needs_quoting(field)) {
      out << field;
      continue;
    }
    out << '"';
    for (const char c : field) {
      if (c == '"') {
        out << '"';
      }
      out << c;
    }
    out << '"';
  }
  out << '\n';
}

void write_csv(std::ostream& out, const std::vector<ResultRecord>& records) {
  write_csv_line(out, csv_header());
  for (const auto& record : records) {
    write_csv_line(out, csv_row(record));
  }
}

nlohmann::json batch_to_json(const ResultBatch& batch) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto& record : batch.results) {
    results.push_back(record_to_json(record));
  }
  nlohmann::json object{{"results", std::move(results)}, {"generated", batch.generated}};
  if (!batch.source.empty()) {
    object["source"] = batch.source;
  }
  return object;
}

ResultBatch batch_from_json(const nlohmann::json& object) {
  if (!object.is_object()) {
    throw std::invalid_argument("batch must be a JSON object");
  }
  const auto results_it = object.find("results");
  if (results_it == object.end() || !results_it->is_array()) {
    throw std::invalid_argument("results must be an array");
  }

  ResultBatch batch;
  batch.results.reserve(results_it->size());
  for (const auto& entry : *results_it) {
    batch.results.push_back(record_from_json(entry));
  }
  batch.generated = optional_string(object, "generated");
  batch.source = optional_string(object, "source");
  return batch;
}

std::vector<LevelReportRow> level_report(const std::vector<ResultRecord>& records) {
  std::array<std::size_t, 6> counts{};
  std::array<double, 6> sums{};
  std::array<double, 6> mins{};
  std::array<double, 6> maxs{};
  std::size_t total = 0;

  for (const auto& record : records) {
    if (record.level < 1 || record.level > 5) {
      continue;
    }
    const auto slot = static_cast<std::size_t>(record.level);
    if (counts[slot] == 0) {
      mins[slot] = record.acuity;
      maxs[slot] = record.acuity;
    } else {
      mins[slot] = std::min(mins[slot], record.acuity);
      maxs[slot] = std::max(maxs[slot], record.acuity);
    }
    ++counts[slot];
    sums[slot] += record.acuity;
    ++total;
  }

  std::vector<LevelReportRow> rows;
  rows.reserve(model::kAllLevels.size());
  for (const auto level : model::kAllLevels) {
    const auto slot = static_cast<std::size_t>(model::level_number(level));
    LevelReportRow row{};
    row.level = model::level_number(level);
    row.level_label = model::label(level);
    row.count = counts[slot];
    if (total > 0) {
      row.pct = static_cast<double>(counts[slot]) / static_cast<double>(total) * 100.0;
    }
    if (counts[slot] > 0) {
      row.mean_acuity = sums[slot] / static_cast<double>(counts[slot]);
      row.min_acuity = mins[slot];
      row.max_acuity = maxs[slot];
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

void write_level_report_csv(std::ostream& out, const std::vector<ResultRecord>& records) {
  write_csv_line(out, {"level", "level_label", "count", "pct", "mean_acuity", "min_acuity", "max_acuity"});
  for (const auto& row : level_report(records)) {
    write_csv_line(out, {std::to_string(row.level), row.level_label, std::to_string(row.count),
                         format_fixed(row.pct, 2), format_fixed(row.mean_acuity, 4), format_fixed(row.min_acuity, 4),
                         format_fixed(row.max_acuity, 4)});
  }
}

Summary compute_summary(const std::vector<ResultRecord>& records) noexcept {
  Summary summary{};
  if (records.empty()) {
    return summary;
  }
  summary.n = records.size();
  summary.min_acuity = records.front().acuity;
  summary.max_acuity = records.front().acuity;
  double sum = 0.0;
  for (const auto& record : records) {
    sum += record.acuity;
    summary.min_acuity = std::min(summary.min_acuity, record.acuity);
    summary.max_acuity = std::max(summary.max_acuity, record.acuity);
    if (record.level >= 1 && record.level <= 5) {
      ++summary.level_dist[static_cast<std::size_t>(record.level)];
    }
  }
  summary.mean_acuity = sum / static_cast<double>(summary.n);
  return summary;
}

nlohmann::json summary_to_json(const Summary& summary) {
  return nlohmann::json{{"n", summary.n},
                        {"mean_acuity", summary.mean_acuity},
                        {"min_acuity", summary.min_acuity},
                        {"max_acuity", summary.max_acuity},
                        {"level_dist", summary.level_dist}};
}

}  // namespace triage::sinks

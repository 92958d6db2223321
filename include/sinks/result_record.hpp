#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/vitals.hpp"
#include "score/engine.hpp"

namespace triage::sinks {

// Flat export row for one scored encounter. Empty timestamp/id mean unset.
struct ResultRecord {
  int hr{0};
  int rr{0};
  int sbp{0};
  int dbp{0};
  double temp{0.0};
  int spo2{0};
  int gcs{0};
  int resource_count{0};
  double acuity{0.0};
  int level{0};
  std::string level_label{};
  std::string timestamp{};
  std::string id{};
};

ResultRecord make_record(const model::vitals& v, int resource_count, const score::Evaluation& evaluation,
                         std::string id = {}, std::string timestamp = {});
model::vitals record_to_vitals(const ResultRecord& record) noexcept;

// Shortest fixed-notation rendering that round-trips, e.g. 37.5 or 0.7625.
// Magnitudes too wide for fixed notation use exponent form, e.g. 1e+300.
std::string format_number(double value);

// timestamp and id are left out of the object when unset.
nlohmann::json record_to_json(const ResultRecord& record);
// Throws std::invalid_argument when a required field is missing or has the wrong type.
ResultRecord record_from_json(const nlohmann::json& object);

const std::vector<std::string>& csv_header();
std::vector<std::string> csv_row(const ResultRecord& record);
// RFC 4180: fields containing a comma, quote or line break are quoted and
// embedded quotes doubled.
void write_csv_line(std::ostream& out, const std::vector<std::string>& fields);
void write_csv(std::ostream& out, const std::vector<ResultRecord>& records);

struct ResultBatch {
  std::vector<ResultRecord> results{};
  std::string generated{};
  std::string source{};
};

nlohmann::json batch_to_json(const ResultBatch& batch);
ResultBatch batch_from_json(const nlohmann::json& object);

struct LevelReportRow {
  int level{0};
  std::string level_label{};
  std::size_t count{0};
  double pct{0.0};
  double mean_acuity{0.0};
  double min_acuity{0.0};
  double max_acuity{0.0};
};

// One row per level 1..5; min/max are 0 for empty levels.
std::vector<LevelReportRow> level_report(const std::vector<ResultRecord>& records);
void write_level_report_csv(std::ostream& out, const std::vector<ResultRecord>& records);

struct Summary {
  std::size_t n{0};
  double mean_acuity{0.0};
  double min_acuity{0.0};
  double max_acuity{0.0};
  std::array<std::size_t, 6> level_dist{};
};

Summary compute_summary(const std::vector<ResultRecord>& records) noexcept;
nlohmann::json summary_to_json(const Summary& summary);

}  // namespace triage::sinks

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/intake.hpp"
#include "core/runner.hpp"
#include "model/triage_level.hpp"
#include "sinks/debug_log.hpp"
#include "sinks/result_record.hpp"

using triage::core::IntakeRow;
using triage::core::Runner;
using triage::core::ScorerConfig;
using triage::core::load_scorer_config;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::filesystem::path write_temp(const char* name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

bool config_throws(const char* name, const std::string& content) {
  const auto path = write_temp(name, content);
  bool threw = false;
  try {
    (void)load_scorer_config(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

std::vector<IntakeRow> sample_rows() {
  std::istringstream input(
      "id,hr,rr,sbp,dbp,temp,spo2,gcs,resource_count\n"
      "enc-1,120,24,90,,,92,,3\n"
      "enc-2,80,16,120,80,37.0,98,15,0\n"
      "enc-3,400,0,0,0,0,0,0,12\n");
  return triage::core::read_intake(input);
}

int test_config_parsing_full_file() {
  const auto path = write_temp("triage_scorer_full.yaml",
                               "# scorer settings\n"
                               "preset: strict\n"
                               "population: pediatric\n"
                               "weights:\n"
                               "  hr: 0.30   # heavier heart rate\n"
                               "thresholds:\n"
                               "  t4: 0.10\n"
                               "resources:\n"
                               "  max: 4\n"
                               "  weight: 0.5\n"
                               "ranges:\n"
                               "  temp: 37.5, 1.5\n"
                               "input:\n"
                               "  clamp: false\n"
                               "batch:\n"
                               "  workers: 4\n"
                               "output:\n"
                               "  format: json\n"
                               "  debug: yes\n"
                               "logging:\n"
                               "  level: info\n");
  const ScorerConfig config = load_scorer_config(path.string());
  std::filesystem::remove(path);

  if (config.preset != "strict" || config.population != "pediatric" || config.clamp_input ||
      config.batch_workers != 4 || config.output != triage::core::output_format::JSON || !config.debug_records) {
    return fail("test_config_parsing_full_file", "scalar settings mismatch");
  }

  const auto params = triage::core::build_params(config);
  if (params.vital_weights[triage::model::kVitalHr] != 0.30 || params.t1 != 0.80 || params.t4 != 0.10 ||
      params.max_resources != 4 || params.resource_weight != 0.5) {
    return fail("test_config_parsing_full_file", "preset overrides mismatch");
  }

  const auto ranges = triage::core::build_ranges(config);
  if (ranges.at(triage::model::kVitalHr).mid != 100.0 || ranges.at(triage::model::kVitalTemp).mid != 37.5 ||
      ranges.at(triage::model::kVitalTemp).half_width != 1.5) {
    return fail("test_config_parsing_full_file", "population ranges mismatch");
  }
  return 0;
}

int test_config_parsing_rejects_bad_input() {
  if (!config_throws("triage_bad_max.yaml", "resources:\n  max: 5000\n")) {
    return fail("test_config_parsing_rejects_bad_input", "resources.max above 1000 should throw");
  }
  if (!config_throws("triage_bad_weight.yaml", "weights:\n  rr: 1.7\n")) {
    return fail("test_config_parsing_rejects_bad_input", "weight above 1 should throw");
  }
  if (!config_throws("triage_bad_float.yaml", "thresholds:\n  t2: high\n")) {
    return fail("test_config_parsing_rejects_bad_input", "invalid float should throw");
  }
  if (!config_throws("triage_bad_vital.yaml", "weights:\n  pulse: 0.2\n")) {
    return fail("test_config_parsing_rejects_bad_input", "unknown vital should throw");
  }
  if (!config_throws("triage_bad_preset.yaml", "preset: aggressive\n")) {
    return fail("test_config_parsing_rejects_bad_input", "unknown preset should throw");
  }
  if (!config_throws("triage_bad_range.yaml", "ranges:\n  hr: 80\n")) {
    return fail("test_config_parsing_rejects_bad_input", "range without half width should throw");
  }
  if (!config_throws("triage_bad_workers.yaml", "batch:\n  workers: 0\n")) {
    return fail("test_config_parsing_rejects_bad_input", "zero workers should throw");
  }

  bool missing_threw = false;
  try {
    (void)load_scorer_config("/nonexistent/triage_scorer.yaml");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_parsing_rejects_bad_input", "missing file should throw");
  }

  ScorerConfig unordered{};
  unordered.threshold_overrides[0] = 0.5;
  bool invalid_threw = false;
  try {
    (void)triage::core::build_params(unordered);
  } catch (const std::runtime_error&) {
    invalid_threw = true;
  }
  if (!invalid_threw) {
    return fail("test_config_parsing_rejects_bad_input", "t1 below t2 should be rejected");
  }

  const auto defaults_path = write_temp("triage_defaults.yaml", "# nothing set\n");
  const ScorerConfig defaults = load_scorer_config(defaults_path.string());
  std::filesystem::remove(defaults_path);
  if (defaults.debug_records || defaults.output != triage::core::output_format::CSV || !defaults.clamp_input ||
      !(triage::core::build_params(defaults) == triage::core::default_params())) {
    return fail("test_config_parsing_rejects_bad_input", "empty config should keep defaults");
  }
  return 0;
}

int test_intake_reader() {
  const auto rows = sample_rows();
  if (rows.size() != 3 || rows[0].id != "enc-1" || rows[0].vitals.hr != 120 || rows[0].vitals.dbp != 0 ||
      rows[0].vitals.temp != 0.0 || rows[0].resource_count != 3 || rows[1].vitals.temp != 37.0) {
    return fail("test_intake_reader", "row parsing mismatch");
  }

  std::istringstream headerless("# exported from triage desk\n\n\"bed 4, north\",90,18,130,85,36.8,97,15,2\n");
  const auto quoted = triage::core::read_intake(headerless);
  if (quoted.size() != 1 || quoted[0].id != "bed 4, north" || quoted[0].vitals.gcs != 15) {
    return fail("test_intake_reader", "quoted id without header should parse");
  }

  std::istringstream short_row("id,hr,rr,sbp,dbp,temp,spo2,gcs,resource_count\nenc-1,120,24\n");
  bool short_threw = false;
  try {
    (void)triage::core::read_intake(short_row);
  } catch (const std::runtime_error& ex) {
    short_threw = std::string(ex.what()).find("line 2") != std::string::npos;
  }
  if (!short_threw) {
    return fail("test_intake_reader", "wrong column count should throw naming the line");
  }

  std::istringstream bad_number("enc-1,12x,24,90,60,37.0,92,15,1\n");
  bool bad_threw = false;
  try {
    (void)triage::core::read_intake(bad_number);
  } catch (const std::runtime_error&) {
    bad_threw = true;
  }
  if (!bad_threw) {
    return fail("test_intake_reader", "unparsable number should throw");
  }
  return 0;
}

int test_runner_writes_csv_and_counts_clamping() {
  ScorerConfig config{};
  config.batch_workers = 2;
  Runner runner{config};

  std::ostringstream out;
  const auto result = runner.run(sample_rows(), "intake.csv", out);

  if (result.records.size() != 3 || result.stats.rows_scored != 3 || result.stats.rows_clamped != 1 ||
      result.stats.resource_counts_clamped != 1 || result.stats.rows_without_vitals != 0) {
    return fail("test_runner_writes_csv_and_counts_clamping", "run statistics mismatch");
  }
  if (result.records[0].level != 2 || result.records[0].id != "enc-1" || result.records[1].level != 5) {
    return fail("test_runner_writes_csv_and_counts_clamping", "scored levels mismatch");
  }
  if (result.records[2].hr != 300 || result.records[2].resource_count != 6) {
    return fail("test_runner_writes_csv_and_counts_clamping", "clamped values should be exported");
  }
  if (result.records[0].timestamp.size() != 20) {
    return fail("test_runner_writes_csv_and_counts_clamping", "records should carry the run timestamp");
  }

  const std::string text = out.str();
  if (text.rfind("hr,rr,sbp,dbp,temp,spo2,gcs,resource_count,acuity,level,level_label,timestamp,id\n", 0) != 0 ||
      text.find(",Emergent,") == std::string::npos || text.find(",enc-3\n") == std::string::npos) {
    return fail("test_runner_writes_csv_and_counts_clamping", "csv output mismatch");
  }
  return 0;
}

int test_runner_json_output_without_clamping() {
  ScorerConfig config{};
  config.clamp_input = false;
  config.output = triage::core::output_format::JSON;
  Runner runner{config};

  std::ostringstream out;
  const auto result = runner.run(sample_rows(), "intake.csv", out);
  if (result.stats.rows_clamped != 0 || result.records[2].hr != 400 || result.records[2].resource_count != 12) {
    return fail("test_runner_json_output_without_clamping", "raw values should pass through");
  }

  const auto batch = triage::sinks::batch_from_json(nlohmann::json::parse(out.str()));
  if (batch.results.size() != 3 || batch.source != "intake.csv" || batch.generated.empty() ||
      batch.results[0].level_label != "Emergent") {
    return fail("test_runner_json_output_without_clamping", "json batch mismatch");
  }
  return 0;
}

int test_runner_rejects_invalid_params() {
  ScorerConfig config{};
  config.threshold_overrides[3] = 0.9;
  bool threw = false;
  try {
    Runner runner{config};
  } catch (const std::runtime_error&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_runner_rejects_invalid_params", "invalid thresholds should stop the runner");
  }
  return 0;
}

int test_runner_debug_lines_stay_off_the_output() {
  std::FILE* debug = std::tmpfile();
  if (debug == nullptr) {
    return fail("test_runner_debug_lines_stay_off_the_output", "tmpfile unavailable");
  }

  ScorerConfig config{};
  config.debug_records = true;
  Runner runner{config, debug};

  std::ostringstream out;
  const auto result = runner.run(sample_rows(), "intake.csv", out);

  std::string debug_text;
  std::rewind(debug);
  char buffer[256];
  while (std::fgets(buffer, sizeof(buffer), debug) != nullptr) {
    debug_text += buffer;
  }
  std::fclose(debug);

  if (result.records.size() != 3 || debug_text.find("[score] id=enc-1 ") == std::string::npos ||
      debug_text.find("[score] id=enc-3 ") == std::string::npos) {
    return fail("test_runner_debug_lines_stay_off_the_output", "debug sink should receive one line per record");
  }

  const std::string text = out.str();
  if (text.find("[score]") != std::string::npos ||
      text.rfind("hr,rr,sbp,dbp,temp,spo2,gcs,resource_count,acuity,level,level_label,timestamp,id\n", 0) != 0) {
    return fail("test_runner_debug_lines_stay_off_the_output", "scored output should be pure csv");
  }

  triage::sinks::DebugSink detached{nullptr};
  detached.publish(result.records[0]);
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parsing_full_file(); rc != 0) return rc;
  if (int rc = test_config_parsing_rejects_bad_input(); rc != 0) return rc;
  if (int rc = test_intake_reader(); rc != 0) return rc;
  if (int rc = test_runner_writes_csv_and_counts_clamping(); rc != 0) return rc;
  if (int rc = test_runner_json_output_without_clamping(); rc != 0) return rc;
  if (int rc = test_runner_rejects_invalid_params(); rc != 0) return rc;
  if (int rc = test_runner_debug_lines_stay_off_the_output(); rc != 0) return rc;

  std::cout << "[PASS] runner unit tests\n";
  return 0;
}

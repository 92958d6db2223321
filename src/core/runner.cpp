#include "core/runner.hpp"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <utility>

#include "core/timestamp.hpp"
#include "stats/descriptive.hpp"
#include "validate/input_checks.hpp"

namespace triage::core {
namespace {

score::ScoringEngine make_engine(const ScorerConfig& config) {
  return score::ScoringEngine(build_params(config), build_ranges(config));
}

}  // namespace

Runner::Runner(ScorerConfig config, std::FILE* debug_stream)
    : config_(std::move(config)), engine_(make_engine(config_)), debug_sink_(debug_stream) {
  std::cerr << "[scorer] preset=" << config_.preset << " population=" << config_.population
            << " divisor=" << engine_.params().divisor() << " workers=" << config_.batch_workers << '\n';
}

RunResult Runner::run(const std::vector<IntakeRow>& rows, const std::string& source, std::ostream& out) {
  RunResult result{};
  RunStats& stats = result.stats;
  stats.rows_read = rows.size();

  std::vector<model::vitals> vitals;
  std::vector<int> resource_counts;
  vitals.reserve(rows.size());
  resource_counts.reserve(rows.size());
  const int max_resources = engine_.params().max_resources;

  for (const auto& row : rows) {
    model::vitals v = row.vitals;
    int count = row.resource_count;
    if (config_.clamp_input) {
      const validate::SanitizedVitals sanitized = validate::sanitize_vitals(v);
      if (sanitized.clamped) {
        ++stats.rows_clamped;
      }
      v = sanitized.vitals;
      const int clamped_count = validate::clamp_resource_count(count, max_resources);
      if (clamped_count != count) {
        ++stats.resource_counts_clamped;
      }
      count = clamped_count;
    }
    if (!validate::at_least_one_vital(v)) {
      ++stats.rows_without_vitals;
    }
    vitals.push_back(v);
    resource_counts.push_back(count);
  }

  const auto evaluations = engine_.batch_evaluate_parallel(vitals, resource_counts, config_.batch_workers);
  if (!evaluations.has_value()) {
    throw std::runtime_error("batch evaluation rejected mismatched input lengths");
  }

  const std::string generated = rfc3339_now();
  result.records.reserve(rows.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    result.records.push_back(sinks::make_record(vitals[i], resource_counts[i], (*evaluations)[i], rows[i].id, generated));
  }
  stats.rows_scored = result.records.size();

  publish_debug(result.records);
  write_output(result.records, source, generated, out);
  return result;
}

void Runner::publish_debug(const std::vector<sinks::ResultRecord>& records) const {
  if (!config_.debug_records) {
    return;
  }
  for (const auto& record : records) {
    debug_sink_.publish(record);
  }
}

void Runner::write_output(const std::vector<sinks::ResultRecord>& records, const std::string& source,
                          const std::string& generated, std::ostream& out) const {
  switch (config_.output) {
    case output_format::CSV:
      sinks::write_csv(out, records);
      break;
    case output_format::JSON: {
      const sinks::ResultBatch batch{.results = records, .generated = generated, .source = source};
      out << sinks::batch_to_json(batch).dump(2) << '\n';
      break;
    }
    case output_format::NONE:
      break;
  }
  out.flush();
}

void log_run_summary(const RunResult& result) {
  const RunStats& stats = result.stats;
  std::cerr << "[scorer] rows read=" << stats.rows_read << " scored=" << stats.rows_scored
            << " clamped=" << stats.rows_clamped << " resource_clamped=" << stats.resource_counts_clamped
            << " without_vitals=" << stats.rows_without_vitals << '\n';
  if (result.records.empty()) {
    return;
  }

  std::vector<double> scores;
  scores.reserve(result.records.size());
  for (const auto& record : result.records) {
    scores.push_back(record.acuity);
  }
  const stats::ScoreStats score_stats = stats::score_stats(scores);
  char line[256];
  std::snprintf(line, sizeof(line),
                "[scorer] acuity mean=%.4f sd=%.4f ci95=[%.4f, %.4f] min=%.4f p25=%.4f p50=%.4f p75=%.4f max=%.4f\n",
                score_stats.mean, score_stats.stddev, score_stats.ci95_low, score_stats.ci95_high, score_stats.min,
                score_stats.p25, score_stats.p50, score_stats.p75, score_stats.max);
  std::cerr << line;

  for (const auto& row : sinks::level_report(result.records)) {
    std::snprintf(line, sizeof(line), "[scorer] level %d %-13s count=%zu pct=%.2f mean=%.4f\n", row.level,
                  row.level_label.c_str(), row.count, row.pct, row.mean_acuity);
    std::cerr << line;
  }
}

}  // namespace triage::core

#include "score/engine.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "validate/input_checks.hpp"

namespace triage::score {

ScoringEngine::ScoringEngine(core::Params params, core::ReferenceRanges ranges)
    : params_(std::move(params)), ranges_(std::move(ranges)) {}

double ScoringEngine::acuity(const model::vitals& v, const int resource_count) const noexcept {
  return score::acuity(v, resource_count, params_, ranges_);
}

model::triage_level ScoringEngine::level(const model::vitals& v, const int resource_count) const noexcept {
  return core::from_score(acuity(v, resource_count), params_);
}

Evaluation ScoringEngine::evaluate(const model::vitals& v, const int resource_count) const noexcept {
  const double value = acuity(v, resource_count);
  return Evaluation{value, core::from_score(value, params_)};
}

ScoreBreakdown ScoringEngine::breakdown(const model::vitals& v, const int resource_count) const noexcept {
  return score_breakdown(v, resource_count, params_, ranges_);
}

double ScoringEngine::acuity_with_ranges(const model::vitals& v, const int resource_count,
                                         const core::ReferenceRanges& ranges) const noexcept {
  return score::acuity(v, resource_count, params_, ranges);
}

Evaluation ScoringEngine::evaluate_with_ranges(const model::vitals& v, const int resource_count,
                                               const core::ReferenceRanges& ranges) const noexcept {
  const double value = acuity_with_ranges(v, resource_count, ranges);
  return Evaluation{value, core::from_score(value, params_)};
}

Evaluation ScoringEngine::evaluate_with_resource_clamp(const model::vitals& v, const int resource_count) const noexcept {
  return evaluate(v, validate::clamp_resource_count(resource_count, params_.max_resources));
}

std::optional<std::vector<Evaluation>> ScoringEngine::batch_evaluate(const std::vector<model::vitals>& vitals,
                                                                     const std::vector<int>& resource_counts) const {
  if (vitals.size() != resource_counts.size()) {
    return std::nullopt;
  }
  std::vector<Evaluation> out;
  out.reserve(vitals.size());
  for (std::size_t i = 0; i < vitals.size(); ++i) {
    out.push_back(evaluate(vitals[i], resource_counts[i]));
  }
  return out;
}

std::optional<std::vector<Evaluation>> ScoringEngine::batch_evaluate_parallel(
    const std::vector<model::vitals>& vitals, const std::vector<int>& resource_counts, const std::size_t workers,
    const ThreadSpawner& spawn) const {
  if (vitals.size() != resource_counts.size()) {
    return std::nullopt;
  }
  if (std::min(workers, vitals.size()) <= 1) {
    return batch_evaluate(vitals, resource_counts);
  }

  std::vector<Evaluation> out(vitals.size());
  run_chunked(
      vitals.size(), workers,
      [this, &vitals, &resource_counts, &out](const std::size_t begin, const std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
          out[i] = evaluate(vitals[i], resource_counts[i]);
        }
      },
      spawn);
  return out;
}

std::optional<std::vector<double>> ScoringEngine::batch_acuity(const std::vector<model::vitals>& vitals,
                                                               const std::vector<int>& resource_counts) const {
  if (vitals.size() != resource_counts.size()) {
    return std::nullopt;
  }
  std::vector<double> out;
  out.reserve(vitals.size());
  for (std::size_t i = 0; i < vitals.size(); ++i) {
    out.push_back(acuity(vitals[i], resource_counts[i]));
  }
  return out;
}

std::optional<std::vector<model::triage_level>> ScoringEngine::batch_level(
    const std::vector<model::vitals>& vitals, const std::vector<int>& resource_counts) const {
  if (vitals.size() != resource_counts.size()) {
    return std::nullopt;
  }
  std::vector<model::triage_level> out;
  out.reserve(vitals.size());
  for (std::size_t i = 0; i < vitals.size(); ++i) {
    out.push_back(level(vitals[i], resource_counts[i]));
  }
  return out;
}

ScoringEngine ScoringEngine::with_params(core::Params params) const {
  return ScoringEngine(std::move(params), ranges_);
}

ScoringEngine make_default_engine() {
  return ScoringEngine(core::default_params());
}

ScoringEngine make_strict_engine() {
  return ScoringEngine(core::preset_strict());
}

ScoringEngine make_lenient_engine() {
  return ScoringEngine(core::preset_lenient());
}

ScoringEngine make_research_engine() {
  return ScoringEngine(core::preset_research());
}

std::size_t count_by_level(const std::vector<Evaluation>& results, const model::triage_level level) noexcept {
  return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                                [level](const Evaluation& e) { return e.level == level; }));
}

std::vector<Evaluation> filter_by_level(const std::vector<Evaluation>& results, const model::triage_level level) {
  std::vector<Evaluation> out;
  std::copy_if(results.begin(), results.end(), std::back_inserter(out),
               [level](const Evaluation& e) { return e.level == level; });
  return out;
}

std::vector<Evaluation> filter_high_acuity(const std::vector<Evaluation>& results) {
  std::vector<Evaluation> out;
  std::copy_if(results.begin(), results.end(), std::back_inserter(out),
               [](const Evaluation& e) { return model::is_high_acuity(e.level); });
  return out;
}

std::vector<Evaluation> filter_low_acuity(const std::vector<Evaluation>& results) {
  std::vector<Evaluation> out;
  std::copy_if(results.begin(), results.end(), std::back_inserter(out),
               [](const Evaluation& e) { return model::is_low_acuity(e.level); });
  return out;
}

model::level_counts_t level_distribution(const std::vector<Evaluation>& results) noexcept {
  model::level_counts_t counts{};
  for (const auto& e : results) {
    ++counts[static_cast<std::size_t>(model::level_number(e.level))];
  }
  return counts;
}

AcuitySummary summarize(const std::vector<Evaluation>& results) noexcept {
  AcuitySummary summary{};
  summary.n = results.size();
  if (results.empty()) {
    return summary;
  }
  summary.min = results.front().acuity;
  summary.max = results.front().acuity;
  double sum = 0.0;
  for (const auto& e : results) {
    summary.min = std::min(summary.min, e.acuity);
    summary.max = std::max(summary.max, e.acuity);
    sum += e.acuity;
  }
  summary.mean = sum / static_cast<double>(results.size());
  return summary;
}

}  // namespace triage::score

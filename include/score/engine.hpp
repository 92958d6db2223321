#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/params.hpp"
#include "core/ranges.hpp"
#include "model/triage_level.hpp"
#include "model/vitals.hpp"
#include "score/acuity.hpp"
#include "score/parallel.hpp"

namespace triage::score {

struct Evaluation {
  double acuity{0.0};
  model::triage_level level{model::triage_level::NON_URGENT};

  bool operator==(const Evaluation&) const = default;
};

struct AcuitySummary {
  double min{0.0};
  double max{0.0};
  double mean{0.0};
  std::size_t n{0};
};

// Scores vitals against one parameter set and one set of reference ranges,
// both held by value and never modified. Every member is const, so a single
// engine can be shared across threads without locking.
class ScoringEngine {
 public:
  explicit ScoringEngine(core::Params params = core::default_params(),
                         core::ReferenceRanges ranges = core::adult_ranges());

  [[nodiscard]] double acuity(const model::vitals& v, int resource_count) const noexcept;
  [[nodiscard]] model::triage_level level(const model::vitals& v, int resource_count) const noexcept;
  [[nodiscard]] Evaluation evaluate(const model::vitals& v, int resource_count) const noexcept;
  [[nodiscard]] ScoreBreakdown breakdown(const model::vitals& v, int resource_count) const noexcept;

  // Same formula with caller-supplied ranges, for calibration runs that
  // should not require a new engine.
  [[nodiscard]] double acuity_with_ranges(const model::vitals& v, int resource_count,
                                          const core::ReferenceRanges& ranges) const noexcept;
  [[nodiscard]] Evaluation evaluate_with_ranges(const model::vitals& v, int resource_count,
                                                const core::ReferenceRanges& ranges) const noexcept;

  // Clamps resource_count to [0, max_resources] before scoring.
  [[nodiscard]] Evaluation evaluate_with_resource_clamp(const model::vitals& v, int resource_count) const noexcept;

  // std::nullopt when the input sequences differ in length.
  [[nodiscard]] std::optional<std::vector<Evaluation>> batch_evaluate(const std::vector<model::vitals>& vitals,
                                                                      const std::vector<int>& resource_counts) const;
  // Index-aligned with batch_evaluate; items are split across worker threads.
  // Chunks that cannot get a thread are scored on the calling thread.
  [[nodiscard]] std::optional<std::vector<Evaluation>> batch_evaluate_parallel(
      const std::vector<model::vitals>& vitals, const std::vector<int>& resource_counts, std::size_t workers,
      const ThreadSpawner& spawn = spawn_thread) const;
  [[nodiscard]] std::optional<std::vector<double>> batch_acuity(const std::vector<model::vitals>& vitals,
                                                                const std::vector<int>& resource_counts) const;
  [[nodiscard]] std::optional<std::vector<model::triage_level>> batch_level(
      const std::vector<model::vitals>& vitals, const std::vector<int>& resource_counts) const;

  [[nodiscard]] core::Params params() const { return params_; }
  [[nodiscard]] const core::ReferenceRanges& ranges() const noexcept { return ranges_; }
  [[nodiscard]] ScoringEngine with_params(core::Params params) const;

 private:
  core::Params params_;
  core::ReferenceRanges ranges_;
};

ScoringEngine make_default_engine();
ScoringEngine make_strict_engine();
ScoringEngine make_lenient_engine();
ScoringEngine make_research_engine();

std::size_t count_by_level(const std::vector<Evaluation>& results, model::triage_level level) noexcept;
std::vector<Evaluation> filter_by_level(const std::vector<Evaluation>& results, model::triage_level level);
std::vector<Evaluation> filter_high_acuity(const std::vector<Evaluation>& results);
std::vector<Evaluation> filter_low_acuity(const std::vector<Evaluation>& results);
model::level_counts_t level_distribution(const std::vector<Evaluation>& results) noexcept;
AcuitySummary summarize(const std::vector<Evaluation>& results) noexcept;

}  // namespace triage::score

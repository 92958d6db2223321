#pragma once

#include <cstddef>
#include <cstdio>
#include <ostream>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/intake.hpp"
#include "score/engine.hpp"
#include "sinks/result_record.hpp"
#include "sinks/debug_log.hpp"

namespace triage::core {

struct RunStats {
  std::size_t rows_read{0};
  std::size_t rows_scored{0};
  std::size_t rows_clamped{0};
  std::size_t rows_without_vitals{0};
  std::size_t resource_counts_clamped{0};
};

struct RunResult {
  std::vector<sinks::ResultRecord> records{};
  RunStats stats{};
};

// Scores one intake batch end to end: optional clamping, batch evaluation,
// then the debug sink and the configured output stream.
class Runner {
 public:
  // Throws std::runtime_error when the configured parameter set or ranges are invalid.
  // Debug lines go to debug_stream so they never mix with the scored output.
  explicit Runner(ScorerConfig config, std::FILE* debug_stream = stderr);

  RunResult run(const std::vector<IntakeRow>& rows, const std::string& source, std::ostream& out);

  [[nodiscard]] const score::ScoringEngine& engine() const noexcept { return engine_; }

 private:
  void publish_debug(const std::vector<sinks::ResultRecord>& records) const;
  void write_output(const std::vector<sinks::ResultRecord>& records, const std::string& source,
                    const std::string& generated, std::ostream& out) const;

  ScorerConfig config_;
  score::ScoringEngine engine_;
  sinks::DebugSink debug_sink_;
};

// Prints counts, score statistics and the level report to stderr.
void log_run_summary(const RunResult& result);

}  // namespace triage::core

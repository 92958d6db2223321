#pragma once

#include "core/params.hpp"
#include "core/ranges.hpp"
#include "model/vitals.hpp"

namespace triage::score {

struct ScoreBreakdown {
  double vital_component{0.0};
  double resource_component{0.0};
  double raw{0.0};
  double divisor{0.0};
  double score{0.0};
};

// Weighted mean deviation over present vitals whose range half-width is
// positive, normalised by the weights of those vitals only. 0 when no such
// vital carries weight.
double vital_component(const model::vitals& v, const core::WeightVector& weights,
                       const core::ReferenceRanges& ranges) noexcept;

// resource_weight * min(1, count / max_resources); 0 for any non-positive input.
double resource_component(int resource_count, int max_resources, double resource_weight) noexcept;

// raw / divisor clamped to [0, 1]; 0 when divisor <= 0 or the ratio is not finite.
double normalize(double raw, double divisor) noexcept;

// V is normalised by the present-vital weights while the final score is
// normalised by the full weight sum plus resource weight, so sparse
// observations cannot produce extreme scores on their own.
ScoreBreakdown score_breakdown(const model::vitals& v, int resource_count, const core::Params& params,
                               const core::ReferenceRanges& ranges) noexcept;

double acuity(const model::vitals& v, int resource_count, const core::Params& params,
              const core::ReferenceRanges& ranges) noexcept;

}  // namespace triage::score

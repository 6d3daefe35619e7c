// src/aggregate/steps_to_target.cpp

#include "orr/aggregate/steps_to_target.h"

#include "orr/core/assert.h"
#include "orr/core/stats.h"

#include <utility>

namespace orr {

std::optional<OptimizerSummary> SummarizeSteps(const std::vector<double>& values) {
  const Summary s = Summarize(values);
  if (s.n == 0) return std::nullopt;

  OptimizerSummary out;
  out.mean_steps = s.mean;
  out.median_steps = s.median;
  out.std_steps = s.stdev;
  out.min_steps = s.min;
  out.max_steps = s.max;
  out.count = static_cast<u64>(s.n);

  ORR_DASSERT(out.min_steps <= out.median_steps && out.median_steps <= out.max_steps);
  return out;
}

SummaryMap AggregateStepsToTarget(Span<const TrialRecord> records) {
  std::map<std::string, std::vector<double>> pooled;
  for (const TrialRecord& r : records) {
    if (!r.steps_to_target) continue;
    pooled[r.optimizer_name].push_back(*r.steps_to_target);
  }

  SummaryMap out;
  for (const auto& kv : pooled) {
    if (auto s = SummarizeSteps(kv.second)) out.emplace(kv.first, *s);
  }
  return out;
}

}  // namespace orr

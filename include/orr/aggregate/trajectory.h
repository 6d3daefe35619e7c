#pragma once
// orr/aggregate/trajectory.h
//
// Open-Race aggregate: mean best-value-so-far curve per optimizer.
//
// Each trial's history is first repaired into a non-decreasing, step-sorted
// sequence (a best-so-far curve must never go down). Trials are then aligned
// on a dense step grid [0, max_step], where max_step is the largest step any
// trial of the optimizer reached. At each step a trial contributes the value
// of its latest observation at or before that step; steps before a trial's
// first observation get no contribution from it. The per-step value is the
// mean over contributing trials, or 0 when none contribute, and the final
// curve is the running maximum of those means so it never goes down.

#include "orr/core/types.h"
#include "orr/records/trial_record.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orr {

struct OptimizerTrajectory {
  std::vector<i64> steps;      // 0, 1, ..., max_step
  std::vector<double> values;  // same length as steps

  // Last value of the curve (0 when empty).
  double FinalBest() const noexcept { return values.empty() ? 0.0 : values.back(); }
};

using TrajectoryMap = std::map<std::string, OptimizerTrajectory>;

// Sorts by step, applies a running maximum to the values, and keeps only the
// last (largest) value for repeated steps.
std::vector<HistoryPoint> RepairHistory(std::vector<HistoryPoint> history);

// Aggregates the histories of `trials`, which are all assumed to belong to a
// single optimizer. Trials with empty history are ignored; nullopt when
// every history is empty.
std::optional<OptimizerTrajectory> AggregateTrajectory(Span<const TrialRecord> trials);

// Groups records by optimizer and aggregates each group. Optimizers with no
// history points at all are omitted.
TrajectoryMap AggregateTrajectories(Span<const TrialRecord> records);

}  // namespace orr

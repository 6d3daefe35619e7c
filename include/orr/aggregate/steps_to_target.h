#pragma once
// orr/aggregate/steps_to_target.h
//
// Hide-the-Label aggregate: per-optimizer summary of steps-to-target values
// pooled over every record in scope.

#include "orr/core/types.h"
#include "orr/records/trial_record.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace orr {

struct OptimizerSummary {
  double mean_steps = 0.0;
  double median_steps = 0.0;
  double std_steps = 0.0;  // population standard deviation
  double min_steps = 0.0;
  double max_steps = 0.0;
  u64 count = 0;
};

using SummaryMap = std::map<std::string, OptimizerSummary>;

// nullopt when `values` holds no finite value.
std::optional<OptimizerSummary> SummarizeSteps(const std::vector<double>& values);

// Groups steps_to_target by optimizer. Records without a value are dropped;
// optimizers left with no values are omitted.
SummaryMap AggregateStepsToTarget(Span<const TrialRecord> records);

}  // namespace orr

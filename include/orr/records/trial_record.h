#pragma once
// orr/records/trial_record.h
//
// The uniform per-optimizer, per-competition record every document shape is
// normalized into.

#include "orr/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace orr {

// History entries beyond this step are treated as malformed; trajectories are
// dense over [0, max_step], so an absurd step would allocate unboundedly.
inline constexpr i64 kMaxHistoryStep = i64{1} << 24;

struct HistoryPoint {
  i64 step = 0;
  double best_value_so_far = 0.0;

  friend bool operator==(const HistoryPoint& a, const HistoryPoint& b) noexcept {
    return a.step == b.step && a.best_value_so_far == b.best_value_so_far;
  }
};

struct TrialRecord {
  std::string optimizer_name;

  // Absent when the document encodes only a trajectory.
  std::optional<double> steps_to_target;

  // In document order (not necessarily sorted); empty when the document
  // encodes only a scalar outcome.
  std::vector<HistoryPoint> history;
};

}  // namespace orr

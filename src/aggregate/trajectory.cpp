// src/aggregate/trajectory.cpp

#include "orr/aggregate/trajectory.h"

#include "orr/core/assert.h"

#include <algorithm>
#include <utility>

namespace orr {

namespace {

using HistoryList = std::vector<const std::vector<HistoryPoint>*>;

std::optional<OptimizerTrajectory> AggregateHistories(const HistoryList& histories) {
  std::vector<std::vector<HistoryPoint>> repaired;
  repaired.reserve(histories.size());
  i64 max_step = -1;
  for (const auto* h : histories) {
    if (h->empty()) continue;
    repaired.push_back(RepairHistory(*h));
    max_step = std::max(max_step, repaired.back().back().step);
  }
  if (repaired.empty()) return std::nullopt;

  const usize n = static_cast<usize>(max_step) + 1;
  std::vector<double> sum(n, 0.0);
  std::vector<u32> count(n, 0);

  // Each point covers the steps up to (excluding) the next point; the last
  // point carries forward to max_step.
  for (const auto& pts : repaired) {
    for (usize j = 0; j < pts.size(); ++j) {
      const usize begin = static_cast<usize>(pts[j].step);
      const usize end = (j + 1 < pts.size()) ? static_cast<usize>(pts[j + 1].step) : n;
      for (usize s = begin; s < end; ++s) {
        sum[s] += pts[j].best_value_so_far;
        ++count[s];
      }
    }
  }

  // A trial joining late with a low value can pull the mean down, so the
  // averaged curve gets its own running max.
  OptimizerTrajectory out;
  out.steps.resize(n);
  out.values.resize(n);
  for (usize s = 0; s < n; ++s) {
    out.steps[s] = static_cast<i64>(s);
    const double mean = count[s] ? sum[s] / static_cast<double>(count[s]) : 0.0;
    out.values[s] = (s == 0) ? mean : std::max(out.values[s - 1], mean);
  }
  ORR_CHECK_EQ(out.steps.size(), out.values.size());
  return out;
}

}  // namespace

std::vector<HistoryPoint> RepairHistory(std::vector<HistoryPoint> history) {
  std::stable_sort(history.begin(), history.end(),
                   [](const HistoryPoint& a, const HistoryPoint& b) { return a.step < b.step; });

  std::vector<HistoryPoint> out;
  out.reserve(history.size());
  double best = 0.0;
  for (usize i = 0; i < history.size(); ++i) {
    best = (i == 0) ? history[i].best_value_so_far : std::max(best, history[i].best_value_so_far);
    if (!out.empty() && out.back().step == history[i].step) {
      out.back().best_value_so_far = best;
    } else {
      out.push_back(HistoryPoint{history[i].step, best});
    }
  }

  for (usize i = 1; i < out.size(); ++i) {
    ORR_DASSERT(out[i - 1].step < out[i].step);
    ORR_DASSERT(out[i - 1].best_value_so_far <= out[i].best_value_so_far);
  }
  return out;
}

std::optional<OptimizerTrajectory> AggregateTrajectory(Span<const TrialRecord> trials) {
  HistoryList histories;
  histories.reserve(trials.size());
  for (const TrialRecord& r : trials) histories.push_back(&r.history);
  return AggregateHistories(histories);
}

TrajectoryMap AggregateTrajectories(Span<const TrialRecord> records) {
  std::map<std::string, HistoryList> grouped;
  for (const TrialRecord& r : records) grouped[r.optimizer_name].push_back(&r.history);

  TrajectoryMap out;
  for (const auto& kv : grouped) {
    if (auto t = AggregateHistories(kv.second)) out.emplace(kv.first, std::move(*t));
  }
  return out;
}

}  // namespace orr

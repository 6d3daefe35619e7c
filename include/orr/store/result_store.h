#pragma once
// orr/store/result_store.h
//
// ResultStore: coordinate -> {optimizer -> aggregate}, built per run.
//
// A coordinate is the 5-tuple (hidden_fraction, difficulty, race_type,
// batch_size, dataset). Insert is last-writer-wins for a given
// (coordinate, optimizer); the store never deletes. Iteration is in
// coordinate order so serialization is deterministic.

#include "orr/aggregate/steps_to_target.h"
#include "orr/aggregate/trajectory.h"
#include "orr/core/types.h"

#include <map>
#include <ostream>
#include <string>
#include <tuple>
#include <variant>

namespace orr {

struct Coordinate {
  double hidden_fraction = 0.0;  // 0.95 or 0.99
  Difficulty difficulty = Difficulty::Unknown;
  RaceType race_type = RaceType::Unknown;
  i32 batch_size = 0;
  std::string dataset;

  friend bool operator<(const Coordinate& a, const Coordinate& b) {
    return std::tie(a.hidden_fraction, a.difficulty, a.race_type, a.batch_size, a.dataset) <
           std::tie(b.hidden_fraction, b.difficulty, b.race_type, b.batch_size, b.dataset);
  }
  friend bool operator==(const Coordinate& a, const Coordinate& b) {
    return std::tie(a.hidden_fraction, a.difficulty, a.race_type, a.batch_size, a.dataset) ==
           std::tie(b.hidden_fraction, b.difficulty, b.race_type, b.batch_size, b.dataset);
  }
};

std::ostream& operator<<(std::ostream& os, const Coordinate& c);

// Hide_The_Label coordinates hold summaries, Open_Race ones trajectories.
using Aggregate = std::variant<OptimizerSummary, OptimizerTrajectory>;
using OptimizerAggregates = std::map<std::string, Aggregate>;

class ResultStore {
 public:
  using Map = std::map<Coordinate, OptimizerAggregates>;
  using const_iterator = Map::const_iterator;

  ResultStore() = default;

  // Returns true when an existing aggregate for (coord, optimizer) was replaced.
  bool Insert(const Coordinate& coord, const std::string& optimizer, Aggregate agg);

  // Inserts every entry of `aggs`; returns how many replaced an existing one.
  usize Merge(const Coordinate& coord, const SummaryMap& aggs);
  usize Merge(const Coordinate& coord, const TrajectoryMap& aggs);

  const OptimizerAggregates* Find(const Coordinate& coord) const;
  const Aggregate* Find(const Coordinate& coord, const std::string& optimizer) const;

  const_iterator begin() const { return map_.begin(); }
  const_iterator end() const { return map_.end(); }

  // Number of (coordinate, optimizer) entries.
  usize Size() const { return size_; }
  usize CoordinateCount() const { return map_.size(); }
  bool Empty() const { return size_ == 0; }

 private:
  Map map_;
  usize size_ = 0;
};

}  // namespace orr

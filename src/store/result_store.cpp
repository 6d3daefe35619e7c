// src/store/result_store.cpp

#include "orr/store/result_store.h"

#include <utility>

namespace orr {

std::ostream& operator<<(std::ostream& os, const Coordinate& c) {
  return os << "(" << c.hidden_fraction << ", " << c.difficulty << ", " << c.race_type << ", "
            << c.batch_size << ", " << c.dataset << ")";
}

bool ResultStore::Insert(const Coordinate& coord, const std::string& optimizer, Aggregate agg) {
  OptimizerAggregates& slot = map_[coord];
  auto it = slot.find(optimizer);
  if (it != slot.end()) {
    it->second = std::move(agg);
    return true;
  }
  slot.emplace(optimizer, std::move(agg));
  ++size_;
  return false;
}

usize ResultStore::Merge(const Coordinate& coord, const SummaryMap& aggs) {
  usize replaced = 0;
  for (const auto& kv : aggs) {
    if (Insert(coord, kv.first, Aggregate(kv.second))) ++replaced;
  }
  return replaced;
}

usize ResultStore::Merge(const Coordinate& coord, const TrajectoryMap& aggs) {
  usize replaced = 0;
  for (const auto& kv : aggs) {
    if (Insert(coord, kv.first, Aggregate(kv.second))) ++replaced;
  }
  return replaced;
}

const OptimizerAggregates* ResultStore::Find(const Coordinate& coord) const {
  auto it = map_.find(coord);
  return it == map_.end() ? nullptr : &it->second;
}

const Aggregate* ResultStore::Find(const Coordinate& coord, const std::string& optimizer) const {
  const OptimizerAggregates* slot = Find(coord);
  if (!slot) return nullptr;
  auto it = slot->find(optimizer);
  return it == slot->end() ? nullptr : &it->second;
}

}  // namespace orr

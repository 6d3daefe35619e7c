// tests/test_result_store.cpp
//
// ResultStore semantics:
//  - insert creates coordinates; same (coordinate, optimizer) is last-writer-wins
//  - Merge of summary / trajectory maps
//  - lookups, sizes and coordinate-ordered iteration

#include "orr/core/types.h"
#include "orr/store/result_store.h"

#include <iostream>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

using orr::Coordinate;
using orr::Difficulty;
using orr::OptimizerSummary;
using orr::OptimizerTrajectory;
using orr::RaceType;
using orr::ResultStore;
using orr::usize;

Coordinate Coord(double hidden, Difficulty d, RaceType r, orr::i32 batch, const std::string& ds) {
  Coordinate c;
  c.hidden_fraction = hidden;
  c.difficulty = d;
  c.race_type = r;
  c.batch_size = batch;
  c.dataset = ds;
  return c;
}

OptimizerSummary Summary(double mean, orr::u64 count) {
  OptimizerSummary s;
  s.mean_steps = s.median_steps = s.min_steps = s.max_steps = mean;
  s.count = count;
  return s;
}

void TestInsertAndOverwrite(TestContext& t) {
  ResultStore store;
  CHECK(t, store.Empty());

  const Coordinate c = Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "T_Cell");
  CHECK(t, !store.Insert(c, "RANDOM", Summary(10.0, 1)));
  CHECK(t, !store.Insert(c, "DBO", Summary(4.0, 3)));
  CHECK_EQ(t, store.Size(), static_cast<usize>(2));
  CHECK_EQ(t, store.CoordinateCount(), static_cast<usize>(1));

  // Same coordinate + optimizer: replaced, size unchanged.
  CHECK(t, store.Insert(c, "RANDOM", Summary(12.0, 2)));
  CHECK_EQ(t, store.Size(), static_cast<usize>(2));

  const orr::Aggregate* a = store.Find(c, "RANDOM");
  CHECK(t, a != nullptr);
  const auto* s = a ? std::get_if<OptimizerSummary>(a) : nullptr;
  CHECK(t, s != nullptr);
  if (s) {
    CHECK_EQ(t, s->mean_steps, 12.0);
    CHECK_EQ(t, s->count, static_cast<orr::u64>(2));
  }

  CHECK(t, store.Find(c, "MISSING") == nullptr);
  CHECK(t, store.Find(Coord(0.99, Difficulty::Regular, RaceType::HideTheLabel, 10, "T_Cell")) == nullptr);
  CHECK(t, store.Find(c) != nullptr && store.Find(c)->size() == 2);
}

void TestMergeMaps(TestContext& t) {
  ResultStore store;
  const Coordinate htl = Coord(0.99, Difficulty::Hard, RaceType::HideTheLabel, 1, "rat_myocyte");
  const Coordinate open = Coord(0.99, Difficulty::Hard, RaceType::OpenRace, 1, "rat_myocyte");

  orr::SummaryMap sums;
  sums["A"] = Summary(1.0, 1);
  sums["B"] = Summary(2.0, 1);
  CHECK_EQ(t, store.Merge(htl, sums), static_cast<usize>(0));
  CHECK_EQ(t, store.Merge(htl, sums), static_cast<usize>(2));

  orr::TrajectoryMap trajs;
  OptimizerTrajectory tr;
  tr.steps = {0, 1};
  tr.values = {0.5, 0.75};
  trajs["A"] = tr;
  CHECK_EQ(t, store.Merge(open, trajs), static_cast<usize>(0));

  CHECK_EQ(t, store.Size(), static_cast<usize>(3));
  CHECK_EQ(t, store.CoordinateCount(), static_cast<usize>(2));

  const orr::Aggregate* a = store.Find(open, "A");
  CHECK(t, a && std::holds_alternative<OptimizerTrajectory>(*a));
  if (a && std::holds_alternative<OptimizerTrajectory>(*a)) {
    CHECK_EQ(t, std::get<OptimizerTrajectory>(*a).FinalBest(), 0.75);
  }
}

void TestIterationOrder(TestContext& t) {
  ResultStore store;
  store.Insert(Coord(0.99, Difficulty::Regular, RaceType::OpenRace, 1, "b"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Hard, RaceType::HideTheLabel, 20, "a"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::OpenRace, 10, "a"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "z"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "a"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 1, "z"), "X", Summary(1, 1));

  std::vector<std::string> seen;
  for (const auto& kv : store) {
    std::ostringstream oss;
    oss << kv.first;
    seen.push_back(oss.str());
  }
  const std::vector<std::string> expected = {
      "(0.95, Regular, Hide_The_Label, 1, z)",
      "(0.95, Regular, Hide_The_Label, 10, a)",
      "(0.95, Regular, Hide_The_Label, 10, z)",
      "(0.95, Regular, Open_Race, 10, a)",
      "(0.95, Hard, Hide_The_Label, 20, a)",
      "(0.99, Regular, Open_Race, 1, b)",
  };
  CHECK(t, seen == expected);
  if (seen != expected) {
    for (const auto& s : seen) std::cerr << "  got " << s << "\n";
  }
}

}  // namespace

int main() {
  TestContext t;

  TestInsertAndOverwrite(t);
  TestMergeMaps(t);
  TestIterationOrder(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_result_store\n";
    return 0;
  }
  std::cerr << "[FAILED] test_result_store: " << t.fails << " failure(s)\n";
  return 1;
}

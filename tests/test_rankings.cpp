// tests/test_rankings.cpp
//
// Report views over a ResultStore:
//  - ranking order per race type, ties broken by name, top-N truncation
//  - grid coverage: empty cells and datasets missing from one batch size
//  - required-optimizer check
//  - text renderings

#include "orr/core/types.h"
#include "orr/report/rankings.h"
#include "orr/store/result_store.h"

#include <iostream>
#include <string>
#include <utility>
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

OptimizerTrajectory Curve(std::vector<double> values) {
  OptimizerTrajectory t;
  for (usize i = 0; i < values.size(); ++i) t.steps.push_back(static_cast<orr::i64>(i));
  t.values = std::move(values);
  return t;
}

void TestRankHideTheLabel(TestContext& t) {
  orr::OptimizerAggregates aggs;
  aggs.emplace("RANDOM", Summary(12.0, 5));
  aggs.emplace("DBO", Summary(4.0, 5));
  aggs.emplace("BO", Summary(4.0, 3));
  aggs.emplace("GA", Summary(7.5, 5));
  aggs.emplace("CURVE", Curve({1.0}));  // wrong kind: ignored

  const auto all = orr::report::RankHideTheLabel(aggs);
  CHECK_EQ(t, all.size(), static_cast<usize>(4));
  if (all.size() == 4) {
    CHECK_EQ(t, all[0].name, std::string("BO"));
    CHECK_EQ(t, all[1].name, std::string("DBO"));
    CHECK_EQ(t, all[2].name, std::string("GA"));
    CHECK_EQ(t, all[3].name, std::string("RANDOM"));
    CHECK_EQ(t, all[0].support, static_cast<orr::u64>(3));
  }

  const auto top2 = orr::report::RankHideTheLabel(aggs, 2);
  CHECK_EQ(t, top2.size(), static_cast<usize>(2));
  CHECK(t, orr::report::RankHideTheLabel(aggs, 10).size() == 4);
}

void TestRankOpenRace(TestContext& t) {
  orr::OptimizerAggregates aggs;
  aggs.emplace("A", Curve({0.1, 0.5, 0.7}));
  aggs.emplace("B", Curve({0.9}));
  aggs.emplace("C", Curve({0.2, 0.7}));

  const auto ranked = orr::report::RankOpenRace(aggs);
  CHECK_EQ(t, ranked.size(), static_cast<usize>(3));
  if (ranked.size() == 3) {
    CHECK_EQ(t, ranked[0].name, std::string("B"));
    CHECK_EQ(t, ranked[1].name, std::string("A"));  // tie with C on 0.7
    CHECK_EQ(t, ranked[2].name, std::string("C"));
    CHECK_EQ(t, ranked[1].support, static_cast<orr::u64>(3));
  }

  const Coordinate open = Coord(0.95, Difficulty::Regular, RaceType::OpenRace, 1, "T_Cell");
  const auto via_dispatch = orr::report::Rank(open, aggs, 1);
  CHECK(t, via_dispatch.size() == 1 && via_dispatch[0].name == "B");
}

void TestCoverage(TestContext& t) {
  ResultStore store;
  CHECK_EQ(t, orr::report::CheckCoverage(store).empty_cells.size(), static_cast<usize>(24));

  // T_Cell under batch 1 and 10, rat_myocyte only under batch 10.
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 1, "T_Cell"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "T_Cell"), "X", Summary(1, 1));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "rat_myocyte"), "X", Summary(1, 1));

  const auto cov = orr::report::CheckCoverage(store);
  CHECK(t, !cov.Complete());
  CHECK_EQ(t, cov.empty_cells.size(), static_cast<usize>(22));
  CHECK_EQ(t, cov.missing_datasets.size(), static_cast<usize>(1));
  if (cov.missing_datasets.size() == 1) {
    CHECK_EQ(t, cov.missing_datasets[0].batch_size, 1);
    CHECK_EQ(t, cov.missing_datasets[0].dataset, std::string("rat_myocyte"));
  }

  const std::string text = orr::report::FormatCoverage(cov);
  CHECK(t, text.find("empty grid cells (22)") != std::string::npos);
  CHECK(t, text.find("dataset=rat_myocyte") != std::string::npos);
  CHECK(t, text.find("hidden=0.95 Regular Hide_The_Label batch=20") != std::string::npos);

  CHECK_EQ(t, orr::report::FormatCoverage(orr::report::CoverageReport{}), std::string("coverage: complete\n"));
}

void TestRequiredOptimizers(TestContext& t) {
  ResultStore store;
  const Coordinate a = Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 1, "T_Cell");
  const Coordinate b = Coord(0.99, Difficulty::Hard, RaceType::OpenRace, 20, "TF_Cell");
  store.Insert(a, "RANDOM", Summary(3, 1));
  store.Insert(a, "DBO", Summary(2, 1));
  store.Insert(b, "DBO", Curve({0.5}));

  const auto missing = orr::report::CheckRequiredOptimizers(store, {"RANDOM", "DBO"});
  CHECK_EQ(t, missing.size(), static_cast<usize>(1));
  if (missing.size() == 1) {
    CHECK(t, missing[0].coord == b);
    CHECK_EQ(t, missing[0].optimizer, std::string("RANDOM"));
  }
  CHECK(t, orr::report::CheckRequiredOptimizers(store, {}).empty());
}

void TestFormatting(TestContext& t) {
  ResultStore store;
  const Coordinate htl = Coord(0.95, Difficulty::Regular, RaceType::HideTheLabel, 10, "T_Cell");
  store.Insert(htl, "RANDOM", Summary(12.0, 5));
  store.Insert(htl, "DBO", Summary(4.0, 5));
  store.Insert(Coord(0.95, Difficulty::Regular, RaceType::OpenRace, 10, "T_Cell"), "DBO", Curve({0.25, 0.5}));

  const std::string rankings = orr::report::FormatRankings(store, 1);
  CHECK(t, rankings.find("hidden=0.95 Regular Hide_The_Label batch=10 dataset=T_Cell") != std::string::npos);
  CHECK(t, rankings.find("DBO") != std::string::npos);
  CHECK(t, rankings.find("RANDOM") == std::string::npos);  // cut by top 1
  CHECK(t, rankings.find("4.000") != std::string::npos);
  CHECK(t, rankings.find("(steps=2)") != std::string::npos);

  const std::string summary = orr::report::FormatStoreSummary(store);
  CHECK(t, summary.find("coordinates: 2\n") != std::string::npos);
  CHECK(t, summary.find("entries: 3 (2 summaries, 1 trajectories)") != std::string::npos);
  CHECK(t, summary.find("optimizers: 2 [DBO, RANDOM]") != std::string::npos);
}

}  // namespace

int main() {
  TestContext t;

  TestRankHideTheLabel(t);
  TestRankOpenRace(t);
  TestCoverage(t);
  TestRequiredOptimizers(t);
  TestFormatting(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_rankings\n";
    return 0;
  }
  std::cerr << "[FAILED] test_rankings: " << t.fails << " failure(s)\n";
  return 1;
}

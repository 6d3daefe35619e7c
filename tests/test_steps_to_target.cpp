// tests/test_steps_to_target.cpp
//
// Hide-the-Label summaries:
//  - mean / median (odd and even counts) / population std / min / max / count
//  - records without steps_to_target are dropped; all-absent optimizers omitted
//  - min <= median <= max over a spread of inputs

#include "orr/aggregate/steps_to_target.h"
#include "orr/core/types.h"
#include "orr/records/trial_record.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
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

  void CheckNear(double a, double b, double rel_eps, const char* ea, const char* eb,
                 const char* file, int line) {
    const double diff = std::fabs(a - b);
    const double scale = std::max({1.0, std::fabs(a), std::fabs(b)});
    if (diff <= rel_eps * scale) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line
              << "  CHECK_NEAR(" << ea << ", " << eb << ")  got " << a << " vs " << b
              << "  diff=" << diff << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)
#define CHECK_NEAR(ctx, a, b, eps) (ctx).CheckNear((a), (b), (eps), #a, #b, __FILE__, __LINE__)

using orr::TrialRecord;
using orr::u64;

TrialRecord Rec(const std::string& name, std::optional<double> steps) {
  TrialRecord r;
  r.optimizer_name = name;
  r.steps_to_target = steps;
  return r;
}

void TestSummaryOddCount(TestContext& t) {
  const auto s = orr::SummarizeSteps({9.0, 1.0, 5.0});
  CHECK(t, s.has_value());
  if (!s) return;
  CHECK_NEAR(t, s->mean_steps, 5.0, 1e-12);
  CHECK_EQ(t, s->median_steps, 5.0);
  CHECK_EQ(t, s->min_steps, 1.0);
  CHECK_EQ(t, s->max_steps, 9.0);
  CHECK_EQ(t, s->count, static_cast<u64>(3));
  // population std of {1,5,9}: sqrt(32/3)
  CHECK_NEAR(t, s->std_steps, std::sqrt(32.0 / 3.0), 1e-12);
}

void TestSummaryEvenCount(TestContext& t) {
  const auto s = orr::SummarizeSteps({4.0, 1.0, 3.0, 10.0});
  CHECK(t, s.has_value());
  if (!s) return;
  CHECK_EQ(t, s->median_steps, 3.5);  // midpoint of the two middle values
  CHECK_NEAR(t, s->mean_steps, 4.5, 1e-12);
  CHECK_EQ(t, s->count, static_cast<u64>(4));
}

void TestSummaryEmpty(TestContext& t) {
  CHECK(t, !orr::SummarizeSteps({}).has_value());
  CHECK(t, !orr::SummarizeSteps({std::numeric_limits<double>::quiet_NaN()}).has_value());

  const auto single = orr::SummarizeSteps({7.0});
  CHECK(t, single.has_value());
  if (single) {
    CHECK_EQ(t, single->std_steps, 0.0);
    CHECK_EQ(t, single->median_steps, 7.0);
    CHECK_EQ(t, single->count, static_cast<u64>(1));
  }
}

void TestAggregateGroupsAndOmits(TestContext& t) {
  std::vector<TrialRecord> recs = {
      Rec("A", 10.0), Rec("B", std::nullopt), Rec("A", 20.0),
      Rec("C", 3.0),  Rec("B", std::nullopt), Rec("A", std::nullopt),
  };
  const auto out = orr::AggregateStepsToTarget(recs);
  CHECK_EQ(t, out.size(), static_cast<std::size_t>(2));
  CHECK(t, out.count("B") == 0);

  auto it = out.find("A");
  CHECK(t, it != out.end());
  if (it != out.end()) {
    CHECK_EQ(t, it->second.count, static_cast<u64>(2));
    CHECK_NEAR(t, it->second.mean_steps, 15.0, 1e-12);
    CHECK_EQ(t, it->second.median_steps, 15.0);
  }

  CHECK(t, orr::AggregateStepsToTarget(std::vector<TrialRecord>{}).empty());
}

void TestOrderingInvariant(TestContext& t) {
  // Deterministic spread of inputs (no RNG needed).
  for (int n = 1; n <= 25; ++n) {
    std::vector<double> xs;
    for (int i = 0; i < n; ++i) xs.push_back(static_cast<double>((i * 37 + n * 11) % 53));
    const auto s = orr::SummarizeSteps(xs);
    CHECK(t, s.has_value());
    if (!s) continue;
    CHECK(t, s->min_steps <= s->median_steps);
    CHECK(t, s->median_steps <= s->max_steps);
    CHECK(t, s->min_steps <= s->mean_steps && s->mean_steps <= s->max_steps);
    CHECK_EQ(t, s->count, static_cast<u64>(n));
  }
}

}  // namespace

int main() {
  TestContext t;

  TestSummaryOddCount(t);
  TestSummaryEvenCount(t);
  TestSummaryEmpty(t);
  TestAggregateGroupsAndOmits(t);
  TestOrderingInvariant(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_steps_to_target\n";
    return 0;
  }
  std::cerr << "[FAILED] test_steps_to_target: " << t.fails << " failure(s)\n";
  return 1;
}

// src/report/rankings.cpp

#include "orr/report/rankings.h"

#include "orr/io/result_files.h"

#include <algorithm>
#include <initializer_list>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>
#include <variant>

namespace orr {
namespace report {

namespace {

void Truncate(std::vector<RankedOptimizer>* v, usize top_n) {
  if (top_n > 0 && v->size() > top_n) v->resize(top_n);
}

std::string CellLabel(double hidden, Difficulty d, RaceType r, i32 batch) {
  std::ostringstream oss;
  oss << "hidden=" << hidden << " " << d << " " << r << " batch=" << batch;
  return oss.str();
}

using GroupKey = std::tuple<double, Difficulty, RaceType>;

}  // namespace

std::vector<RankedOptimizer> RankHideTheLabel(const OptimizerAggregates& aggs, usize top_n) {
  std::vector<RankedOptimizer> out;
  for (const auto& kv : aggs) {
    const auto* s = std::get_if<OptimizerSummary>(&kv.second);
    if (!s) continue;
    out.push_back(RankedOptimizer{kv.first, s->mean_steps, s->count});
  }
  std::sort(out.begin(), out.end(), [](const RankedOptimizer& a, const RankedOptimizer& b) {
    if (a.score != b.score) return a.score < b.score;
    return a.name < b.name;
  });
  Truncate(&out, top_n);
  return out;
}

std::vector<RankedOptimizer> RankOpenRace(const OptimizerAggregates& aggs, usize top_n) {
  std::vector<RankedOptimizer> out;
  for (const auto& kv : aggs) {
    const auto* t = std::get_if<OptimizerTrajectory>(&kv.second);
    if (!t) continue;
    out.push_back(RankedOptimizer{kv.first, t->FinalBest(), static_cast<u64>(t->values.size())});
  }
  std::sort(out.begin(), out.end(), [](const RankedOptimizer& a, const RankedOptimizer& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.name < b.name;
  });
  Truncate(&out, top_n);
  return out;
}

std::vector<RankedOptimizer> Rank(const Coordinate& coord, const OptimizerAggregates& aggs, usize top_n) {
  return coord.race_type == RaceType::HideTheLabel ? RankHideTheLabel(aggs, top_n)
                                                   : RankOpenRace(aggs, top_n);
}

CoverageReport CheckCoverage(const ResultStore& store) {
  // (hidden, difficulty, race) -> batch -> datasets with data
  std::map<GroupKey, std::map<i32, std::set<std::string>>> present;
  for (const auto& kv : store) {
    const Coordinate& c = kv.first;
    if (kv.second.empty()) continue;
    present[GroupKey{c.hidden_fraction, c.difficulty, c.race_type}][c.batch_size].insert(c.dataset);
  }

  CoverageReport rep;
  for (double h : io::kHiddenFractions) {
    for (Difficulty d : {Difficulty::Regular, Difficulty::Hard}) {
      for (RaceType r : {RaceType::HideTheLabel, RaceType::OpenRace}) {
        auto group = present.find(GroupKey{h, d, r});
        for (i32 b : io::kBatchSizes) {
          const bool has = group != present.end() && group->second.count(b) > 0;
          if (!has) rep.empty_cells.push_back(GridCell{h, d, r, b});
        }
      }
    }
  }

  for (const auto& group : present) {
    std::set<std::string> all;
    for (const auto& batch : group.second) all.insert(batch.second.begin(), batch.second.end());
    for (const auto& batch : group.second) {
      for (const std::string& ds : all) {
        if (batch.second.count(ds)) continue;
        Coordinate c;
        std::tie(c.hidden_fraction, c.difficulty, c.race_type) = group.first;
        c.batch_size = batch.first;
        c.dataset = ds;
        rep.missing_datasets.push_back(std::move(c));
      }
    }
  }
  return rep;
}

std::vector<MissingOptimizer> CheckRequiredOptimizers(const ResultStore& store,
                                                      const std::vector<std::string>& required) {
  std::vector<MissingOptimizer> out;
  for (const auto& kv : store) {
    for (const std::string& name : required) {
      if (kv.second.find(name) == kv.second.end()) out.push_back(MissingOptimizer{kv.first, name});
    }
  }
  return out;
}

std::string FormatRankings(const ResultStore& store, usize top_n) {
  std::ostringstream oss;
  for (const auto& kv : store) {
    const Coordinate& c = kv.first;
    oss << CellLabel(c.hidden_fraction, c.difficulty, c.race_type, c.batch_size) << " dataset="
        << c.dataset << "\n";
    const auto ranked = Rank(c, kv.second, top_n);
    for (usize i = 0; i < ranked.size(); ++i) {
      oss << "  " << std::setw(2) << (i + 1) << ". " << std::left << std::setw(24) << ranked[i].name
          << std::right << std::fixed << std::setprecision(3) << ranked[i].score
          << (c.race_type == RaceType::HideTheLabel ? "  (n=" : "  (steps=") << ranked[i].support << ")\n";
      oss.unsetf(std::ios::floatfield);
    }
  }
  return oss.str();
}

std::string FormatCoverage(const CoverageReport& coverage) {
  std::ostringstream oss;
  if (coverage.Complete()) {
    oss << "coverage: complete\n";
    return oss.str();
  }
  if (!coverage.empty_cells.empty()) {
    oss << "empty grid cells (" << coverage.empty_cells.size() << "):\n";
    for (const GridCell& g : coverage.empty_cells) {
      oss << "  " << CellLabel(g.hidden_fraction, g.difficulty, g.race_type, g.batch_size) << "\n";
    }
  }
  if (!coverage.missing_datasets.empty()) {
    oss << "datasets missing from some batch sizes (" << coverage.missing_datasets.size() << "):\n";
    for (const Coordinate& c : coverage.missing_datasets) {
      oss << "  " << CellLabel(c.hidden_fraction, c.difficulty, c.race_type, c.batch_size)
          << " dataset=" << c.dataset << "\n";
    }
  }
  return oss.str();
}

std::string FormatStoreSummary(const ResultStore& store) {
  usize summaries = 0;
  usize trajectories = 0;
  std::set<std::string> optimizers;
  std::set<std::string> datasets;
  for (const auto& kv : store) {
    datasets.insert(kv.first.dataset);
    for (const auto& opt : kv.second) {
      optimizers.insert(opt.first);
      if (std::holds_alternative<OptimizerSummary>(opt.second)) {
        ++summaries;
      } else {
        ++trajectories;
      }
    }
  }

  std::ostringstream oss;
  oss << "coordinates: " << store.CoordinateCount() << "\n"
      << "entries: " << store.Size() << " (" << summaries << " summaries, " << trajectories
      << " trajectories)\n"
      << "datasets: " << datasets.size() << "\n"
      << "optimizers: " << optimizers.size();
  if (!optimizers.empty()) {
    oss << " [";
    usize i = 0;
    for (const auto& name : optimizers) oss << (i++ ? ", " : "") << name;
    oss << "]";
  }
  oss << "\n";
  return oss.str();
}

}  // namespace report
}  // namespace orr

#pragma once
// orr/report/rankings.h
//
// Read-only views over a finished ResultStore: leaderboards per coordinate,
// grid coverage and required-optimizer checks, plus text renderings used by
// orr_aggregate --rankings and orr_report.

#include "orr/core/types.h"
#include "orr/store/result_store.h"

#include <string>
#include <vector>

namespace orr {
namespace report {

struct RankedOptimizer {
  std::string name;
  double score = 0.0;  // mean steps (Hide_The_Label) or final best value (Open_Race)
  u64 support = 0;     // contributing trials, or trajectory length
};

// Ascending by mean steps, ties by name. top_n == 0 keeps everything.
std::vector<RankedOptimizer> RankHideTheLabel(const OptimizerAggregates& aggs, usize top_n = 0);

// Descending by final best value, ties by name. top_n == 0 keeps everything.
std::vector<RankedOptimizer> RankOpenRace(const OptimizerAggregates& aggs, usize top_n = 0);

// Dispatches on coord.race_type.
std::vector<RankedOptimizer> Rank(const Coordinate& coord, const OptimizerAggregates& aggs, usize top_n = 0);

struct GridCell {
  double hidden_fraction = 0.0;
  Difficulty difficulty = Difficulty::Unknown;
  RaceType race_type = RaceType::Unknown;
  i32 batch_size = 0;
};

struct CoverageReport {
  // Expected (hidden, difficulty, race, batch) cells holding no dataset.
  std::vector<GridCell> empty_cells;

  // Coordinates whose dataset appears under another batch size of the same
  // (hidden, difficulty, race) but not under this one.
  std::vector<Coordinate> missing_datasets;

  bool Complete() const { return empty_cells.empty() && missing_datasets.empty(); }
};

CoverageReport CheckCoverage(const ResultStore& store);

struct MissingOptimizer {
  Coordinate coord;
  std::string optimizer;
};

// Every populated coordinate lacking one of `required`.
std::vector<MissingOptimizer> CheckRequiredOptimizers(const ResultStore& store,
                                                      const std::vector<std::string>& required);

std::string FormatRankings(const ResultStore& store, usize top_n);
std::string FormatCoverage(const CoverageReport& coverage);
std::string FormatStoreSummary(const ResultStore& store);

}  // namespace report
}  // namespace orr

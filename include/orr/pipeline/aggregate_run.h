#pragma once
// orr/pipeline/aggregate_run.h
//
// One aggregation run: discover -> load + normalize (per file, optionally
// parallel) -> reduce into a ResultStore on the calling thread.
//
// Files are independent, so workers only fill their own pre-sized slot. The
// reducer then walks slots in path order, which makes the store (and its
// serialization) identical for every thread count.

#include "orr/core/config.h"
#include "orr/core/timer.h"
#include "orr/core/types.h"
#include "orr/records/schema_normalizer.h"
#include "orr/store/result_store.h"

#include <array>
#include <string>
#include <vector>

namespace orr {
namespace pipeline {

struct FileFailure {
  std::string path;
  std::string error;
};

struct RunReport {
  usize files_discovered = 0;
  usize files_skipped = 0;  // no usable batch size
  usize files_ok = 0;
  usize files_failed = 0;   // unreadable or invalid JSON
  usize records = 0;        // trial records normalized
  usize replaced = 0;       // store entries overwritten during the reduce

  // Indexed by DocumentShape.
  std::array<usize, kNumDocumentShapes> shapes{};

  std::vector<FileFailure> failures;
  PhaseRecorder phases;

  std::string ToJsonLite() const;
};

// Aggregates the tree under config.input.root into `store`, combining files
// that share a coordinate according to config.run.merge. Per-file failures
// are logged, recorded in `report` and skipped. Fails only when the input
// root cannot be walked.
bool RunAggregation(const Config& config,
                    ResultStore* store,
                    RunReport* report,
                    std::string* err = nullptr);

// Flat mode: pools every *.json directly inside `dir` as one race type.
bool AggregateDirectory(const std::string& dir,
                        RaceType race,
                        i32 threads,
                        OptimizerAggregates* out,
                        RunReport* report,
                        std::string* err = nullptr);

}  // namespace pipeline
}  // namespace orr

// src/pipeline/aggregate_run.cpp

#include "orr/pipeline/aggregate_run.h"

#include "orr/aggregate/steps_to_target.h"
#include "orr/aggregate/trajectory.h"
#include "orr/core/logging.h"
#include "orr/io/json.h"
#include "orr/io/result_files.h"

#include <algorithm>
#include <atomic>
#include <map>
#include <sstream>
#include <thread>
#include <utility>

namespace orr {
namespace pipeline {

namespace {

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

struct FileSlot {
  bool ok = false;
  std::string error;
  NormalizeResult norm;
};

// Runs fn(i) for i in [0, n) on up to `threads` workers that claim indices
// from a shared counter.
template <class Fn>
void ParallelFor(usize n, i32 threads, Fn&& fn) {
  const usize workers_wanted = std::min<usize>(static_cast<usize>(std::max(threads, 1)), n);
  if (workers_wanted <= 1) {
    for (usize i = 0; i < n; ++i) fn(i);
    return;
  }

  std::atomic<usize> next{0};
  std::vector<std::thread> workers;
  workers.reserve(workers_wanted);
  for (usize t = 0; t < workers_wanted; ++t) {
    workers.emplace_back([&]() {
      while (true) {
        const usize i = next.fetch_add(1);
        if (i >= n) break;
        fn(i);
      }
    });
  }
  for (auto& w : workers) w.join();
}

std::vector<FileSlot> LoadAndNormalize(const std::vector<std::string>& paths,
                                       const std::vector<RaceType>& races,
                                       i32 threads) {
  std::vector<FileSlot> slots(paths.size());
  ParallelFor(paths.size(), threads, [&](usize i) {
    FileSlot& slot = slots[i];
    json::Value doc;
    if (!io::LoadDocument(paths[i], &doc, &slot.error)) return;
    slot.norm = Normalize(doc, races[i]);
    slot.ok = true;
  });
  return slots;
}

// Folds per-file outcomes into the report; failed files are logged.
void Tally(const std::vector<std::string>& paths, const std::vector<FileSlot>& slots, RunReport* report) {
  for (usize i = 0; i < slots.size(); ++i) {
    const FileSlot& s = slots[i];
    if (!s.ok) {
      ++report->files_failed;
      report->failures.push_back(FileFailure{paths[i], s.error});
      ORR_LOG_WARN("skipping file:", s.error);
      continue;
    }
    ++report->files_ok;
    report->records += s.norm.records.size();
    ++report->shapes[static_cast<usize>(s.norm.shape)];
    ORR_LOG_DEBUG("processed", paths[i], "shape=" + std::string(ToString(s.norm.shape)),
                  "competitions=" + std::to_string(s.norm.competitions),
                  "records=" + std::to_string(s.norm.records.size()));
  }
}

usize AggregateInto(ResultStore* store, const Coordinate& coord, Span<const TrialRecord> records) {
  if (coord.race_type == RaceType::HideTheLabel) {
    return store->Merge(coord, AggregateStepsToTarget(records));
  }
  return store->Merge(coord, AggregateTrajectories(records));
}

}  // namespace

std::string RunReport::ToJsonLite() const {
  std::ostringstream oss;
  oss << "{"
      << "\"files_discovered\":" << files_discovered << ","
      << "\"files_skipped\":" << files_skipped << ","
      << "\"files_ok\":" << files_ok << ","
      << "\"files_failed\":" << files_failed << ","
      << "\"records\":" << records << ","
      << "\"replaced\":" << replaced << ","
      << "\"shapes\":{";
  for (usize i = 0; i < shapes.size(); ++i) {
    if (i) oss << ",";
    oss << "\"" << ToString(static_cast<DocumentShape>(i)) << "\":" << shapes[i];
  }
  oss << "},\"phases\":" << phases.ToJsonMillis() << "}";
  return oss.str();
}

bool RunAggregation(const Config& config, ResultStore* store, RunReport* report, std::string* err) {
  if (!store || !report) {
    SetErr(err, "RunAggregation: store and report must be non-null");
    return false;
  }

  io::DiscoveryResult found;
  {
    PhaseRecorder::ScopedPhase phase(&report->phases, "discover");
    if (!io::DiscoverResultFiles(config.input.root, &found, err)) return false;
  }
  report->files_discovered = found.files.size() + found.skipped;
  report->files_skipped = found.skipped;
  ORR_LOG_INFO("discovered", found.files.size(), "result files under", config.input.root,
               "(" + std::to_string(found.skipped) + " skipped)");

  std::vector<std::string> paths;
  std::vector<RaceType> races;
  paths.reserve(found.files.size());
  races.reserve(found.files.size());
  for (const auto& f : found.files) {
    paths.push_back(f.path);
    races.push_back(f.coord.race_type);
  }

  std::vector<FileSlot> slots;
  {
    PhaseRecorder::ScopedPhase phase(&report->phases, "load");
    slots = LoadAndNormalize(paths, races, config.sys.threads);
  }
  Tally(paths, slots, report);

  PhaseRecorder::ScopedPhase phase(&report->phases, "reduce");
  if (config.run.merge == MergePolicy::Overwrite) {
    for (usize i = 0; i < slots.size(); ++i) {
      if (!slots[i].ok) continue;
      const usize replaced = AggregateInto(store, found.files[i].coord, slots[i].norm.records);
      if (replaced) ORR_LOG_DEBUG(paths[i], "replaced", replaced, "optimizer entries");
      report->replaced += replaced;
    }
  } else {
    std::map<Coordinate, std::vector<TrialRecord>> pooled;
    for (usize i = 0; i < slots.size(); ++i) {
      if (!slots[i].ok) continue;
      auto& dst = pooled[found.files[i].coord];
      auto& src = slots[i].norm.records;
      dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
    }
    for (const auto& kv : pooled) {
      report->replaced += AggregateInto(store, kv.first, kv.second);
    }
  }

  ORR_LOG_INFO("aggregated", store->Size(), "optimizer entries at", store->CoordinateCount(),
               "coordinates;", report->files_ok, "ok,", report->files_failed, "failed");
  return true;
}

bool AggregateDirectory(const std::string& dir,
                        RaceType race,
                        i32 threads,
                        OptimizerAggregates* out,
                        RunReport* report,
                        std::string* err) {
  if (!out || !report) {
    SetErr(err, "AggregateDirectory: out and report must be non-null");
    return false;
  }
  if (race == RaceType::Unknown) {
    SetErr(err, "AggregateDirectory: race type must be Hide_The_Label or Open_Race");
    return false;
  }

  std::vector<std::string> paths;
  {
    PhaseRecorder::ScopedPhase phase(&report->phases, "discover");
    if (!io::ListJsonFiles(dir, &paths, err)) return false;
  }
  report->files_discovered = paths.size();
  ORR_LOG_INFO("found", paths.size(), "json files in", dir);

  std::vector<FileSlot> slots;
  {
    PhaseRecorder::ScopedPhase phase(&report->phases, "load");
    slots = LoadAndNormalize(paths, std::vector<RaceType>(paths.size(), race), threads);
  }
  Tally(paths, slots, report);

  PhaseRecorder::ScopedPhase phase(&report->phases, "reduce");
  std::vector<TrialRecord> records;
  for (auto& s : slots) {
    if (!s.ok) continue;
    records.insert(records.end(), std::make_move_iterator(s.norm.records.begin()),
                   std::make_move_iterator(s.norm.records.end()));
  }

  out->clear();
  if (race == RaceType::HideTheLabel) {
    for (auto& kv : AggregateStepsToTarget(records)) out->emplace(kv.first, kv.second);
  } else {
    for (auto& kv : AggregateTrajectories(records)) out->emplace(kv.first, std::move(kv.second));
  }
  return true;
}

}  // namespace pipeline
}  // namespace orr

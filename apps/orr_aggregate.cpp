// apps/orr_aggregate.cpp
//
// Builds the playground artifact from a tree of optimizer-race results:
//   - discover <root>/hiddenfracNN*/<Mode>_Mode*/<Race>/*.json
//   - normalize every document into trial records
//   - aggregate per coordinate (steps-to-target summaries or trajectories)
//   - write one nested JSON artifact
//
// Examples:
//   ./orr_aggregate --input=Result_Official --out=landing_page/playground_data.json
//   ./orr_aggregate --input=Result_Official --threads=8 --merge=overwrite --rankings=3
//
//   # One directory, one race type, flat optimizer -> aggregate output.
//   ./orr_aggregate --flat_dir=results/hiddenfrac99/Open_Race --race=Open_Race --out=open.json

#include "orr/core/config.h"
#include "orr/core/logging.h"
#include "orr/core/timer.h"
#include "orr/core/types.h"

#include "orr/io/store_json.h"
#include "orr/pipeline/aggregate_run.h"
#include "orr/report/rankings.h"

#include <iostream>
#include <string>

namespace orr {
namespace apps {

namespace {

inline bool IsHelpRequested(const orr::ArgMap& args) {
  return args.Has("help") || args.Has("h") || args.Has("-h") || args.Has("--help");
}

inline void PrintUsage() {
  std::cerr
      << "orr_aggregate: optimizer race result aggregation\n\n"
      << "Tree mode:\n"
      << "  --input=<root>          (contains hiddenfrac95*/ and hiddenfrac99*/)\n"
      << "  --merge=<pool|overwrite> (files sharing a coordinate; default pool)\n"
      << "  --empty_grid=0|1        (emit the full expected grid; default 1)\n"
      << "  --rankings=<N>          (print top-N per coordinate; 0 disables)\n"
      << "\nFlat mode:\n"
      << "  --flat_dir=<dir>        (every *.json of one directory)\n"
      << "  --race=<Hide_The_Label|Open_Race>\n"
      << "\nCommon flags:\n"
      << "  --out=<file>            (default: playground_data.json)\n"
      << "  --threads=<N>           (file-level parallelism; default 1)\n"
      << "  --log_level=<trace|debug|info|warn|error|off>\n"
      << "  --log_timestamp=0|1 --log_thread=0|1\n"
      << "\n";
}

int RunFlat(const orr::Config& cfg) {
  orr::OptimizerAggregates aggs;
  orr::pipeline::RunReport report;
  std::string err;
  if (!orr::pipeline::AggregateDirectory(cfg.input.flat_dir, cfg.input.race, cfg.sys.threads,
                                         &aggs, &report, &err)) {
    ORR_LOG_ERROR("Aggregation failed:", err);
    return 3;
  }
  ORR_LOG_INFO("Run report:", report.ToJsonLite());

  if (!orr::io::WriteAggregatesJson(aggs, cfg.output.out_path, &err)) {
    ORR_LOG_ERROR("Cannot write output:", err);
    return 5;
  }
  ORR_LOG_INFO("Wrote", aggs.size(), "optimizers to:", cfg.output.out_path);
  return 0;
}

int RunTree(const orr::Config& cfg) {
  orr::ResultStore store;
  orr::pipeline::RunReport report;
  std::string err;
  if (!orr::pipeline::RunAggregation(cfg, &store, &report, &err)) {
    ORR_LOG_ERROR("Aggregation failed:", err);
    return 3;
  }
  ORR_LOG_INFO("Run report:", report.ToJsonLite());
  if (report.files_failed > 0) {
    ORR_LOG_WARN(report.files_failed, "file(s) could not be processed; output omits them");
  }

  orr::io::StoreJsonOptions options;
  options.include_empty_grid = cfg.output.include_empty_grid;
  {
    orr::Stopwatch sw;
    if (!orr::io::WriteStoreJson(store, options, cfg.output.out_path, &err)) {
      ORR_LOG_ERROR("Cannot write output:", err);
      return 5;
    }
    ORR_LOG_DEBUG("write_ms=", sw.ElapsedMillis());
  }
  ORR_LOG_INFO("Wrote artifact to:", cfg.output.out_path);

  std::cout << orr::report::FormatStoreSummary(store);
  if (cfg.output.rankings_top > 0) {
    std::cout << "\n" << orr::report::FormatRankings(store, static_cast<orr::usize>(cfg.output.rankings_top));
  }
  return 0;
}

}  // namespace

}  // namespace apps
}  // namespace orr

int main(int argc, char** argv) {
  orr::ArgMap args = orr::ArgMap::FromArgv(argc, argv);
  if (orr::apps::IsHelpRequested(args)) {
    orr::apps::PrintUsage();
    return 0;
  }

  orr::Config cfg = orr::Config::FromArgMap(args);
  orr::Logger::Instance().SetConfig(cfg.logging);

  std::string err;
  if (!cfg.Validate(&err)) {
    ORR_LOG_ERROR("Config validation failed:", err);
    orr::apps::PrintUsage();
    return 2;
  }
  for (const auto& kv : cfg.run.extra) {
    ORR_LOG_WARN("Ignoring unknown flag:", "--" + kv.first);
  }
  ORR_LOG_DEBUG("Config:", cfg.ToJsonLite());

  return cfg.FlatMode() ? orr::apps::RunFlat(cfg) : orr::apps::RunTree(cfg);
}

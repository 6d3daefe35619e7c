// apps/orr_report.cpp
//
// Inspects an artifact written by orr_aggregate:
//   - store summary (coordinates, optimizers, datasets)
//   - optional top-N rankings per coordinate
//   - optional grid coverage report
//   - optional required-optimizer check (non-zero exit when one is missing)
//
// Exit codes: 0 ok, 1 required optimizer missing, 2 usage error, 3 unreadable artifact.
//
// Example:
//   ./orr_report --input=playground_data.json --top=3 --require=RANDOM,DBO --coverage=1

#include "orr/core/config.h"
#include "orr/core/logging.h"
#include "orr/core/types.h"

#include "orr/io/store_json.h"
#include "orr/report/rankings.h"

#include <iostream>
#include <string>
#include <vector>

namespace orr {
namespace apps {

namespace {

inline bool IsHelpRequested(const orr::ArgMap& args) {
  return args.Has("help") || args.Has("h") || args.Has("-h") || args.Has("--help");
}

inline void PrintUsage() {
  std::cerr
      << "orr_report: inspect an aggregated optimizer race artifact\n\n"
      << "Flags:\n"
      << "  --input=<artifact.json>\n"
      << "  --top=<N>               (rankings per coordinate; 0 disables, default 0)\n"
      << "  --require=A,B,C         (optimizers every populated coordinate must have)\n"
      << "  --coverage=0|1          (report empty grid cells and dataset gaps)\n"
      << "  --log_level=<trace|debug|info|warn|error|off>\n"
      << "\n";
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

  // Only the logging section of the shared config applies here.
  orr::Logger::Instance().SetConfig(orr::Config::FromArgMap(args).logging);

  std::string input;
  if (auto v = args.Get("input")) input = std::string(*v);
  if (input.empty() && !args.Positional().empty()) input = args.Positional().front();
  if (input.empty()) {
    ORR_LOG_ERROR("--input is required");
    orr::apps::PrintUsage();
    return 2;
  }

  orr::i32 top = 0;
  if (auto v = args.Get("top")) {
    if (!orr::detail::ParseI32(*v, &top) || top < 0) {
      ORR_LOG_ERROR("--top must be a non-negative integer, got:", *v);
      return 2;
    }
  }

  bool coverage = false;
  if (auto v = args.Get("coverage")) {
    if (!orr::detail::ParseBool(*v, &coverage)) {
      ORR_LOG_ERROR("--coverage must be 0 or 1, got:", *v);
      return 2;
    }
  }

  std::vector<std::string> required;
  if (auto v = args.Get("require")) required = orr::detail::SplitList(*v);

  orr::ResultStore store;
  std::string err;
  if (!orr::io::ReadStoreJson(input, &store, &err)) {
    ORR_LOG_ERROR("Cannot read artifact:", err);
    return 3;
  }
  ORR_LOG_INFO("Loaded", store.Size(), "entries from", input);

  std::cout << orr::report::FormatStoreSummary(store);
  if (top > 0) {
    std::cout << "\n" << orr::report::FormatRankings(store, static_cast<orr::usize>(top));
  }
  if (coverage) {
    std::cout << "\n" << orr::report::FormatCoverage(orr::report::CheckCoverage(store));
  }

  if (!required.empty()) {
    const auto missing = orr::report::CheckRequiredOptimizers(store, required);
    for (const auto& m : missing) {
      std::cout << "missing " << m.optimizer << " at " << m.coord << "\n";
    }
    if (!missing.empty()) {
      ORR_LOG_WARN(missing.size(), "required optimizer entries are missing");
      return 1;
    }
  }
  return 0;
}

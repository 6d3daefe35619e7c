#pragma once
// orr/core/config.h
//
// Run configuration for the aggregation and reporting tools.
//
// Convention:
//  - CLI uses --key=value or --key value (e.g., --input=Result_Official --threads 4).
//  - Unknown keys are stored into `run.extra` so tools can read their own knobs
//    (e.g. orr_report's --require) without breaking the shared parser.

#include "orr/core/logging.h"
#include "orr/core/types.h"

#include <exception>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace orr {

// How separate input files that land on the same coordinate are combined.
enum class MergePolicy : u8 {
  Pool = 0,       // pool trial records of all files, aggregate once
  Overwrite = 1,  // aggregate each file alone; later files replace earlier ones
  Unknown = 255,
};

inline constexpr std::string_view ToString(MergePolicy p) noexcept {
  switch (p) {
    case MergePolicy::Pool: return "pool";
    case MergePolicy::Overwrite: return "overwrite";
    case MergePolicy::Unknown: return "unknown";
  }
  return "unknown";
}

inline bool ParseMergePolicy(std::string_view s, MergePolicy* out) noexcept {
  if (!out) return false;
  if (detail::EqualsIgnoreCase(s, "pool")) { *out = MergePolicy::Pool; return true; }
  if (detail::EqualsIgnoreCase(s, "overwrite") || detail::EqualsIgnoreCase(s, "last_writer_wins")) {
    *out = MergePolicy::Overwrite;
    return true;
  }
  *out = MergePolicy::Unknown;
  return false;
}

// --------------------------
// Small key/value argument map
// --------------------------
class ArgMap {
 public:
  ArgMap() = default;

  static ArgMap FromArgv(int argc, char** argv) {
    ArgMap m;
    for (int i = 1; i < argc; ++i) {
      std::string_view token(argv[i]);
      if (token.rfind("-", 0) != 0) {
        m.positional_.push_back(std::string(token));
        continue;
      }
      token.remove_prefix(token.rfind("--", 0) == 0 ? 2 : 1);

      const auto eq_pos = token.find('=');
      if (eq_pos != std::string_view::npos) {
        m.kv_[std::string(token.substr(0, eq_pos))] = std::string(token.substr(eq_pos + 1));
        continue;
      }
      // If next arg exists and isn't another flag, treat as value; else as boolean flag = true.
      const std::string key(token);
      if (i + 1 < argc && std::string_view(argv[i + 1]).rfind("-", 0) != 0) {
        m.kv_[key] = std::string(argv[i + 1]);
        ++i;
      } else {
        m.kv_[key] = "true";
      }
    }
    return m;
  }

  bool Has(std::string_view key) const {
    return kv_.find(std::string(key)) != kv_.end();
  }

  std::optional<std::string_view> Get(std::string_view key) const {
    auto it = kv_.find(std::string(key));
    if (it == kv_.end()) return std::nullopt;
    return std::string_view(it->second);
  }

  const std::unordered_map<std::string, std::string>& KV() const { return kv_; }
  const std::vector<std::string>& Positional() const { return positional_; }

 private:
  std::unordered_map<std::string, std::string> kv_;
  std::vector<std::string> positional_;
};

namespace detail {

inline bool ParseBool(std::string_view s, bool* out) noexcept {
  if (!out) return false;
  if (s.empty()) return false;
  if (EqualsIgnoreCase(s, "1") || EqualsIgnoreCase(s, "true") || EqualsIgnoreCase(s, "yes") ||
      EqualsIgnoreCase(s, "y") || EqualsIgnoreCase(s, "on")) {
    *out = true;
    return true;
  }
  if (EqualsIgnoreCase(s, "0") || EqualsIgnoreCase(s, "false") || EqualsIgnoreCase(s, "no") ||
      EqualsIgnoreCase(s, "n") || EqualsIgnoreCase(s, "off")) {
    *out = false;
    return true;
  }
  return false;
}

inline bool ParseI32(std::string_view s, i32* out) {
  if (!out) return false;
  if (s.empty()) return false;
  try {
    std::size_t idx = 0;
    const long v = std::stol(std::string(s), &idx, 10);
    if (idx != s.size()) return false;
    *out = static_cast<i32>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// Split "A,B,,C" into {"A","B","C"} (empty items dropped).
inline std::vector<std::string> SplitList(std::string_view s, char sep = ',') {
  std::vector<std::string> out;
  while (!s.empty()) {
    const auto pos = s.find(sep);
    const std::string_view item = s.substr(0, pos);
    if (!item.empty()) out.emplace_back(item);
    if (pos == std::string_view::npos) break;
    s.remove_prefix(pos + 1);
  }
  return out;
}

inline void StoreExtras(const std::unordered_map<std::string, std::string>& all_kv,
                        const std::vector<std::string>& known_keys,
                        std::unordered_map<std::string, std::string>* out_extra) {
  if (!out_extra) return;
  out_extra->clear();
  for (const auto& kv : all_kv) {
    bool known = false;
    for (const auto& kk : known_keys) {
      if (kv.first == kk) { known = true; break; }
    }
    if (!known) (*out_extra)[kv.first] = kv.second;
  }
}

}  // namespace detail

struct InputConfig {
  // Root of the hiddenfracNN/<Mode>_Mode/<Race>/ tree.
  std::string root;

  // Flat mode: aggregate every *.json of one directory for a single race type.
  std::string flat_dir;
  RaceType race = RaceType::Unknown;
};

struct RunConfig {
  MergePolicy merge = MergePolicy::Pool;

  std::unordered_map<std::string, std::string> extra;
};

struct OutputConfig {
  std::string out_path = "playground_data.json";

  // Emit the full expected grid with empty objects where no data exists.
  bool include_empty_grid = true;

  // Print the top-N rankings per coordinate after the run (0 = disabled).
  i32 rankings_top = 0;
};

struct SystemConfig {
  i32 threads = 1;
};

struct Config {
  InputConfig input;
  RunConfig run;
  OutputConfig output;
  SystemConfig sys;
  LoggingConfig logging;

  bool FlatMode() const { return !input.flat_dir.empty(); }

  // Validate basic constraints; returns false and sets err on failure.
  bool Validate(std::string* err = nullptr) const {
    auto fail = [&](std::string_view msg) {
      if (err) *err = std::string(msg);
      return false;
    };

    if (input.root.empty() && input.flat_dir.empty()) return fail("one of --input or --flat_dir must be set");
    if (!input.root.empty() && !input.flat_dir.empty()) return fail("--input and --flat_dir are mutually exclusive");
    if (FlatMode() && input.race == RaceType::Unknown) {
      return fail("--flat_dir requires --race=Hide_The_Label|Open_Race");
    }
    if (run.merge == MergePolicy::Unknown) return fail("run.merge must be pool or overwrite");
    if (output.out_path.empty()) return fail("output.out_path must not be empty");
    if (output.rankings_top < 0) return fail("output.rankings_top must be >= 0");
    if (sys.threads <= 0) return fail("sys.threads must be > 0");
    return true;
  }

  std::string ToJsonLite() const {
    std::ostringstream oss;
    oss << "{"
        << "\"input\":{\"root\":\"" << input.root << "\","
        << "\"flat_dir\":\"" << input.flat_dir << "\","
        << "\"race\":\"" << ToString(input.race) << "\"},"
        << "\"run\":{\"merge\":\"" << ToString(run.merge) << "\"},"
        << "\"output\":{\"out_path\":\"" << output.out_path << "\","
        << "\"include_empty_grid\":" << (output.include_empty_grid ? "true" : "false") << ","
        << "\"rankings_top\":" << output.rankings_top << "},"
        << "\"sys\":{\"threads\":" << sys.threads << "},"
        << "\"logging\":{\"level\":\"" << ToString(logging.level) << "\","
        << "\"with_timestamp\":" << (logging.with_timestamp ? "true" : "false") << ","
        << "\"with_thread_id\":" << (logging.with_thread_id ? "true" : "false") << "}"
        << "}";
    return oss.str();
  }

  // Parse from CLI arguments. Unknown args go into `run.extra`.
  static Config FromArgs(int argc, char** argv) {
    return FromArgMap(ArgMap::FromArgv(argc, argv));
  }

  static Config FromArgMap(const ArgMap& args) {
    Config cfg;

    const std::vector<std::string> known = {
        "input", "flat_dir", "race",
        "merge",
        "out", "empty_grid", "rankings",
        "threads",
        "log_level", "log_timestamp", "log_thread",
    };

    // ------------- input -------------
    if (auto v = args.Get("input")) cfg.input.root = std::string(*v);
    if (auto v = args.Get("flat_dir")) cfg.input.flat_dir = std::string(*v);
    if (auto v = args.Get("race")) ParseRaceType(*v, &cfg.input.race);

    // ------------- run -------------
    if (auto v = args.Get("merge")) ParseMergePolicy(*v, &cfg.run.merge);

    // ------------- output -------------
    if (auto v = args.Get("out")) cfg.output.out_path = std::string(*v);
    if (auto v = args.Get("empty_grid")) detail::ParseBool(*v, &cfg.output.include_empty_grid);
    if (auto v = args.Get("rankings")) detail::ParseI32(*v, &cfg.output.rankings_top);

    // ------------- system -------------
    if (auto v = args.Get("threads")) detail::ParseI32(*v, &cfg.sys.threads);

    // ------------- logging -------------
    if (auto v = args.Get("log_level")) {
      LogLevel lvl;
      if (ParseLogLevel(*v, &lvl)) cfg.logging.level = lvl;
    }
    if (auto v = args.Get("log_timestamp")) detail::ParseBool(*v, &cfg.logging.with_timestamp);
    if (auto v = args.Get("log_thread")) detail::ParseBool(*v, &cfg.logging.with_thread_id);

    detail::StoreExtras(args.KV(), known, &cfg.run.extra);
    return cfg;
  }
};

}  // namespace orr

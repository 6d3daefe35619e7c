// src/io/store_json.cpp

#include "orr/io/store_json.h"

#include "orr/core/config.h"
#include "orr/io/result_files.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <sstream>
#include <utility>
#include <variant>

namespace orr {
namespace io {

namespace {

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

inline bool EnsureParentDir(const std::string& path, std::string* err) {
  const std::filesystem::path dir = std::filesystem::path(path).parent_path();
  std::error_code ec;
  if (dir.empty()) return true;
  if (std::filesystem::exists(dir, ec)) {
    if (std::filesystem::is_directory(dir, ec)) return true;
    SetErr(err, "Path exists but is not a directory: " + dir.string());
    return false;
  }
  if (!std::filesystem::create_directories(dir, ec)) {
    SetErr(err, "Failed to create directory: " + dir.string() + " (" + ec.message() + ")");
    return false;
  }
  return true;
}

template <class Fn>
bool WriteFile(const std::string& path, std::string* err, Fn&& body) {
  if (!EnsureParentDir(path, err)) return false;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    SetErr(err, "Cannot open output file: " + path);
    return false;
  }
  body(out);
  out.flush();
  if (!out) {
    SetErr(err, "Write failed: " + path);
    return false;
  }
  return true;
}

// Ordered view of the store with grid cells filled in.
using DatasetLevel = std::map<std::string, const OptimizerAggregates*>;
using BatchLevel = std::map<i32, DatasetLevel>;
using RaceLevel = std::map<RaceType, BatchLevel>;
using DifficultyLevel = std::map<Difficulty, RaceLevel>;
using HiddenLevel = std::map<double, DifficultyLevel>;

HiddenLevel BuildTree(const ResultStore& store, bool include_empty_grid) {
  HiddenLevel tree;
  if (include_empty_grid) {
    for (double h : kHiddenFractions) {
      for (Difficulty d : {Difficulty::Regular, Difficulty::Hard}) {
        for (RaceType r : {RaceType::HideTheLabel, RaceType::OpenRace}) {
          for (i32 b : kBatchSizes) tree[h][d][r][b];
        }
      }
    }
  }
  for (const auto& kv : store) {
    const Coordinate& c = kv.first;
    tree[c.hidden_fraction][c.difficulty][c.race_type][c.batch_size][c.dataset] = &kv.second;
  }
  return tree;
}

void WriteSummary(json::Writer* w, const OptimizerSummary& s) {
  w->BeginObject();
  w->Key("mean_steps");
  w->Number(s.mean_steps);
  w->Key("median_steps");
  w->Number(s.median_steps);
  w->Key("std_steps");
  w->Number(s.std_steps);
  w->Key("min_steps");
  w->Number(s.min_steps);
  w->Key("max_steps");
  w->Number(s.max_steps);
  w->Key("count");
  w->Int(static_cast<i64>(s.count));
  w->EndObject();
}

void WriteTrajectory(json::Writer* w, const OptimizerTrajectory& t) {
  w->BeginObject();
  w->Key("steps");
  w->BeginArray();
  for (i64 s : t.steps) w->Int(s);
  w->EndArray();
  w->Key("values");
  w->BeginArray();
  for (double v : t.values) w->Number(v);
  w->EndArray();
  w->EndObject();
}

void WriteOptimizers(json::Writer* w, const OptimizerAggregates& aggs) {
  w->BeginObject();
  for (const auto& kv : aggs) {
    w->Key(kv.first);
    WriteAggregate(w, kv.second);
  }
  w->EndObject();
}

// --------------------------
// Reading
// --------------------------

// Largest count that a double holds exactly.
constexpr double kMaxExactCount = 9007199254740992.0;  // 2^53

bool ReadRequiredNumber(const json::Value& obj, std::string_view key, double* out, std::string* err) {
  const json::Value* v = obj.Find(key);
  if (!v || !v->IsNumber()) {
    SetErr(err, "summary leaf: missing numeric field '" + std::string(key) + "'");
    return false;
  }
  if (!std::isfinite(v->num)) {
    SetErr(err, "summary leaf: field '" + std::string(key) + "' is not finite");
    return false;
  }
  *out = v->num;
  return true;
}

bool ReadSummary(const json::Value& leaf, OptimizerSummary* out, std::string* err) {
  if (!leaf.IsObject()) {
    SetErr(err, "summary leaf is not an object");
    return false;
  }
  double count = 0.0;
  if (!ReadRequiredNumber(leaf, "mean_steps", &out->mean_steps, err) ||
      !ReadRequiredNumber(leaf, "median_steps", &out->median_steps, err) ||
      !ReadRequiredNumber(leaf, "min_steps", &out->min_steps, err) ||
      !ReadRequiredNumber(leaf, "max_steps", &out->max_steps, err) ||
      !ReadRequiredNumber(leaf, "count", &count, err)) {
    return false;
  }
  if (count < 1.0 || count > kMaxExactCount || std::floor(count) != count) {
    SetErr(err, "summary leaf: count must be an integer in [1, 2^53]");
    return false;
  }
  out->count = static_cast<u64>(count);
  // std_steps is optional for artifacts written without it.
  out->std_steps = 0.0;
  if (leaf.Find("std_steps") && !ReadRequiredNumber(leaf, "std_steps", &out->std_steps, err)) return false;
  return true;
}

bool ReadTrajectory(const json::Value& leaf, OptimizerTrajectory* out, std::string* err) {
  const json::Value* steps = leaf.Find("steps");
  const json::Value* values = leaf.Find("values");
  if (!steps || !steps->IsArray() || !values || !values->IsArray()) {
    SetErr(err, "trajectory leaf: 'steps' and 'values' arrays are required");
    return false;
  }
  if (steps->arr.size() != values->arr.size()) {
    SetErr(err, "trajectory leaf: 'steps' and 'values' differ in length");
    return false;
  }
  out->steps.clear();
  out->values.clear();
  out->steps.reserve(steps->arr.size());
  out->values.reserve(values->arr.size());
  for (usize i = 0; i < steps->arr.size(); ++i) {
    const json::Value& s = steps->arr[i];
    const json::Value& v = values->arr[i];
    if (!s.IsNumber() || !v.IsNumber()) {
      SetErr(err, "trajectory leaf: non-numeric entry at index " + std::to_string(i));
      return false;
    }
    // Steps are the dense grid 0..n-1; this also rejects NaN and fractions.
    if (s.num != static_cast<double>(i)) {
      SetErr(err, "trajectory leaf: steps must be 0, 1, 2, ...; index " + std::to_string(i) +
                      " holds " + json::FormatDouble(s.num));
      return false;
    }
    if (!std::isfinite(v.num)) {
      SetErr(err, "trajectory leaf: non-finite value at index " + std::to_string(i));
      return false;
    }
    out->steps.push_back(static_cast<i64>(i));
    out->values.push_back(v.num);
  }
  return true;
}

bool ParseHiddenKey(const std::string& key, double* out) {
  char* end = nullptr;
  const double v = std::strtod(key.c_str(), &end);
  if (key.empty() || end != key.c_str() + key.size() || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

bool ExpectObject(const json::Value& v, const std::string& where, std::string* err) {
  if (v.IsObject()) return true;
  SetErr(err, "expected an object at " + where);
  return false;
}

}  // namespace

void WriteAggregate(json::Writer* w, const Aggregate& agg) {
  if (const auto* s = std::get_if<OptimizerSummary>(&agg)) {
    WriteSummary(w, *s);
  } else {
    WriteTrajectory(w, std::get<OptimizerTrajectory>(agg));
  }
}

void WriteStore(std::ostream& os, const ResultStore& store, const StoreJsonOptions& options) {
  const HiddenLevel tree = BuildTree(store, options.include_empty_grid);

  json::Writer w(&os, options.indent);
  w.BeginObject();
  for (const auto& hidden : tree) {
    w.Key(json::FormatDouble(hidden.first));
    w.BeginObject();
    for (const auto& difficulty : hidden.second) {
      w.Key(ToString(difficulty.first));
      w.BeginObject();
      for (const auto& race : difficulty.second) {
        w.Key(ToString(race.first));
        w.BeginObject();
        for (const auto& batch : race.second) {
          w.Key(std::to_string(batch.first));
          w.BeginObject();
          for (const auto& dataset : batch.second) {
            w.Key(dataset.first);
            WriteOptimizers(&w, *dataset.second);
          }
          w.EndObject();
        }
        w.EndObject();
      }
      w.EndObject();
    }
    w.EndObject();
  }
  w.EndObject();
  os << "\n";
}

std::string StoreToJson(const ResultStore& store, const StoreJsonOptions& options) {
  std::ostringstream oss;
  WriteStore(oss, store, options);
  return oss.str();
}

bool WriteStoreJson(const ResultStore& store,
                    const StoreJsonOptions& options,
                    const std::string& path,
                    std::string* err) {
  return WriteFile(path, err, [&](std::ostream& os) { WriteStore(os, store, options); });
}

bool WriteAggregatesJson(const OptimizerAggregates& aggs, const std::string& path, std::string* err) {
  return WriteFile(path, err, [&](std::ostream& os) {
    json::Writer w(&os);
    WriteOptimizers(&w, aggs);
    os << "\n";
  });
}

bool StoreFromJson(const json::Value& root, ResultStore* out, std::string* err) {
  if (!out) {
    SetErr(err, "StoreFromJson: out is null");
    return false;
  }
  if (!ExpectObject(root, "top level", err)) return false;

  for (const auto& hidden : root.obj) {
    Coordinate c;
    if (!ParseHiddenKey(hidden.first, &c.hidden_fraction)) {
      SetErr(err, "invalid hidden fraction key: " + hidden.first);
      return false;
    }
    if (!ExpectObject(*hidden.second, hidden.first, err)) return false;

    for (const auto& difficulty : hidden.second->obj) {
      const std::string path_d = hidden.first + "/" + difficulty.first;
      if (!ParseDifficulty(difficulty.first, &c.difficulty)) {
        SetErr(err, "invalid difficulty key: " + path_d);
        return false;
      }
      if (!ExpectObject(*difficulty.second, path_d, err)) return false;

      for (const auto& race : difficulty.second->obj) {
        const std::string path_r = path_d + "/" + race.first;
        if (!ParseRaceType(race.first, &c.race_type)) {
          SetErr(err, "invalid race type key: " + path_r);
          return false;
        }
        if (!ExpectObject(*race.second, path_r, err)) return false;

        for (const auto& batch : race.second->obj) {
          const std::string path_b = path_r + "/" + batch.first;
          if (!detail::ParseI32(batch.first, &c.batch_size) || c.batch_size <= 0) {
            SetErr(err, "invalid batch size key: " + path_b);
            return false;
          }
          if (!ExpectObject(*batch.second, path_b, err)) return false;

          for (const auto& dataset : batch.second->obj) {
            const std::string path_ds = path_b + "/" + dataset.first;
            c.dataset = dataset.first;
            if (!ExpectObject(*dataset.second, path_ds, err)) return false;

            for (const auto& opt : dataset.second->obj) {
              std::string leaf_err;
              if (c.race_type == RaceType::HideTheLabel) {
                OptimizerSummary s;
                if (!ReadSummary(*opt.second, &s, &leaf_err)) {
                  SetErr(err, path_ds + "/" + opt.first + ": " + leaf_err);
                  return false;
                }
                out->Insert(c, opt.first, s);
              } else {
                OptimizerTrajectory t;
                if (!ReadTrajectory(*opt.second, &t, &leaf_err)) {
                  SetErr(err, path_ds + "/" + opt.first + ": " + leaf_err);
                  return false;
                }
                out->Insert(c, opt.first, std::move(t));
              }
            }
          }
        }
      }
    }
  }
  return true;
}

bool ReadStoreJson(const std::string& path, ResultStore* out, std::string* err) {
  json::Value root;
  std::string parse_err;
  if (!json::ParseFile(path, &root, &parse_err)) {
    SetErr(err, path + ": " + parse_err);
    return false;
  }
  return StoreFromJson(root, out, err);
}

}  // namespace io
}  // namespace orr

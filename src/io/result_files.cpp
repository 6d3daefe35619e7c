// src/io/result_files.cpp
//
// Result tree discovery and file-name metadata.

#include "orr/io/result_files.h"

#include "orr/core/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace orr {
namespace io {

namespace {

inline void SetErr(std::string* err, const std::string& msg) {
  if (err) *err = msg;
}

struct DatasetRule {
  std::string_view marker;
  std::string_view dataset;
};

// Ordered: the first matching marker names the dataset.
constexpr std::array<DatasetRule, 6> kDatasetRules = {{
    {"DBO_rat_myocyte", "rat_myocyte"},
    {"MOBO_rat_myocyte", "rat_myocyte"},
    {"Hela_regular_mode", "Hela_regular"},
    {"Hela_timesaving_mode", "Hela_timesaving"},
    {"T_Cell", "T_Cell"},
    {"TF_Cell", "TF_Cell"},
}};

bool Contains(std::string_view s, std::string_view needle) {
  return s.find(needle) != std::string_view::npos;
}

std::string_view DatasetFromName(std::string_view name) {
  for (const auto& r : kDatasetRules) {
    if (name.substr(0, r.marker.size()) == r.marker) return r.dataset;
  }
  for (const auto& r : kDatasetRules) {
    if (Contains(name, r.marker)) return r.dataset;
  }
  return "unknown";
}

// Digits right after `tag`, e.g. "Batch10_..." -> "10".
std::optional<i32> ParseTaggedInt(std::string_view name, std::string_view tag) {
  usize pos = name.find(tag);
  while (pos != std::string_view::npos) {
    usize i = pos + tag.size();
    i64 v = 0;
    usize digits = 0;
    while (i < name.size() && std::isdigit(static_cast<unsigned char>(name[i])) && digits < 9) {
      v = v * 10 + (name[i] - '0');
      ++i;
      ++digits;
    }
    if (digits > 0) return static_cast<i32>(v);
    pos = name.find(tag, pos + 1);
  }
  return std::nullopt;
}

// Digits and dots right after `tag`, e.g. "Hidden_Percentage_0.95_..." -> 0.95.
std::optional<double> ParseTaggedDecimal(std::string_view name, std::string_view tag) {
  const usize pos = name.find(tag);
  if (pos == std::string_view::npos) return std::nullopt;
  usize end = pos + tag.size();
  while (end < name.size() && (std::isdigit(static_cast<unsigned char>(name[end])) || name[end] == '.')) ++end;
  const std::string token(name.substr(pos + tag.size(), end - pos - tag.size()));
  if (token.empty()) return std::nullopt;
  char* stop = nullptr;
  const double v = std::strtod(token.c_str(), &stop);
  if (stop == token.c_str()) return std::nullopt;
  return v;
}

std::vector<fs::path> SortedSubdirs(const fs::path& dir) {
  std::vector<fs::path> out;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (it->is_directory(ec)) out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

bool IsExpectedBatchSize(i32 batch) noexcept {
  return std::find(kBatchSizes.begin(), kBatchSizes.end(), batch) != kBatchSizes.end();
}

std::optional<double> ParseHiddenFractionDir(std::string_view name) {
  if (Contains(name, "hiddenfrac95")) return 0.95;
  if (Contains(name, "hiddenfrac99")) return 0.99;
  return std::nullopt;
}

std::optional<Difficulty> ParseDifficultyDir(std::string_view name) {
  if (Contains(name, "Regular_Mode")) return Difficulty::Regular;
  if (Contains(name, "Hard_Mode")) return Difficulty::Hard;
  return std::nullopt;
}

std::optional<RaceType> ParseRaceDir(std::string_view name) {
  if (name == "Hide_The_Label") return RaceType::HideTheLabel;
  if (name == "Open_Race") return RaceType::OpenRace;
  return std::nullopt;
}

FileNameInfo ParseFileName(std::string_view name) {
  FileNameInfo info;
  info.batch_size = ParseTaggedInt(name, "Batch");
  info.hidden_percentage = ParseTaggedDecimal(name, "Hidden_Percentage_");
  info.dataset = std::string(DatasetFromName(name));
  return info;
}

bool ListJsonFiles(const std::string& dir, std::vector<std::string>* out, std::string* err) {
  if (!out) {
    SetErr(err, "ListJsonFiles: out is null");
    return false;
  }
  out->clear();
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    SetErr(err, "Not a directory: " + dir);
    return false;
  }
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    if (it->path().extension() != ".json") continue;
    out->push_back(it->path().string());
  }
  if (ec) {
    SetErr(err, "Failed to list " + dir + " (" + ec.message() + ")");
    return false;
  }
  std::sort(out->begin(), out->end());
  return true;
}

bool DiscoverResultFiles(const std::string& root, DiscoveryResult* out, std::string* err) {
  if (!out) {
    SetErr(err, "DiscoverResultFiles: out is null");
    return false;
  }
  *out = DiscoveryResult{};
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    SetErr(err, "Input root is not a directory: " + root);
    return false;
  }

  for (const fs::path& hidden_dir : SortedSubdirs(root)) {
    const auto hidden = ParseHiddenFractionDir(hidden_dir.filename().string());
    if (!hidden) continue;
    for (const fs::path& mode_dir : SortedSubdirs(hidden_dir)) {
      const auto difficulty = ParseDifficultyDir(mode_dir.filename().string());
      if (!difficulty) continue;
      for (const fs::path& race_dir : SortedSubdirs(mode_dir)) {
        const auto race = ParseRaceDir(race_dir.filename().string());
        if (!race) continue;

        std::vector<std::string> files;
        std::string list_err;
        if (!ListJsonFiles(race_dir.string(), &files, &list_err)) {
          ORR_LOG_WARN("skipping directory:", list_err);
          continue;
        }
        ORR_LOG_DEBUG("discovered", files.size(), "files in", race_dir.string());

        for (const std::string& path : files) {
          const FileNameInfo info = ParseFileName(fs::path(path).filename().string());
          if (!info.batch_size || !IsExpectedBatchSize(*info.batch_size)) {
            ORR_LOG_WARN("skipping", path, ": missing or unexpected batch size");
            ++out->skipped;
            continue;
          }
          ResultFile rf;
          rf.path = path;
          rf.coord.hidden_fraction = *hidden;
          rf.coord.difficulty = *difficulty;
          rf.coord.race_type = *race;
          rf.coord.batch_size = *info.batch_size;
          rf.coord.dataset = info.dataset;
          out->files.push_back(std::move(rf));
        }
      }
    }
  }

  std::sort(out->files.begin(), out->files.end(),
            [](const ResultFile& a, const ResultFile& b) { return a.path < b.path; });
  return true;
}

bool LoadDocument(const std::string& path, json::Value* out, std::string* err) {
  if (!out) {
    SetErr(err, "LoadDocument: out is null");
    return false;
  }
  std::string parse_err;
  if (!json::ParseFile(path, out, &parse_err)) {
    SetErr(err, path + ": " + parse_err);
    return false;
  }
  return true;
}

}  // namespace io
}  // namespace orr

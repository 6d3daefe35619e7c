#pragma once
// orr/io/result_files.h
//
// Locating result files and deriving their experiment coordinates.
//
// Layout:
//   <root>/<..hiddenfrac95..|..hiddenfrac99..>/<..Regular_Mode..|..Hard_Mode..>/
//          <Hide_The_Label|Open_Race>/*.json
// File names look like
//   DBO_rat_myocyte_Hard_Hide_The_Label_Notallopt_Batch10_Hidden_Percentage_0.95_20251015_202559.json
// and carry the batch size and the dataset.

#include "orr/core/types.h"
#include "orr/io/json.h"
#include "orr/store/result_store.h"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace orr {
namespace io {

// Batch sizes of the expected grid.
inline constexpr std::array<i32, 3> kBatchSizes = {1, 10, 20};
inline constexpr std::array<double, 2> kHiddenFractions = {0.95, 0.99};

bool IsExpectedBatchSize(i32 batch) noexcept;

std::optional<double> ParseHiddenFractionDir(std::string_view name);
std::optional<Difficulty> ParseDifficultyDir(std::string_view name);
std::optional<RaceType> ParseRaceDir(std::string_view name);

struct FileNameInfo {
  std::optional<i32> batch_size;
  std::optional<double> hidden_percentage;
  std::string dataset = "unknown";
};

FileNameInfo ParseFileName(std::string_view name);

struct ResultFile {
  std::string path;
  Coordinate coord;
};

struct DiscoveryResult {
  std::vector<ResultFile> files;  // sorted by path
  usize skipped = 0;              // *.json files with no usable batch size
};

// Walks the tree under `root`. Directories that do not match the layout are
// ignored. Fails only when `root` is not a readable directory.
bool DiscoverResultFiles(const std::string& root, DiscoveryResult* out, std::string* err = nullptr);

// Sorted *.json paths directly inside `dir`.
bool ListJsonFiles(const std::string& dir, std::vector<std::string>* out, std::string* err = nullptr);

// Reads and parses one result document.
bool LoadDocument(const std::string& path, json::Value* out, std::string* err = nullptr);

}  // namespace io
}  // namespace orr

#pragma once
// orr/io/store_json.h
//
// JSON artifact for a ResultStore:
//
//   { "0.95": { "Regular": { "Hide_The_Label": { "10": { "T_Cell": {
//       "RANDOM": {"mean_steps":..,"median_steps":..,"std_steps":..,
//                  "min_steps":..,"max_steps":..,"count":..} } } } } } }
//
// Open_Race leaves are {"steps":[0,1,..],"values":[..]}. Keys at every level
// are written in sorted order and numbers in shortest round-trip form, so the
// same store always serializes to the same bytes.

#include "orr/io/json.h"
#include "orr/store/result_store.h"

#include <ostream>
#include <string>

namespace orr {
namespace io {

struct StoreJsonOptions {
  // Emit every cell of the expected grid (hidden x difficulty x race x batch),
  // as an empty object when no dataset has data there.
  bool include_empty_grid = true;
  int indent = 2;
};

void WriteAggregate(json::Writer* w, const Aggregate& agg);

void WriteStore(std::ostream& os, const ResultStore& store, const StoreJsonOptions& options = {});
std::string StoreToJson(const ResultStore& store, const StoreJsonOptions& options = {});

// Creates the parent directory when needed.
bool WriteStoreJson(const ResultStore& store,
                    const StoreJsonOptions& options,
                    const std::string& path,
                    std::string* err = nullptr);

// Flat optimizer -> leaf object.
bool WriteAggregatesJson(const OptimizerAggregates& aggs,
                         const std::string& path,
                         std::string* err = nullptr);

// Rebuilds a store from a parsed artifact. Unknown keys or malformed leaves
// are errors; empty grid cells are accepted and add nothing.
bool StoreFromJson(const json::Value& root, ResultStore* out, std::string* err = nullptr);
bool ReadStoreJson(const std::string& path, ResultStore* out, std::string* err = nullptr);

}  // namespace io
}  // namespace orr

#pragma once
// orr/records/schema_normalizer.h
//
// Converts one raw result document into a flat list of TrialRecords.
//
// The harness wrote results in several layouts over time. Detection is a
// prioritized rule table: the first rule whose predicate matches decides the
// shape, most specific first, and the bare-document fallback always matches.
//
//   PreAggregatedAnalysis   {"type":"analysis","items":[{"data":{"optimizer_stats":{..}}}]}
//                           (Hide_The_Label only: these carry no trajectories)
//   FlatTournamentArray     {"all_tournament_results":[tournament, ...]}
//   WrappedTournamentArray  {"results":{"all_tournament_results"|"tournament_results":[...]}}
//   WrappedSingleTournament {"results":{"competitions":[...]}}
//                           {"results":{"tournament_results":{tournament}}}
//                           {"competitions":[...]}
//   BareDocument            {"tournament_results":[...] | {tournament}} or the document itself
//
// A tournament is {"competitions":[competition, ...]} and a competition is
// {"optimizer_results":{name:{"steps_to_target":n,"optimization_history":[..]}}}.

#include "orr/core/types.h"
#include "orr/io/json.h"
#include "orr/records/trial_record.h"

#include <string_view>
#include <vector>

namespace orr {

enum class DocumentShape : u8 {
  PreAggregatedAnalysis = 0,
  FlatTournamentArray = 1,
  WrappedTournamentArray = 2,
  WrappedSingleTournament = 3,
  BareDocument = 4,
};

inline constexpr usize kNumDocumentShapes = 5;

inline constexpr std::string_view ToString(DocumentShape s) noexcept {
  switch (s) {
    case DocumentShape::PreAggregatedAnalysis: return "pre_aggregated_analysis";
    case DocumentShape::FlatTournamentArray: return "flat_tournament_array";
    case DocumentShape::WrappedTournamentArray: return "wrapped_tournament_array";
    case DocumentShape::WrappedSingleTournament: return "wrapped_single_tournament";
    case DocumentShape::BareDocument: return "bare_document";
  }
  return "unknown";
}

// Result of detection: the shape tag plus the nodes its extractor walks.
// Pointers borrow from the document passed to DetectShape.
struct ShapeMatch {
  DocumentShape shape = DocumentShape::BareDocument;
  std::vector<const json::Value*> tournaments;  // tournament shapes
  const json::Value* items = nullptr;           // PreAggregatedAnalysis
};

ShapeMatch DetectShape(const json::Value& doc, RaceType hint);

struct NormalizeResult {
  DocumentShape shape = DocumentShape::BareDocument;
  std::vector<TrialRecord> records;
  usize competitions = 0;  // competitions (or analysis items) visited
};

// Never fails: unrecognized or empty documents yield no records.
NormalizeResult Normalize(const json::Value& doc, RaceType hint);

// Fields a history entry's value is read from, in priority order.
// The first one holding a finite number wins.
Span<const std::string_view> HistoryValueFields() noexcept;

}  // namespace orr

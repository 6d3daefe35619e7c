// src/records/schema_normalizer.cpp
//
// Shape detection rule table + per-shape extractors.

#include "orr/records/schema_normalizer.h"

#include <array>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

namespace orr {

namespace {

constexpr std::array<std::string_view, 2> kHistoryValueFields = {
    "best_value_so_far",
    "current_best",
};

bool IsArrayField(const json::Value& obj, std::string_view key) {
  const json::Value* v = obj.Find(key);
  return v && v->IsArray();
}

void AppendObjects(const json::Value& arr, std::vector<const json::Value*>* out) {
  for (const auto& e : arr.arr) {
    if (e.IsObject()) out->push_back(&e);
  }
}

// --------------------------
// Rule predicates
// --------------------------
// Each predicate either rejects the document or fills in the nodes the
// matching extractor needs.

bool MatchAnalysis(const json::Value& doc, RaceType hint, ShapeMatch* m) {
  if (hint == RaceType::OpenRace) return false;
  const json::Value* type = doc.Find("type");
  if (!type || !type->IsString() || type->str != "analysis") return false;
  const json::Value* items = doc.Find("items");
  if (!items || !items->IsArray()) return false;
  m->items = items;
  return true;
}

bool MatchFlatTournamentArray(const json::Value& doc, RaceType /*hint*/, ShapeMatch* m) {
  const json::Value* all = doc.Find("all_tournament_results");
  if (!all || !all->IsArray()) return false;
  AppendObjects(*all, &m->tournaments);
  return true;
}

bool MatchWrappedTournamentArray(const json::Value& doc, RaceType /*hint*/, ShapeMatch* m) {
  const json::Value* results = doc.Find("results");
  if (!results || !results->IsObject()) return false;
  for (std::string_view key : {"all_tournament_results", "tournament_results"}) {
    const json::Value* list = results->Find(key);
    if (list && list->IsArray()) {
      AppendObjects(*list, &m->tournaments);
      return true;
    }
  }
  return false;
}

bool MatchWrappedSingleTournament(const json::Value& doc, RaceType /*hint*/, ShapeMatch* m) {
  const json::Value* results = doc.Find("results");
  if (results && results->IsObject()) {
    if (IsArrayField(*results, "competitions")) {
      m->tournaments.push_back(results);
      return true;
    }
    const json::Value* single = results->Find("tournament_results");
    if (single && single->IsObject()) {
      m->tournaments.push_back(single);
      return true;
    }
  }
  if (IsArrayField(doc, "competitions")) {
    m->tournaments.push_back(&doc);
    return true;
  }
  return false;
}

bool MatchBareDocument(const json::Value& doc, RaceType /*hint*/, ShapeMatch* m) {
  const json::Value* tr = doc.Find("tournament_results");
  if (tr && tr->IsArray() && !tr->arr.empty()) {
    AppendObjects(*tr, &m->tournaments);
  } else if (tr && tr->IsObject()) {
    m->tournaments.push_back(tr);
  } else if (doc.IsObject()) {
    m->tournaments.push_back(&doc);
  }
  return true;
}

struct ShapeRule {
  DocumentShape shape;
  bool (*match)(const json::Value& doc, RaceType hint, ShapeMatch* m);
};

// Priority order: earlier rules win for documents matching several shapes.
constexpr std::array<ShapeRule, kNumDocumentShapes> kShapeRules = {{
    {DocumentShape::PreAggregatedAnalysis, &MatchAnalysis},
    {DocumentShape::FlatTournamentArray, &MatchFlatTournamentArray},
    {DocumentShape::WrappedTournamentArray, &MatchWrappedTournamentArray},
    {DocumentShape::WrappedSingleTournament, &MatchWrappedSingleTournament},
    {DocumentShape::BareDocument, &MatchBareDocument},
}};

// --------------------------
// Field readers
// --------------------------

std::optional<double> ReadHistoryValue(const json::Value& entry) {
  for (std::string_view field : kHistoryValueFields) {
    double v = 0.0;
    if (json::GetFiniteNumber(entry, field, &v)) return v;
  }
  return std::nullopt;
}

std::vector<HistoryPoint> ReadHistory(const json::Value& result) {
  std::vector<HistoryPoint> out;
  const json::Value* hist = result.Find("optimization_history");
  if (!hist || !hist->IsArray()) return out;

  out.reserve(hist->arr.size());
  for (const auto& entry : hist->arr) {
    double step = 0.0;
    if (!json::GetFiniteNumber(entry, "step", &step)) continue;
    if (step < 0.0 || step > static_cast<double>(kMaxHistoryStep)) continue;
    const std::optional<double> value = ReadHistoryValue(entry);
    if (!value) continue;
    out.push_back(HistoryPoint{static_cast<i64>(step), *value});
  }
  return out;
}

TrialRecord ReadOptimizerResult(const std::string& name, const json::Value& result) {
  TrialRecord rec;
  rec.optimizer_name = name;
  double steps = 0.0;
  if (json::GetFiniteNumber(result, "steps_to_target", &steps)) rec.steps_to_target = steps;
  rec.history = ReadHistory(result);
  return rec;
}

// --------------------------
// Extractors
// --------------------------

void ExtractAnalysis(const json::Value& items, NormalizeResult* out) {
  for (const auto& item : items.arr) {
    const json::Value* data = item.Find("data");
    const json::Value* stats = data ? data->Find("optimizer_stats") : nullptr;
    if (!stats || !stats->IsObject()) continue;
    ++out->competitions;
    for (const auto& m : stats->obj) {
      TrialRecord rec;
      rec.optimizer_name = m.first;
      double mean = 0.0;
      if (json::GetFiniteNumber(*m.second, "mean_steps", &mean)) rec.steps_to_target = mean;
      out->records.push_back(std::move(rec));
    }
  }
}

void ExtractTournament(const json::Value& tournament, NormalizeResult* out) {
  const json::Value* comps = tournament.Find("competitions");
  if (!comps || !comps->IsArray()) return;
  for (const auto& comp : comps->arr) {
    const json::Value* results = comp.Find("optimizer_results");
    if (!results || !results->IsObject()) continue;
    ++out->competitions;
    for (const auto& m : results->obj) {
      out->records.push_back(ReadOptimizerResult(m.first, *m.second));
    }
  }
}

}  // namespace

Span<const std::string_view> HistoryValueFields() noexcept {
  return Span<const std::string_view>(kHistoryValueFields.data(), kHistoryValueFields.size());
}

ShapeMatch DetectShape(const json::Value& doc, RaceType hint) {
  for (const ShapeRule& rule : kShapeRules) {
    ShapeMatch m;
    m.shape = rule.shape;
    if (rule.match(doc, hint, &m)) return m;
  }
  // MatchBareDocument always matches.
  return ShapeMatch{};
}

NormalizeResult Normalize(const json::Value& doc, RaceType hint) {
  const ShapeMatch m = DetectShape(doc, hint);

  NormalizeResult out;
  out.shape = m.shape;
  switch (m.shape) {
    case DocumentShape::PreAggregatedAnalysis:
      if (m.items) ExtractAnalysis(*m.items, &out);
      break;
    case DocumentShape::FlatTournamentArray:
    case DocumentShape::WrappedTournamentArray:
    case DocumentShape::WrappedSingleTournament:
    case DocumentShape::BareDocument:
      for (const json::Value* t : m.tournaments) ExtractTournament(*t, &out);
      break;
  }
  return out;
}

}  // namespace orr

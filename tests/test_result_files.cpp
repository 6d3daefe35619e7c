// tests/test_result_files.cpp
//
// File metadata and discovery:
//  - directory name parsing (hidden fraction, difficulty, race)
//  - file name parsing (batch, hidden percentage, dataset table + fallback)
//  - tree discovery: sorted output, ignored directories, skipped batches
//  - document loading errors carry the path

#include "orr/core/types.h"
#include "orr/io/json.h"
#include "orr/io/result_files.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct TestContext {
  int fails = 0;

  void Check(bool ok, const char* expr, const char* file, int line) {
    if (ok) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK(" << expr << ")\n";
  }

  template <class A, class B>
  void CheckEq(const A& a, const B& b, const char* ea, const char* eb, const char* file, int line) {
    if (a == b) return;
    ++fails;
    std::cerr << "[FAIL] " << file << ":" << line << "  CHECK_EQ(" << ea << ", " << eb
              << ")  got " << a << " vs " << b << "\n";
  }
};

#define CHECK(ctx, expr) (ctx).Check((expr), #expr, __FILE__, __LINE__)
#define CHECK_EQ(ctx, a, b) (ctx).CheckEq((a), (b), #a, #b, __FILE__, __LINE__)

using orr::Difficulty;
using orr::RaceType;
using orr::usize;

void Touch(const fs::path& p, const std::string& content = "{}") {
  fs::create_directories(p.parent_path());
  std::ofstream f(p.string());
  f << content;
}

void TestDirectoryNames(TestContext& t) {
  CHECK(t, orr::io::ParseHiddenFractionDir("hiddenfrac95") == 0.95);
  CHECK(t, orr::io::ParseHiddenFractionDir("extraresults_hiddenfrac99") == 0.99);
  CHECK(t, !orr::io::ParseHiddenFractionDir("hiddenfrac90").has_value());
  CHECK(t, !orr::io::ParseHiddenFractionDir("misc").has_value());

  CHECK(t, orr::io::ParseDifficultyDir("Regular_Mode") == Difficulty::Regular);
  CHECK(t, orr::io::ParseDifficultyDir("old_Hard_Mode_v2") == Difficulty::Hard);
  CHECK(t, !orr::io::ParseDifficultyDir("Easy").has_value());

  CHECK(t, orr::io::ParseRaceDir("Hide_The_Label") == RaceType::HideTheLabel);
  CHECK(t, orr::io::ParseRaceDir("Open_Race") == RaceType::OpenRace);
  CHECK(t, !orr::io::ParseRaceDir("Open_Race_old").has_value());
  CHECK(t, !orr::io::ParseRaceDir("open_race").has_value());
}

void TestFileNames(TestContext& t) {
  {
    const auto info = orr::io::ParseFileName(
        "DBO_rat_myocyte_Hard_Hide_The_Label_Notallopt_Batch10_Hidden_Percentage_0.95_20251015_202559.json");
    CHECK(t, info.batch_size == 10);
    CHECK(t, info.hidden_percentage == 0.95);
    CHECK_EQ(t, info.dataset, std::string("rat_myocyte"));
  }
  {
    const auto info = orr::io::ParseFileName(
        "T_Cell_Easy_Open_Race_Notallopt_Batch1_Hidden_Percentage_0.99_20251002_225033.json");
    CHECK(t, info.batch_size == 1);
    CHECK(t, info.hidden_percentage == 0.99);
    CHECK_EQ(t, info.dataset, std::string("T_Cell"));
  }

  CHECK_EQ(t, orr::io::ParseFileName("MOBO_rat_myocyte_Batch20.json").dataset, std::string("rat_myocyte"));
  CHECK_EQ(t, orr::io::ParseFileName("Hela_regular_mode_Batch1.json").dataset, std::string("Hela_regular"));
  CHECK_EQ(t, orr::io::ParseFileName("Hela_timesaving_mode_Batch1.json").dataset, std::string("Hela_timesaving"));
  CHECK_EQ(t, orr::io::ParseFileName("TF_Cell_Batch1.json").dataset, std::string("TF_Cell"));

  // Substring fallback, then "unknown".
  CHECK_EQ(t, orr::io::ParseFileName("rerun_TF_Cell_Batch1.json").dataset, std::string("TF_Cell"));
  CHECK_EQ(t, orr::io::ParseFileName("mystery_Batch1.json").dataset, std::string("unknown"));

  const auto none = orr::io::ParseFileName("results.json");
  CHECK(t, !none.batch_size.has_value());
  CHECK(t, !none.hidden_percentage.has_value());

  // "Batch" without digits is skipped in favour of a later match.
  CHECK(t, orr::io::ParseFileName("Batched_run_Batch20.json").batch_size == 20);

  CHECK(t, orr::io::IsExpectedBatchSize(1));
  CHECK(t, orr::io::IsExpectedBatchSize(10));
  CHECK(t, orr::io::IsExpectedBatchSize(20));
  CHECK(t, !orr::io::IsExpectedBatchSize(5));
}

void TestDiscovery(TestContext& t) {
  const fs::path root = fs::temp_directory_path() / "orr_result_files_test";
  std::error_code ec;
  fs::remove_all(root, ec);

  const fs::path htl = root / "hiddenfrac95" / "Regular_Mode" / "Hide_The_Label";
  const fs::path open = root / "extraresults_hiddenfrac99" / "Hard_Mode" / "Open_Race";
  Touch(htl / "T_Cell_Batch10_x.json");
  Touch(htl / "DBO_rat_myocyte_Batch1_x.json");
  Touch(htl / "T_Cell_Batch5_x.json");   // unexpected batch: skipped
  Touch(htl / "T_Cell_nobatch.json");    // missing batch: skipped
  Touch(htl / "notes.txt");              // not json: ignored
  Touch(open / "Hela_regular_mode_Batch20_x.json");
  Touch(root / "hiddenfrac95" / "Regular_Mode" / "Other_Race" / "T_Cell_Batch1.json");
  Touch(root / "misc" / "Regular_Mode" / "Open_Race" / "T_Cell_Batch1.json");

  orr::io::DiscoveryResult found;
  std::string err;
  CHECK(t, orr::io::DiscoverResultFiles(root.string(), &found, &err));
  CHECK_EQ(t, found.files.size(), static_cast<usize>(3));
  CHECK_EQ(t, found.skipped, static_cast<usize>(2));

  for (usize i = 1; i < found.files.size(); ++i) CHECK(t, found.files[i - 1].path < found.files[i].path);

  bool saw_open = false;
  for (const auto& f : found.files) {
    if (f.coord.race_type != RaceType::OpenRace) continue;
    saw_open = true;
    CHECK_EQ(t, f.coord.hidden_fraction, 0.99);
    CHECK(t, f.coord.difficulty == Difficulty::Hard);
    CHECK_EQ(t, f.coord.batch_size, 20);
    CHECK_EQ(t, f.coord.dataset, std::string("Hela_regular"));
  }
  CHECK(t, saw_open);

  std::vector<std::string> jsons;
  CHECK(t, orr::io::ListJsonFiles(htl.string(), &jsons, &err));
  CHECK_EQ(t, jsons.size(), static_cast<usize>(4));

  CHECK(t, !orr::io::DiscoverResultFiles((root / "nope").string(), &found, &err));
  CHECK(t, !err.empty());
  CHECK(t, !orr::io::ListJsonFiles((root / "nope").string(), &jsons, &err));

  fs::remove_all(root, ec);
}

void TestLoadDocument(TestContext& t) {
  const fs::path root = fs::temp_directory_path() / "orr_load_document_test";
  std::error_code ec;
  fs::remove_all(root, ec);

  const fs::path good = root / "good.json";
  const fs::path bad = root / "bad.json";
  Touch(good, R"({"competitions": []})");
  Touch(bad, R"({"competitions": [)");

  orr::json::Value doc;
  std::string err;
  CHECK(t, orr::io::LoadDocument(good.string(), &doc, &err));
  CHECK(t, doc.Find("competitions") != nullptr);

  CHECK(t, !orr::io::LoadDocument(bad.string(), &doc, &err));
  CHECK(t, err.find(bad.string()) != std::string::npos);

  CHECK(t, !orr::io::LoadDocument((root / "missing.json").string(), &doc, &err));
  CHECK(t, !err.empty());

  fs::remove_all(root, ec);
}

}  // namespace

int main() {
  TestContext t;

  TestDirectoryNames(t);
  TestFileNames(t);
  TestDiscovery(t);
  TestLoadDocument(t);

  if (t.fails == 0) {
    std::cout << "[OK] test_result_files\n";
    return 0;
  }
  std::cerr << "[FAILED] test_result_files: " << t.fails << " failure(s)\n";
  return 1;
}

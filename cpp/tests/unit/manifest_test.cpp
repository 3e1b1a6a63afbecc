#include "caserag/errors.hpp"
#include "caserag/manifest.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>

namespace {

using caserag::tests::Require;

caserag::ManifestEntry Entry(const std::string& case_id, const std::string& file_name) {
  return caserag::ManifestEntry{
      .case_id = case_id,
      .file_name = file_name,
      .ingested_at = "2024-05-01T10:00:00Z",
  };
}

void ScenarioMissingFileStartsEmpty(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: missing file starts empty");
  caserag::IngestionManifest manifest(dir / "absent.json");
  Require(manifest.Load() == caserag::ManifestLoadStatus::kMissing, "absent ledger reports kMissing");
  Require(manifest.size() == 0, "absent ledger is empty");
}

void ScenarioKeyScheme() {
  caserag::tests::Log("scenario: key scheme");
  Require(caserag::IngestionManifest::MakeKey("case_001", "report.txt") == "case_001_report.txt", "key format");
}

void ScenarioRoundTrip(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: round trip");
  const auto path = dir / "ledger" / "manifest.json";
  caserag::IngestionManifest manifest(path);
  manifest.Record(caserag::IngestionManifest::MakeKey("case_001", "a.txt"), Entry("case_001", "a.txt"));
  manifest.Record(caserag::IngestionManifest::MakeKey("case_002", "b.pdf"), Entry("case_002", "b.pdf"));
  manifest.Save();
  manifest.Save();
  Require(!std::filesystem::exists(path.string() + ".tmp"), "temp file must be renamed away");

  const auto on_disk = nlohmann::json::parse(caserag::tests::ReadFile(path));
  Require(on_disk.is_object() && on_disk.size() == 2, "ledger must be a JSON object of entries");
  Require(on_disk["case_001_a.txt"]["file_name"] == "a.txt", "entry fields must be persisted");

  caserag::IngestionManifest reloaded(path);
  Require(reloaded.Load() == caserag::ManifestLoadStatus::kLoaded, "saved ledger reloads");
  Require(reloaded.size() == manifest.size(), "round trip size");
  const auto entry = reloaded.Get("case_002_b.pdf");
  Require(entry.has_value(), "entry must survive the round trip");
  Require(entry->case_id == "case_002" && entry->file_name == "b.pdf" &&
              entry->ingested_at == "2024-05-01T10:00:00Z",
          "entry fields must survive the round trip");
}

void ScenarioCorruptFileIsTreatedAsEmpty(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: corrupt file is treated as empty");
  const auto path = dir / "corrupt.json";
  caserag::tests::WriteFile(path, "{ this is not json");
  caserag::IngestionManifest manifest(path);
  Require(manifest.Load() == caserag::ManifestLoadStatus::kCorrupt, "corrupt ledger reports kCorrupt");
  Require(manifest.size() == 0, "corrupt ledger yields an empty ledger");

  caserag::tests::WriteFile(path, "[1, 2, 3]");
  Require(manifest.Load() == caserag::ManifestLoadStatus::kCorrupt, "non-object ledger reports kCorrupt");
}

void ScenarioRemoveByCase(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: remove by case");
  caserag::IngestionManifest manifest(dir / "remove.json");
  manifest.Record("case_1_a.txt", Entry("case_1", "a.txt"));
  manifest.Record("case_1_b.txt", Entry("case_1", "b.txt"));
  manifest.Record("case_10_a.txt", Entry("case_10", "a.txt"));
  manifest.Record("case_1_legacy.txt", caserag::ManifestEntry{});

  Require(manifest.RemoveByCase("case_1") == 3, "only case_1 entries must be removed");
  Require(manifest.Has("case_10_a.txt"), "case_10 shares a prefix but must survive");
  Require(manifest.RemoveByCase("case_404") == 0, "unknown case removes nothing");
}

void ScenarioRemoveFile(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: remove file");
  const auto path = dir / "remove_file.json";
  caserag::IngestionManifest manifest(path);
  manifest.Record("case_1_a.txt", Entry("case_1", "a.txt"));
  manifest.Save();
  Require(manifest.RemoveFile(), "removing an existing ledger succeeds");
  Require(!std::filesystem::exists(path) && manifest.size() == 0, "ledger file and entries are gone");
  Require(manifest.RemoveFile(), "removing an absent ledger is not an error");
}

void ScenarioSaveFailureRaises(const std::filesystem::path& dir) {
  caserag::tests::Log("scenario: save failure raises");
  const auto blocker = dir / "blocker";
  caserag::tests::WriteFile(blocker, "file, not a directory");
  caserag::IngestionManifest manifest(blocker / "manifest.json");
  manifest.Record("case_1_a.txt", Entry("case_1", "a.txt"));
  bool threw = false;
  try {
    manifest.Save();
  } catch (const caserag::ManifestError&) {
    threw = true;
  }
  Require(threw, "unwritable ledger location must raise ManifestError");
}

void ScenarioMarkerFormat() {
  caserag::tests::Log("scenario: marker format");
  const auto marker = caserag::CurrentIngestionMarker();
  Require(marker.size() == 20 && marker[4] == '-' && marker[10] == 'T' && marker.back() == 'Z',
          "marker must be an ISO-8601 UTC timestamp");
}

}  // namespace

int main() {
  try {
    caserag::tests::Log("manifest_test: start");
    caserag::tests::ConfigureLibraryLogging();
    caserag::tests::ScopedDir dir("manifest");
    ScenarioMissingFileStartsEmpty(dir.path());
    ScenarioKeyScheme();
    ScenarioRoundTrip(dir.path());
    ScenarioCorruptFileIsTreatedAsEmpty(dir.path());
    ScenarioRemoveByCase(dir.path());
    ScenarioRemoveFile(dir.path());
    ScenarioSaveFailureRaises(dir.path());
    ScenarioMarkerFormat();
    caserag::tests::Log("manifest_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    caserag::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

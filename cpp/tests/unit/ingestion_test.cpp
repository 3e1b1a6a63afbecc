#include "caserag/errors.hpp"
#include "caserag/ingestion.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <mutex>
#include <string>
#include <vector>

namespace {

using caserag::tests::Require;

std::string Words(int count, const std::string& prefix) {
  std::string text{};
  for (int i = 0; i < count; ++i) {
    text += prefix + std::to_string(i) + " ";
  }
  return text;
}

// Owns one pipeline over an in-memory store, with 5-token fragments.
struct PipelineHarness {
  explicit PipelineHarness(const std::filesystem::path& manifest_path,
                           caserag::EmbeddingProvider* embedder_override = nullptr)
      : store(caserag::SqliteVectorStore::Open(":memory:", 64)),
        embedder(64, 0),
        loader({.chunk_tokens = 5, .overlap_tokens = 0}),
        manifest(manifest_path),
        pipeline(store,
                 embedder_override != nullptr ? *embedder_override : embedder,
                 loader,
                 manifest,
                 manifest_mutex,
                 config) {}

  caserag::EngineConfig config{};
  caserag::SqliteVectorStore store;
  caserag::HashingEmbedder embedder;
  caserag::TextDocumentLoader loader;
  caserag::IngestionManifest manifest;
  std::mutex manifest_mutex;
  caserag::IngestionPipeline pipeline;
};

std::filesystem::path MakeCase(const std::filesystem::path& root, const std::string& case_id) {
  const auto case_dir = root / case_id;
  caserag::tests::WriteFile(case_dir / "metadata.json", caserag::tests::CaseMetadataJson(case_id, "t", {}));
  caserag::tests::WriteFile(case_dir / "evaluation.txt", Words(12, "eval"));  // 3 fragments
  caserag::tests::WriteFile(case_dir / "testimony.txt", Words(4, "testimony"));  // 1 fragment
  return case_dir;
}

void ScenarioSecondRunSkipsEverything(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: second run skips everything");
  const auto case_dir = MakeCase(root, "case_001");
  PipelineHarness harness(root / "skip_manifest.json");

  const auto first = harness.pipeline.Ingest(case_dir, "case_001", {}, false);
  Require(first.ingested == 4 && first.skipped == 0, "first run ingests every fragment");
  Require(harness.store.Count() == 4, "store holds the first run's fragments");

  const auto second = harness.pipeline.Ingest(case_dir, "case_001", {}, false);
  caserag::tests::LogKV("skipped_on_second_run", second.skipped);
  Require(second.ingested == 0, "second run ingests nothing");
  Require(second.skipped == first.ingested, "second run skips the first run's fragment count");
  Require(harness.store.Count() == 4, "second run must not touch the store");

  caserag::IngestionManifest reloaded(root / "skip_manifest.json");
  Require(reloaded.Load() == caserag::ManifestLoadStatus::kLoaded, "manifest must be persisted");
  Require(reloaded.Has("case_001_evaluation.txt") && reloaded.Has("case_001_testimony.txt"),
          "manifest keys are case id plus file name");
  Require(!reloaded.Has("case_001_metadata.json"), "metadata descriptor is never ingested");
}

void ScenarioForceReingestsEverything(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: force reingests everything");
  const auto case_dir = MakeCase(root, "case_002");
  PipelineHarness harness(root / "force_manifest.json");

  (void)harness.pipeline.Ingest(case_dir, "case_002", {}, false);
  const auto forced = harness.pipeline.Ingest(case_dir, "case_002", {}, true);
  Require(forced.ingested == 4 && forced.skipped == 0, "force re-inserts every fragment");
  Require(harness.store.Count() == 8, "forced run duplicates fragments in the store");
}

void ScenarioCorruptManifestIngestsAll(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: corrupt manifest ingests all");
  const auto case_dir = MakeCase(root, "case_003");
  const auto manifest_path = root / "corrupt_manifest.json";
  caserag::tests::WriteFile(manifest_path, "{\"case_003_evaluation.txt\": ");
  PipelineHarness harness(manifest_path);

  const auto result = harness.pipeline.Ingest(case_dir, "case_003", {}, false);
  Require(result.ingested == 4 && result.skipped == 0, "corrupt manifest is treated as empty");

  caserag::IngestionManifest repaired(manifest_path);
  Require(repaired.Load() == caserag::ManifestLoadStatus::kLoaded, "manifest is rewritten as valid JSON");
  Require(repaired.size() == 2, "both documents are recorded");
}

void ScenarioEmptyDirectoryIsNothingToIngest(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: empty directory is nothing to ingest");
  const auto case_dir = root / "case_004";
  caserag::tests::WriteFile(case_dir / "metadata.json", "{}");
  PipelineHarness harness(root / "empty_manifest.json");
  const auto result = harness.pipeline.Ingest(case_dir, "case_004", {}, false);
  Require(result.ingested == 0 && result.skipped == 0, "no documents yields zero counts");
  Require(!std::filesystem::exists(root / "empty_manifest.json"), "nothing ingested means nothing saved");
}

void ScenarioMetadataIsAttached(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: metadata is attached");
  const auto case_dir = MakeCase(root, "case_005");
  PipelineHarness harness(root / "metadata_manifest.json");
  (void)harness.pipeline.Ingest(case_dir, "case_005", {{"court", "Superior Court"}, {"case_id", "spoofed"}}, false);

  const auto query = harness.embedder.Embed("eval0 eval1 eval2 eval3 eval4");
  const auto hits = harness.store.Query(query, 10);
  Require(hits.size() == 4, "all fragments retrievable");
  for (const auto& hit : hits) {
    Require(hit.fragment.metadata.at("case_id") == "case_005", "case_id must come from the ingest call");
    Require(hit.fragment.metadata.at("court") == "Superior Court", "extra metadata must be attached");
    Require(hit.fragment.metadata.count("file_name") == 1, "file_name metadata must be present");
  }
  Require(hits.front().fragment.text == "eval0 eval1 eval2 eval3 eval4", "best hit is the identical fragment");
}

void ScenarioProviderFailureLeavesNoTrace(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: provider failure leaves no trace");
  const auto case_dir = MakeCase(root, "case_006");
  caserag::tests::FailingEmbedder failing(64);
  PipelineHarness harness(root / "failing_manifest.json", &failing);

  bool threw = false;
  try {
    (void)harness.pipeline.Ingest(case_dir, "case_006", {}, false);
  } catch (const caserag::ProviderError&) {
    threw = true;
  }
  Require(threw, "embedding failure must surface as ProviderError");
  Require(harness.store.Count() == 0, "nothing may be stored after an embedding failure");
  Require(!std::filesystem::exists(root / "failing_manifest.json"), "nothing may be recorded");
}

void ScenarioEmptyCaseIdRejected(const std::filesystem::path& root) {
  caserag::tests::Log("scenario: empty case id rejected");
  PipelineHarness harness(root / "reject_manifest.json");
  bool threw = false;
  try {
    (void)harness.pipeline.Ingest(root, "", {}, false);
  } catch (const caserag::ValidationError&) {
    threw = true;
  }
  Require(threw, "empty case id must be rejected");
}

}  // namespace

int main() {
  try {
    caserag::tests::Log("ingestion_test: start");
    caserag::tests::ConfigureLibraryLogging();
    caserag::tests::ScopedDir root("ingestion");
    ScenarioSecondRunSkipsEverything(root.path());
    ScenarioForceReingestsEverything(root.path());
    ScenarioCorruptManifestIngestsAll(root.path());
    ScenarioEmptyDirectoryIsNothingToIngest(root.path());
    ScenarioMetadataIsAttached(root.path());
    ScenarioProviderFailureLeavesNoTrace(root.path());
    ScenarioEmptyCaseIdRejected(root.path());
    caserag::tests::Log("ingestion_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    caserag::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

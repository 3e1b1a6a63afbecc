#include "caserag/ingestion.hpp"

#include "caserag/errors.hpp"
#include "caserag/logging.hpp"

#include <exception>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace caserag {
namespace {

constexpr std::size_t kEmbedBatchSize = 32;

struct PendingRecord {
  std::string key;
  ManifestEntry entry;
};

}  // namespace

IngestionPipeline::IngestionPipeline(VectorStore& store,
                                     EmbeddingProvider& embedder,
                                     DocumentLoader& loader,
                                     IngestionManifest& manifest,
                                     std::mutex& manifest_mutex,
                                     const EngineConfig& config)
    : store_(store),
      embedder_(embedder),
      loader_(loader),
      manifest_(manifest),
      manifest_mutex_(manifest_mutex),
      config_(config) {}

IngestResult IngestionPipeline::Ingest(const std::filesystem::path& case_dir,
                                       const std::string& case_id,
                                       const Metadata& extra_metadata,
                                       bool force_reingest) {
  if (case_id.empty()) {
    throw ValidationError("case_id must not be empty");
  }
  auto log = logging::Get();

  std::unordered_set<std::string> known_keys{};
  {
    std::lock_guard<std::mutex> lock(manifest_mutex_);
    (void)manifest_.Load();
    for (const auto& [key, entry] : manifest_.entries()) {
      known_keys.insert(key);
    }
  }

  const auto documents = loader_.LoadDirectory(case_dir, config_.content_extensions, config_.metadata_file_name);
  if (documents.empty()) {
    log->info("case '{}': nothing to ingest in '{}'", case_id, case_dir.string());
    return {};
  }

  IngestResult result{};
  std::vector<PendingRecord> records{};

  auto persist = [&]() {
    if (records.empty()) {
      return;
    }
    std::lock_guard<std::mutex> lock(manifest_mutex_);
    (void)manifest_.Load();
    for (const auto& record : records) {
      manifest_.Record(record.key, record.entry);
    }
    manifest_.Save();
  };

  try {
    for (const auto& document : documents) {
      const auto key = IngestionManifest::MakeKey(case_id, document.file_name);
      const auto fragment_count = static_cast<int>(document.fragments.size());
      if (!force_reingest && known_keys.find(key) != known_keys.end()) {
        log->debug("case '{}': skipping already ingested '{}'", case_id, document.file_name);
        result.skipped += fragment_count;
        continue;
      }
      if (document.fragments.empty()) {
        continue;
      }

      const auto embeddings = EmbedTexts(embedder_, document.fragments, kEmbedBatchSize);
      std::vector<Fragment> fragments{};
      fragments.reserve(document.fragments.size());
      for (std::size_t i = 0; i < document.fragments.size(); ++i) {
        Metadata metadata = extra_metadata;
        metadata[kCaseIdKey] = case_id;
        metadata[kFileNameKey] = document.file_name;
        metadata["chunk_index"] = std::to_string(i);
        fragments.push_back(Fragment{
            .text = document.fragments[i],
            .source_id = document.file_name,
            .case_id = case_id,
            .metadata = std::move(metadata),
            .embedding = embeddings[i],
        });
      }
      (void)store_.InsertBatch(fragments);

      records.push_back(PendingRecord{
          .key = key,
          .entry = ManifestEntry{
              .case_id = case_id,
              .file_name = document.file_name,
              .ingested_at = CurrentIngestionMarker(),
          },
      });
      result.ingested += fragment_count;
      log->debug("case '{}': ingested '{}' ({} fragments)", case_id, document.file_name, fragment_count);
    }
  } catch (const std::exception& ex) {
    log->error("case '{}': ingestion failed after {} fragments: {}", case_id, result.ingested, ex.what());
    try {
      persist();
    } catch (const ManifestError& save_ex) {
      log->error("case '{}': could not record partial ingestion: {}", case_id, save_ex.what());
    }
    throw;
  }

  try {
    persist();
  } catch (const ManifestError& ex) {
    log->error("case '{}': manifest save failed: {}", case_id, ex.what());
    throw;
  }

  log->info("case '{}': ingested {} fragments, skipped {}", case_id, result.ingested, result.skipped);
  return result;
}

}  // namespace caserag

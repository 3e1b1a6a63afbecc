#pragma once

#include "caserag/case_aggregator.hpp"
#include "caserag/case_catalog.hpp"
#include "caserag/completion.hpp"
#include "caserag/document_loader.hpp"
#include "caserag/embeddings.hpp"
#include "caserag/ingestion.hpp"
#include "caserag/manifest.hpp"
#include "caserag/query_engine.hpp"
#include "caserag/types.hpp"
#include "caserag/vector_store.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace caserag {

using VectorStoreFactory = std::function<std::unique_ptr<VectorStore>(const EngineConfig&)>;

// Collaborators left null are replaced with the built-in defaults during Initialize().
struct EngineProviders {
  std::shared_ptr<EmbeddingProvider> embedder;
  std::shared_ptr<CompletionProvider> completer;
  std::shared_ptr<DocumentLoader> loader;
  std::shared_ptr<CaseMetadataSource> case_metadata;
  VectorStoreFactory store_factory;
};

// Long-lived context object shared by every request handler. Queries and case ranking run
// concurrently; ingestion is serialized per case; clears take exclusive access.
class Engine {
 public:
  explicit Engine(EngineConfig config, EngineProviders providers = {});
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  // Idempotent. Throws StoreError when the vector store cannot be opened.
  void Initialize();
  void Shutdown();
  [[nodiscard]] bool initialized() const;

  QueryResult Query(const std::string& text, const std::optional<std::string>& case_filter = std::nullopt);
  std::vector<CaseAggregateResult> RankCases(const std::string& description, int top_n = 5);
  IngestResult Ingest(const std::filesystem::path& case_dir,
                      const std::string& case_id,
                      const Metadata& extra_metadata = {},
                      bool force_reingest = false);
  std::uint64_t DocumentCount();
  bool ClearAll();
  int ClearCase(const std::string& case_id);
  std::vector<CaseInfo> ListCases();
  HealthStatus Health();

  [[nodiscard]] const EngineConfig& config() const { return config_; }

 private:
  void ThrowIfNotInitialized(const char* operation) const;
  std::shared_ptr<std::mutex> CaseLock(const std::string& case_id);

  EngineConfig config_;
  EngineProviders providers_;
  std::unique_ptr<VectorStore> store_;
  std::unique_ptr<IngestionManifest> manifest_;
  std::unique_ptr<IngestionPipeline> pipeline_;
  std::unique_ptr<QueryEngine> query_engine_;
  std::unique_ptr<CaseAggregator> aggregator_;
  std::atomic<bool> initialized_{false};

  std::mutex lifecycle_mutex_{};
  mutable std::shared_mutex storage_mutex_{};
  std::mutex manifest_mutex_{};
  std::mutex case_locks_mutex_{};
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> case_locks_{};
};

}  // namespace caserag

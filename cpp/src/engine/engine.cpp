#include "caserag/engine.hpp"

#include "caserag/config.hpp"
#include "caserag/errors.hpp"
#include "caserag/logging.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <utility>

namespace caserag {
namespace {

std::unique_ptr<VectorStore> OpenDefaultStore(const EngineConfig& config, const std::string& embedding_model) {
  return std::make_unique<SqliteVectorStore>(
      SqliteVectorStore::Open(config.store_path, config.embedding_dimensions, embedding_model));
}

}  // namespace

Engine::Engine(EngineConfig config, EngineProviders providers)
    : config_(std::move(config)), providers_(std::move(providers)) {}

Engine::~Engine() = default;

void Engine::Initialize() {
  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
  if (initialized_.load()) {
    return;
  }
  ValidateConfig(config_);
  auto log = logging::Get();

  std::unique_lock<std::shared_mutex> storage_lock(storage_mutex_);
  if (providers_.embedder == nullptr) {
    providers_.embedder = std::make_shared<HashingEmbedder>(
        config_.embedding_dimensions, static_cast<std::size_t>(std::max(0, config_.embedding_cache_capacity)));
  }
  if (providers_.embedder->dimensions() != config_.embedding_dimensions) {
    throw ConfigError("embedding provider produces " + std::to_string(providers_.embedder->dimensions()) +
                      " dimensions, configuration expects " + std::to_string(config_.embedding_dimensions));
  }
  if (providers_.completer == nullptr) {
    providers_.completer = std::make_shared<ExtractiveCompletionProvider>(config_.completion);
  }
  if (providers_.loader == nullptr) {
    providers_.loader = std::make_shared<TextDocumentLoader>(config_.chunking);
  }
  if (providers_.case_metadata == nullptr) {
    providers_.case_metadata = std::make_shared<FileCaseMetadataSource>(config_.data_dir, config_.metadata_file_name);
  }
  if (!providers_.store_factory) {
    providers_.store_factory = [embedding_model = EmbeddingModelName(*providers_.embedder)](
                                   const EngineConfig& config) { return OpenDefaultStore(config, embedding_model); };
  }

  std::unique_ptr<VectorStore> store{};
  try {
    store = providers_.store_factory(config_);
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw StoreError(std::string("cannot open vector store: ") + ex.what());
  }
  if (store == nullptr) {
    throw StoreError("vector store factory returned no store");
  }

  store_ = std::move(store);
  manifest_ = std::make_unique<IngestionManifest>(ResolveManifestPath(config_));
  pipeline_ = std::make_unique<IngestionPipeline>(
      *store_, *providers_.embedder, *providers_.loader, *manifest_, manifest_mutex_, config_);
  query_engine_ = std::make_unique<QueryEngine>(*store_, *providers_.embedder, *providers_.completer, config_);
  aggregator_ = std::make_unique<CaseAggregator>(*store_, *providers_.embedder, *providers_.case_metadata, config_);
  initialized_.store(true);

  log->info("engine initialized (store '{}', manifest '{}', model '{}')",
            config_.store_path,
            manifest_->path().string(),
            config_.completion.model);
}

void Engine::Shutdown() {
  std::lock_guard<std::mutex> lifecycle_lock(lifecycle_mutex_);
  if (!initialized_.load()) {
    return;
  }
  std::unique_lock<std::shared_mutex> storage_lock(storage_mutex_);
  initialized_.store(false);
  aggregator_.reset();
  query_engine_.reset();
  pipeline_.reset();
  manifest_.reset();
  store_.reset();
  logging::Get()->info("engine shut down");
}

bool Engine::initialized() const {
  return initialized_.load();
}

void Engine::ThrowIfNotInitialized(const char* operation) const {
  if (!initialized_.load()) {
    throw NotInitializedError(operation);
  }
}

std::shared_ptr<std::mutex> Engine::CaseLock(const std::string& case_id) {
  std::lock_guard<std::mutex> lock(case_locks_mutex_);
  auto& slot = case_locks_[case_id];
  if (slot == nullptr) {
    slot = std::make_shared<std::mutex>();
  }
  return slot;
}

QueryResult Engine::Query(const std::string& text, const std::optional<std::string>& case_filter) {
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("Query");
  return query_engine_->Answer(text, case_filter);
}

std::vector<CaseAggregateResult> Engine::RankCases(const std::string& description, int top_n) {
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("RankCases");
  return aggregator_->RankCases(description, top_n);
}

IngestResult Engine::Ingest(const std::filesystem::path& case_dir,
                            const std::string& case_id,
                            const Metadata& extra_metadata,
                            bool force_reingest) {
  const auto case_lock = CaseLock(case_id);
  std::lock_guard<std::mutex> case_guard(*case_lock);
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("Ingest");
  return pipeline_->Ingest(case_dir, case_id, extra_metadata, force_reingest);
}

std::uint64_t Engine::DocumentCount() {
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("DocumentCount");
  return store_->Count();
}

bool Engine::ClearAll() {
  std::unique_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("ClearAll");
  auto log = logging::Get();
  log->warn("clearing every fragment and the ingestion manifest");
  try {
    store_->DeleteAll();
  } catch (const EngineError& ex) {
    log->error("clearing the vector store failed: {}", ex.what());
    return false;
  }
  std::lock_guard<std::mutex> manifest_lock(manifest_mutex_);
  return manifest_->RemoveFile();
}

int Engine::ClearCase(const std::string& case_id) {
  const auto case_lock = CaseLock(case_id);
  std::lock_guard<std::mutex> case_guard(*case_lock);
  std::unique_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("ClearCase");
  if (case_id.empty()) {
    throw ValidationError("case_id must not be empty");
  }

  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> manifest_lock(manifest_mutex_);
    (void)manifest_->Load();
    removed = manifest_->RemoveByCase(case_id);
    if (removed > 0) {
      manifest_->Save();
    }
  }
  const auto fragments = store_->DeleteWhere(MetadataFilter{.key = kCaseIdKey, .value = case_id});
  logging::Get()->warn("cleared case '{}': {} manifest entries, {} fragments", case_id, removed, fragments);
  return static_cast<int>(removed);
}

std::vector<CaseInfo> Engine::ListCases() {
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  ThrowIfNotInitialized("ListCases");
  return ::caserag::ListCases(config_.data_dir, config_.metadata_file_name);
}

HealthStatus Engine::Health() {
  std::shared_lock<std::shared_mutex> storage_lock(storage_mutex_);
  if (!initialized_.load()) {
    return HealthStatus{};
  }
  return HealthStatus{.initialized = true, .documents_loaded = store_->Count()};
}

}  // namespace caserag

#pragma once

#include "caserag/document_loader.hpp"
#include "caserag/embeddings.hpp"
#include "caserag/manifest.hpp"
#include "caserag/types.hpp"
#include "caserag/vector_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace caserag {

class IngestionPipeline {
 public:
  // `manifest_mutex` guards every load/record/save of `manifest`; it is held only around
  // the ledger read and the final write, not while embedding or inserting.
  IngestionPipeline(VectorStore& store,
                    EmbeddingProvider& embedder,
                    DocumentLoader& loader,
                    IngestionManifest& manifest,
                    std::mutex& manifest_mutex,
                    const EngineConfig& config);

  // Callers must serialize runs for the same case_id.
  IngestResult Ingest(const std::filesystem::path& case_dir,
                      const std::string& case_id,
                      const Metadata& extra_metadata,
                      bool force_reingest);

 private:
  VectorStore& store_;
  EmbeddingProvider& embedder_;
  DocumentLoader& loader_;
  IngestionManifest& manifest_;
  std::mutex& manifest_mutex_;
  const EngineConfig& config_;
};

}  // namespace caserag

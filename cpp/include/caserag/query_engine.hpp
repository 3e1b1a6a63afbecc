#pragma once

#include "caserag/completion.hpp"
#include "caserag/embeddings.hpp"
#include "caserag/types.hpp"
#include "caserag/vector_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace caserag {

std::vector<SourceCitation> BuildCitations(const std::vector<FragmentHit>& hits, std::size_t snippet_max_chars);

class QueryEngine {
 public:
  QueryEngine(const VectorStore& store,
              EmbeddingProvider& embedder,
              CompletionProvider& completer,
              const EngineConfig& config);

  QueryResult Answer(const std::string& query, const std::optional<std::string>& case_id_filter = std::nullopt) const;

 private:
  const VectorStore& store_;
  EmbeddingProvider& embedder_;
  CompletionProvider& completer_;
  const EngineConfig& config_;
};

}  // namespace caserag

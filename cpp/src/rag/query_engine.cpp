#include "caserag/query_engine.hpp"

#include "caserag/errors.hpp"
#include "caserag/logging.hpp"
#include "caserag/similarity.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace caserag {

std::vector<SourceCitation> BuildCitations(const std::vector<FragmentHit>& hits, std::size_t snippet_max_chars) {
  std::vector<SourceCitation> citations{};
  citations.reserve(hits.size());
  for (const auto& hit : hits) {
    citations.push_back(SourceCitation{
        .doc_id = hit.fragment.source_id,
        .fragment_id = hit.fragment.id,
        .snippet = TruncateWithMarker(hit.fragment.text, snippet_max_chars),
        .relevance_score = static_cast<float>(DistanceToSimilarity(hit.distance)),
    });
  }
  return citations;
}

QueryEngine::QueryEngine(const VectorStore& store,
                         EmbeddingProvider& embedder,
                         CompletionProvider& completer,
                         const EngineConfig& config)
    : store_(store), embedder_(embedder), completer_(completer), config_(config) {}

QueryResult QueryEngine::Answer(const std::string& query, const std::optional<std::string>& case_id_filter) const {
  if (IsBlank(query)) {
    throw ValidationError("query must not be empty");
  }
  const auto started = std::chrono::steady_clock::now();

  const auto embeddings = EmbedTexts(embedder_, {query}, 1);

  std::optional<MetadataFilter> filter{};
  if (case_id_filter.has_value()) {
    filter = MetadataFilter{.key = kCaseIdKey, .value = *case_id_filter};
  }

  std::vector<FragmentHit> hits{};
  try {
    hits = store_.Query(embeddings.front(), config_.top_k_retrieval, filter);
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw StoreError(std::string("fragment retrieval failed: ") + ex.what());
  }

  std::vector<std::string> contexts{};
  contexts.reserve(hits.size());
  for (const auto& hit : hits) {
    contexts.push_back(hit.fragment.text);
  }

  QueryResult result{};
  try {
    result.answer = completer_.Complete(query, contexts);
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProviderError(std::string("completion failed: ") + ex.what());
  }

  result.sources = BuildCitations(hits, config_.snippet_max_chars);
  result.metadata.total_chunks_retrieved = hits.size();
  result.metadata.processing_time_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count();
  logging::Get()->debug("query answered with {} fragments in {} ms",
                        result.metadata.total_chunks_retrieved,
                        result.metadata.processing_time_ms);
  return result;
}

}  // namespace caserag

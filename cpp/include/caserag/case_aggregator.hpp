#pragma once

#include "caserag/case_catalog.hpp"
#include "caserag/embeddings.hpp"
#include "caserag/types.hpp"
#include "caserag/vector_store.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace caserag {

struct RankedCase {
  std::string case_id;
  double similarity = 0.0;
  std::string best_text;
};

// Keeps the most similar hit per case (first seen wins on ties), orders by similarity
// descending then case id ascending, and truncates to top_n. Hits without a case id are
// ignored.
std::vector<RankedCase> AggregateByCase(const std::vector<FragmentHit>& hits, std::size_t top_n);

class CaseAggregator {
 public:
  CaseAggregator(const VectorStore& store,
                 EmbeddingProvider& embedder,
                 const CaseMetadataSource& metadata,
                 const EngineConfig& config);

  std::vector<CaseAggregateResult> RankCases(const std::string& description, int top_n) const;

  CaseAggregateResult BuildResult(const RankedCase& ranked) const;

 private:
  const VectorStore& store_;
  EmbeddingProvider& embedder_;
  const CaseMetadataSource& metadata_;
  const EngineConfig& config_;
};

}  // namespace caserag

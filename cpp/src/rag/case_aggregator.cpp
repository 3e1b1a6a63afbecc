#include "caserag/case_aggregator.hpp"

#include "caserag/errors.hpp"
#include "caserag/logging.hpp"
#include "caserag/similarity.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace caserag {

std::vector<RankedCase> AggregateByCase(const std::vector<FragmentHit>& hits, std::size_t top_n) {
  std::vector<RankedCase> ranked{};
  std::unordered_map<std::string, std::size_t> index_by_case{};
  for (const auto& hit : hits) {
    std::string case_id = hit.fragment.case_id;
    if (const auto it = hit.fragment.metadata.find(kCaseIdKey); it != hit.fragment.metadata.end()) {
      case_id = it->second;
    }
    if (case_id.empty()) {
      continue;
    }
    const double similarity = DistanceToSimilarity(hit.distance);
    const auto existing = index_by_case.find(case_id);
    if (existing == index_by_case.end()) {
      index_by_case.emplace(case_id, ranked.size());
      ranked.push_back(RankedCase{.case_id = case_id, .similarity = similarity, .best_text = hit.fragment.text});
      continue;
    }
    auto& best = ranked[existing->second];
    if (similarity > best.similarity) {
      best.similarity = similarity;
      best.best_text = hit.fragment.text;
    }
  }

  std::sort(ranked.begin(), ranked.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.similarity != rhs.similarity) {
      return lhs.similarity > rhs.similarity;
    }
    return lhs.case_id < rhs.case_id;
  });
  if (ranked.size() > top_n) {
    ranked.resize(top_n);
  }
  return ranked;
}

CaseAggregator::CaseAggregator(const VectorStore& store,
                               EmbeddingProvider& embedder,
                               const CaseMetadataSource& metadata,
                               const EngineConfig& config)
    : store_(store), embedder_(embedder), metadata_(metadata), config_(config) {}

std::vector<CaseAggregateResult> CaseAggregator::RankCases(const std::string& description, int top_n) const {
  if (IsBlank(description)) {
    throw ValidationError("case description must not be empty");
  }
  if (top_n <= 0) {
    throw ValidationError("top_n must be positive");
  }

  const auto embeddings = EmbedTexts(embedder_, {description}, 1);

  std::vector<FragmentHit> pool{};
  try {
    const auto total = store_.Count();
    if (total == 0) {
      return {};
    }
    const auto pool_size = std::min<std::uint64_t>(static_cast<std::uint64_t>(config_.case_pool_size), total);
    pool = store_.Query(embeddings.front(), static_cast<int>(pool_size));
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw StoreError(std::string("case pool retrieval failed: ") + ex.what());
  }

  std::vector<CaseAggregateResult> results{};
  for (const auto& ranked : AggregateByCase(pool, static_cast<std::size_t>(top_n))) {
    results.push_back(BuildResult(ranked));
  }
  return results;
}

CaseAggregateResult CaseAggregator::BuildResult(const RankedCase& ranked) const {
  CaseAggregateResult result{};
  result.case_id = ranked.case_id;
  result.relevance_score = SimilarityToPercent(ranked.similarity);

  const auto lookup = metadata_.Lookup(ranked.case_id);
  if (lookup.found() && lookup.metadata.has_value()) {
    const auto& metadata = *lookup.metadata;
    result.title = metadata.title.empty() ? ranked.case_id : metadata.title;
    result.summary = metadata.summary.value_or(TruncatePlain(ranked.best_text, config_.summary_max_chars));
    const auto findings = std::min(metadata.key_findings.size(), config_.max_key_findings);
    result.key_findings.assign(metadata.key_findings.begin(),
                               metadata.key_findings.begin() + static_cast<std::ptrdiff_t>(findings));
    result.document_count = static_cast<int>(metadata.documents.size());
    if (result.document_count == 0) {
      result.document_count = metadata_.CountDocuments(ranked.case_id);
    }
    return result;
  }

  logging::Get()->warn("case '{}': using fallback details ({})", ranked.case_id, lookup.reason);
  result.title = ranked.case_id;
  result.summary = TruncatePlain(ranked.best_text, config_.summary_max_chars);
  result.document_count = metadata_.CountDocuments(ranked.case_id);
  return result;
}

}  // namespace caserag

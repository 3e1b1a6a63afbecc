#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace caserag {

using Metadata = std::unordered_map<std::string, std::string>;

inline constexpr const char* kCaseIdKey = "case_id";
inline constexpr const char* kFileNameKey = "file_name";

// Exact-match predicate on a single metadata key.
struct MetadataFilter {
  std::string key;
  std::string value;
};

struct Fragment {
  std::string text;
  std::string source_id;
  std::string case_id;
  Metadata metadata;
  std::vector<float> embedding;
};

struct StoredFragment {
  std::uint64_t id = 0;
  std::string text;
  std::string source_id;
  std::string case_id;
  Metadata metadata;
};

struct FragmentHit {
  StoredFragment fragment;
  float distance = 0.0F;
};

struct SourceCitation {
  std::string doc_id;
  std::uint64_t fragment_id = 0;
  std::string snippet;
  float relevance_score = 0.0F;
};

struct QueryMetadata {
  std::size_t total_chunks_retrieved = 0;
  std::int64_t processing_time_ms = 0;
};

struct QueryResult {
  std::string answer;
  std::vector<SourceCitation> sources;
  QueryMetadata metadata{};
};

struct CaseAggregateResult {
  std::string case_id;
  std::string title;
  double relevance_score = 0.0;
  std::string summary;
  std::vector<std::string> key_findings;
  int document_count = 0;
};

struct CaseInfo {
  std::string case_id;
  std::string title;
  std::string date;
  int document_count = 0;
};

struct IngestResult {
  int ingested = 0;
  int skipped = 0;
};

struct HealthStatus {
  bool initialized = false;
  std::uint64_t documents_loaded = 0;
};

struct ChunkingStrategy {
  int chunk_tokens = 512;
  int overlap_tokens = 50;
};

struct CompletionConfig {
  std::string model = "claude-sonnet-4-5-20250929";
  int max_tokens = 1000;
  float temperature = 0.3F;
};

struct EngineConfig {
  std::string data_dir = "./data/cases";
  std::string store_path = "./data/caserag.sqlite3";
  // Empty means <data_dir>/.ingestion_manifest.json.
  std::string manifest_path;
  std::string metadata_file_name = "metadata.json";
  std::vector<std::string> content_extensions = {".txt", ".pdf", ".docx"};
  int top_k_retrieval = 5;
  int case_pool_size = 50;
  int embedding_dimensions = 384;
  int embedding_cache_capacity = 4096;
  std::size_t snippet_max_chars = 200;
  std::size_t summary_max_chars = 300;
  std::size_t max_key_findings = 5;
  ChunkingStrategy chunking{};
  CompletionConfig completion{};
};

}  // namespace caserag

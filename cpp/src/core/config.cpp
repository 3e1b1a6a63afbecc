#include "caserag/config.hpp"

#include "caserag/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>

namespace caserag {
namespace {

int ParseInt(const std::string& name, const std::string& value) {
  if (value.empty()) {
    throw ConfigError(name + " must not be empty");
  }
  errno = 0;
  char* end = nullptr;
  const long parsed = std::strtol(value.c_str(), &end, 10);
  if (end == nullptr || *end != '\0' || errno == ERANGE ||
      parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
    throw ConfigError(name + " is not a valid integer: '" + value + "'");
  }
  return static_cast<int>(parsed);
}

float ParseFloat(const std::string& name, const std::string& value) {
  if (value.empty()) {
    throw ConfigError(name + " must not be empty");
  }
  errno = 0;
  char* end = nullptr;
  const float parsed = std::strtof(value.c_str(), &end);
  if (end == nullptr || *end != '\0' || errno == ERANGE) {
    throw ConfigError(name + " is not a valid number: '" + value + "'");
  }
  return parsed;
}

}  // namespace

std::optional<std::string> ProcessEnv(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

EngineConfig LoadConfigFromEnv(EngineConfig base, const EnvLookup& lookup) {
  if (const auto v = lookup("CASERAG_DATA_DIR")) {
    base.data_dir = *v;
  }
  if (const auto v = lookup("CASERAG_STORE_PATH")) {
    base.store_path = *v;
  }
  if (const auto v = lookup("CASERAG_MANIFEST_PATH")) {
    base.manifest_path = *v;
  }
  if (const auto v = lookup("CASERAG_TOP_K")) {
    base.top_k_retrieval = ParseInt("CASERAG_TOP_K", *v);
  }
  if (const auto v = lookup("CASERAG_CHUNK_SIZE")) {
    base.chunking.chunk_tokens = ParseInt("CASERAG_CHUNK_SIZE", *v);
  }
  if (const auto v = lookup("CASERAG_CHUNK_OVERLAP")) {
    base.chunking.overlap_tokens = ParseInt("CASERAG_CHUNK_OVERLAP", *v);
  }
  if (const auto v = lookup("CASERAG_LLM_MODEL")) {
    base.completion.model = *v;
  }
  if (const auto v = lookup("CASERAG_LLM_MAX_TOKENS")) {
    base.completion.max_tokens = ParseInt("CASERAG_LLM_MAX_TOKENS", *v);
  }
  if (const auto v = lookup("CASERAG_LLM_TEMPERATURE")) {
    base.completion.temperature = ParseFloat("CASERAG_LLM_TEMPERATURE", *v);
  }
  if (const auto v = lookup("CASERAG_EMBEDDING_DIMS")) {
    base.embedding_dimensions = ParseInt("CASERAG_EMBEDDING_DIMS", *v);
  }
  return base;
}

void ValidateConfig(const EngineConfig& config) {
  if (config.data_dir.empty()) {
    throw ConfigError("data_dir must not be empty");
  }
  if (config.store_path.empty()) {
    throw ConfigError("store_path must not be empty");
  }
  if (config.metadata_file_name.empty()) {
    throw ConfigError("metadata_file_name must not be empty");
  }
  if (config.content_extensions.empty()) {
    throw ConfigError("content_extensions must not be empty");
  }
  if (config.top_k_retrieval <= 0) {
    throw ConfigError("top_k_retrieval must be positive");
  }
  if (config.case_pool_size <= 0) {
    throw ConfigError("case_pool_size must be positive");
  }
  if (config.embedding_dimensions <= 0) {
    throw ConfigError("embedding_dimensions must be positive");
  }
  if (config.chunking.chunk_tokens <= 0) {
    throw ConfigError("chunking.chunk_tokens must be positive");
  }
  if (config.chunking.overlap_tokens < 0 || config.chunking.overlap_tokens >= config.chunking.chunk_tokens) {
    throw ConfigError("chunking.overlap_tokens must be in [0, chunk_tokens)");
  }
  if (config.completion.max_tokens <= 0) {
    throw ConfigError("completion.max_tokens must be positive");
  }
}

std::filesystem::path ResolveManifestPath(const EngineConfig& config) {
  if (!config.manifest_path.empty()) {
    return config.manifest_path;
  }
  return std::filesystem::path(config.data_dir) / ".ingestion_manifest.json";
}

}  // namespace caserag

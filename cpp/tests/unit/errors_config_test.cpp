#include "caserag/config.hpp"
#include "caserag/errors.hpp"
#include "caserag/logging.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace {

using caserag::tests::Require;

caserag::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    const auto it = values.find(name);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

void ScenarioErrorTaxonomy() {
  caserag::tests::Log("scenario: error taxonomy");
  const caserag::ValidationError validation("query must not be empty");
  const caserag::ProviderError provider("backend down");
  const caserag::StoreError store("disk gone");
  const caserag::NotInitializedError not_initialized("Query");

  Require(validation.kind() == caserag::ErrorKind::kValidation, "validation kind mismatch");
  Require(caserag::IsCallerError(validation.kind()), "validation is the caller's fault");
  Require(!caserag::IsCallerError(provider.kind()), "provider failures are not caller errors");
  Require(!caserag::IsCallerError(store.kind()), "store failures are not caller errors");
  Require(std::string(caserag::ErrorKindName(store.kind())) == "store", "kind name mismatch");
  Require(std::string(not_initialized.what()).find("Query") != std::string::npos,
          "not-initialized message should name the operation");

  bool caught_as_runtime_error = false;
  try {
    throw caserag::ManifestError("bad ledger");
  } catch (const std::runtime_error& ex) {
    caught_as_runtime_error = std::string(ex.what()) == "bad ledger";
  }
  Require(caught_as_runtime_error, "engine errors must be std::runtime_error");
}

void ScenarioDefaults() {
  caserag::tests::Log("scenario: defaults");
  const caserag::EngineConfig config{};
  Require(config.top_k_retrieval == 5, "default top-k");
  Require(config.case_pool_size == 50, "default case pool");
  Require(config.chunking.chunk_tokens == 512 && config.chunking.overlap_tokens == 50, "default chunking");
  Require(config.completion.model == "claude-sonnet-4-5-20250929", "default model");
  Require(config.completion.max_tokens == 1000, "default max tokens");
  Require(config.snippet_max_chars == 200 && config.summary_max_chars == 300, "default truncation limits");
  Require(config.max_key_findings == 5, "default key findings limit");
  caserag::ValidateConfig(config);

  Require(caserag::ResolveManifestPath(config) ==
              std::filesystem::path(config.data_dir) / ".ingestion_manifest.json",
          "default manifest path lives under the data dir");
}

void ScenarioEnvOverrides() {
  caserag::tests::Log("scenario: env overrides");
  const auto config = caserag::LoadConfigFromEnv({}, FakeEnv({
                                                         {"CASERAG_DATA_DIR", "/srv/cases"},
                                                         {"CASERAG_TOP_K", "8"},
                                                         {"CASERAG_CHUNK_SIZE", "256"},
                                                         {"CASERAG_CHUNK_OVERLAP", "16"},
                                                         {"CASERAG_LLM_MODEL", "claude-opus-4-1"},
                                                         {"CASERAG_LLM_TEMPERATURE", "0.7"},
                                                         {"CASERAG_MANIFEST_PATH", "/srv/ledger.json"},
                                                     }));
  Require(config.data_dir == "/srv/cases", "data dir override");
  Require(config.top_k_retrieval == 8, "top-k override");
  Require(config.chunking.chunk_tokens == 256 && config.chunking.overlap_tokens == 16, "chunking override");
  Require(config.completion.model == "claude-opus-4-1", "model override");
  Require(config.completion.temperature > 0.69F && config.completion.temperature < 0.71F, "temperature override");
  Require(caserag::ResolveManifestPath(config) == "/srv/ledger.json", "explicit manifest path wins");
}

void ScenarioInvalidValues() {
  caserag::tests::Log("scenario: invalid values");
  bool threw = false;
  try {
    (void)caserag::LoadConfigFromEnv({}, FakeEnv({{"CASERAG_TOP_K", "five"}}));
  } catch (const caserag::ConfigError&) {
    threw = true;
  }
  Require(threw, "non-numeric top-k must raise ConfigError");

  caserag::EngineConfig config{};
  config.chunking.overlap_tokens = config.chunking.chunk_tokens;
  threw = false;
  try {
    caserag::ValidateConfig(config);
  } catch (const caserag::ConfigError&) {
    threw = true;
  }
  Require(threw, "overlap >= chunk size must be rejected");

  config = {};
  config.top_k_retrieval = 0;
  threw = false;
  try {
    caserag::ValidateConfig(config);
  } catch (const caserag::ConfigError&) {
    threw = true;
  }
  Require(threw, "non-positive top-k must be rejected");
}

void ScenarioLogLevels() {
  caserag::tests::Log("scenario: log levels");
  Require(caserag::logging::ParseLevel("WARNING") == spdlog::level::warn, "warning alias");
  Require(caserag::logging::ParseLevel("debug") == spdlog::level::debug, "debug level");
  Require(!caserag::logging::ParseLevel("loud").has_value(), "unknown level");
  Require(caserag::logging::Get() != nullptr, "shared logger must exist");
  Require(caserag::logging::Get()->name() == caserag::logging::kLoggerName, "logger name");
}

}  // namespace

int main() {
  try {
    caserag::tests::Log("errors_config_test: start");
    caserag::tests::ConfigureLibraryLogging();
    ScenarioErrorTaxonomy();
    ScenarioDefaults();
    ScenarioEnvOverrides();
    ScenarioInvalidValues();
    ScenarioLogLevels();
    caserag::tests::Log("errors_config_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    caserag::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

#pragma once

#include "caserag/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace caserag {

class CompletionProvider {
 public:
  virtual ~CompletionProvider() = default;

  // `contexts` are ordered by relevance, most relevant first.
  virtual std::string Complete(const std::string& query, const std::vector<std::string>& contexts) = 0;
};

// Context window size in tokens for a model name, looked up by prefix.
std::optional<int> ModelContextWindow(std::string_view model);

inline constexpr int kDefaultContextWindow = 8192;

struct AnswerPrompt {
  std::string text;
  std::size_t contexts_used = 0;
  int estimated_tokens = 0;
};

// Rough token estimate (4 bytes per token, rounded up).
int EstimateTokens(std::string_view text);

// Assembles the question-answering prompt. Contexts are appended in order until the
// token budget is exhausted; the budget is the model's context window minus the
// completion's max_tokens.
AnswerPrompt BuildAnswerPrompt(const std::string& query,
                               const std::vector<std::string>& contexts,
                               const CompletionConfig& config);

// Offline completion: answers with the context sentences that share the most terms
// with the query.
class ExtractiveCompletionProvider final : public CompletionProvider {
 public:
  explicit ExtractiveCompletionProvider(CompletionConfig config = {}, std::size_t max_sentences = 3);

  std::string Complete(const std::string& query, const std::vector<std::string>& contexts) override;

  [[nodiscard]] const CompletionConfig& config() const { return config_; }

 private:
  CompletionConfig config_;
  std::size_t max_sentences_;
};

}  // namespace caserag

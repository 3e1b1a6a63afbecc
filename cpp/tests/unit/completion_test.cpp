#include "caserag/completion.hpp"

#include "../test_fixtures.hpp"
#include "../test_logger.hpp"

#include <cstdlib>
#include <string>
#include <vector>

namespace {

using caserag::tests::Require;

void ScenarioContextWindowTable() {
  caserag::tests::Log("scenario: context window table");
  Require(caserag::ModelContextWindow("claude-sonnet-4-5-20250929") == 200000, "sonnet 4.5 window");
  Require(caserag::ModelContextWindow("claude-opus-4-1") == 200000, "opus 4 window");
  Require(caserag::ModelContextWindow("claude-3-5-haiku-latest") == 200000, "3.5 window");
  Require(caserag::ModelContextWindow("claude-2.1") == 200000, "2.1 window beats 2.x prefix");
  Require(caserag::ModelContextWindow("claude-2.0") == 100000, "2.0 window");
  Require(caserag::ModelContextWindow("claude-instant-1.2") == 100000, "instant window");
  Require(!caserag::ModelContextWindow("gpt-4o").has_value(), "unknown models have no entry");
}

void ScenarioPromptIncludesContextsInOrder() {
  caserag::tests::Log("scenario: prompt includes contexts in order");
  const caserag::CompletionConfig config{};
  const auto prompt = caserag::BuildAnswerPrompt("Was the defendant competent?",
                                                 {"first excerpt", "second excerpt"}, config);
  Require(prompt.contexts_used == 2, "both contexts should fit");
  const auto first = prompt.text.find("first excerpt");
  const auto second = prompt.text.find("second excerpt");
  Require(first != std::string::npos && second != std::string::npos && first < second, "contexts must keep order");
  Require(prompt.text.find("Question: Was the defendant competent?") != std::string::npos, "question missing");
  Require(prompt.estimated_tokens > 0, "token estimate should be positive");
}

void ScenarioPromptRespectsBudget() {
  caserag::tests::Log("scenario: prompt respects budget");
  caserag::CompletionConfig config{};
  config.model = "unlisted-model";
  config.max_tokens = caserag::kDefaultContextWindow - 300;
  const std::string big(2000, 'x');
  const auto prompt = caserag::BuildAnswerPrompt("q", {"small context", big, "after big"}, config);
  Require(prompt.contexts_used == 1, "context that overflows the budget must stop inclusion");
  Require(prompt.text.find(big) == std::string::npos, "oversized context must be left out");
}

void ScenarioExtractiveAnswer() {
  caserag::tests::Log("scenario: extractive answer");
  caserag::ExtractiveCompletionProvider provider({}, 1);
  const auto answer = provider.Complete(
      "competency finding",
      {"The weather was mild. The evaluator reached a competency finding in March.", "Unrelated text here."});
  Require(answer == "The evaluator reached a competency finding in March.", "best sentence should be quoted");

  const auto empty = provider.Complete("anything", {});
  Require(empty.find("No relevant") != std::string::npos, "no context yields the fallback answer");
}

}  // namespace

int main() {
  try {
    caserag::tests::Log("completion_test: start");
    ScenarioContextWindowTable();
    ScenarioPromptIncludesContextsInOrder();
    ScenarioPromptRespectsBudget();
    ScenarioExtractiveAnswer();
    caserag::tests::Log("completion_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    caserag::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

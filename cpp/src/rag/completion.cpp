#include "caserag/completion.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace caserag {
namespace {

struct ContextWindowEntry {
  std::string_view prefix;
  int tokens;
};

// Longer prefixes come first so "claude-2.1" wins over "claude-2".
constexpr std::array<ContextWindowEntry, 8> kContextWindows = {{
    {"claude-opus-4", 200000},
    {"claude-sonnet-4", 200000},
    {"claude-3-7", 200000},
    {"claude-3-5", 200000},
    {"claude-instant", 100000},
    {"claude-2.1", 200000},
    {"claude-2", 100000},
    {"claude-3", 200000},
}};

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> SplitSentences(const std::string& text) {
  std::vector<std::string> sentences{};
  std::size_t start = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    const bool terminal = ch == '.' || ch == '!' || ch == '?' || ch == '\n';
    if (!terminal) {
      continue;
    }
    auto sentence = Trim(std::string_view(text).substr(start, i + 1 - start));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    start = i + 1;
  }
  auto tail = Trim(std::string_view(text).substr(std::min(start, text.size())));
  if (!tail.empty()) {
    sentences.push_back(std::move(tail));
  }
  return sentences;
}

}  // namespace

std::optional<int> ModelContextWindow(std::string_view model) {
  for (const auto& entry : kContextWindows) {
    if (model.substr(0, entry.prefix.size()) == entry.prefix) {
      return entry.tokens;
    }
  }
  return std::nullopt;
}

int EstimateTokens(std::string_view text) {
  return static_cast<int>((text.size() + 3) / 4);
}

AnswerPrompt BuildAnswerPrompt(const std::string& query,
                               const std::vector<std::string>& contexts,
                               const CompletionConfig& config) {
  const int window = ModelContextWindow(config.model).value_or(kDefaultContextWindow);
  const int budget = std::max(0, window - config.max_tokens);

  std::string head =
      "You are a legal research assistant. Answer the question using only the case excerpts below. "
      "If the excerpts do not contain the answer, say so.\n\n";
  std::string tail = "Question: " + query + "\nAnswer:";

  AnswerPrompt prompt{};
  int used = EstimateTokens(head) + EstimateTokens(tail);
  std::string body{};
  for (std::size_t i = 0; i < contexts.size(); ++i) {
    std::string block = "[Excerpt " + std::to_string(i + 1) + "]\n" + contexts[i] + "\n\n";
    const int cost = EstimateTokens(block);
    if (used + cost > budget) {
      break;
    }
    used += cost;
    body.append(block);
    ++prompt.contexts_used;
  }

  prompt.text = head + body + tail;
  prompt.estimated_tokens = used;
  return prompt;
}

ExtractiveCompletionProvider::ExtractiveCompletionProvider(CompletionConfig config, std::size_t max_sentences)
    : config_(std::move(config)), max_sentences_(max_sentences == 0 ? 1 : max_sentences) {}

std::string ExtractiveCompletionProvider::Complete(const std::string& query, const std::vector<std::string>& contexts) {
  const auto prompt = BuildAnswerPrompt(query, contexts, config_);
  if (prompt.contexts_used == 0) {
    return "No relevant case material was found for this question.";
  }

  const auto query_tokens = Tokenize(query);
  const std::unordered_set<std::string> query_terms(query_tokens.begin(), query_tokens.end());

  struct Candidate {
    std::string sentence;
    std::size_t overlap;
    std::size_t order;
  };
  std::vector<Candidate> candidates{};
  std::unordered_set<std::string> seen{};
  for (std::size_t i = 0; i < prompt.contexts_used; ++i) {
    for (auto& sentence : SplitSentences(contexts[i])) {
      if (!seen.insert(sentence).second) {
        continue;
      }
      std::size_t overlap = 0;
      for (const auto& token : Tokenize(sentence)) {
        if (query_terms.find(token) != query_terms.end()) {
          ++overlap;
        }
      }
      candidates.push_back(Candidate{std::move(sentence), overlap, candidates.size()});
    }
  }
  if (candidates.empty()) {
    return "No relevant case material was found for this question.";
  }

  std::stable_sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.overlap > rhs.overlap;
  });
  if (candidates.size() > max_sentences_) {
    candidates.resize(max_sentences_);
  }
  std::sort(candidates.begin(), candidates.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.order < rhs.order;
  });

  std::string answer{};
  for (const auto& candidate : candidates) {
    if (!answer.empty()) {
      answer.push_back(' ');
    }
    answer.append(candidate.sentence);
  }
  return answer;
}

}  // namespace caserag

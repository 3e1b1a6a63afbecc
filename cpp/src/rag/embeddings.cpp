#include "caserag/embeddings.hpp"

#include "caserag/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace caserag {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens{};
  std::string current{};
  current.reserve(32);

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) != 0) {
      current.push_back(static_cast<char>(std::tolower(ch)));
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(current);
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(current);
  }
  return tokens;
}

std::uint64_t HashToken(std::string_view token) {
  std::uint64_t hash = kFnvOffset;
  for (const unsigned char ch : token) {
    hash ^= static_cast<std::uint64_t>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

void NormalizeL2(std::vector<float>& v) {
  double sum_sq = 0.0;
  for (const auto x : v) {
    sum_sq += static_cast<double>(x) * static_cast<double>(x);
  }
  if (sum_sq <= 0.0) {
    return;
  }
  const auto inv_norm = 1.0 / std::sqrt(sum_sq);
  for (auto& x : v) {
    x = static_cast<float>(static_cast<double>(x) * inv_norm);
  }
}

void RequireDimensions(const std::vector<float>& embedding, int expected) {
  if (embedding.size() != static_cast<std::size_t>(expected)) {
    throw ProviderError("embedding provider returned " + std::to_string(embedding.size()) +
                        " dimensions, expected " + std::to_string(expected));
  }
}

}  // namespace

HashingEmbedder::HashingEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw ConfigError("HashingEmbedder dimensions must be positive");
  }
}

int HashingEmbedder::dimensions() const {
  return dimensions_;
}

std::optional<EmbeddingIdentity> HashingEmbedder::identity() const {
  return EmbeddingIdentity{
      .provider = std::string("caserag"),
      .model = std::string("feature-hashing"),
  };
}

std::vector<float> HashingEmbedder::Compute(const std::string& text) const {
  std::vector<float> embedding(static_cast<std::size_t>(dimensions_), 0.0F);

  const auto tokens = Tokenize(text);
  for (const auto& token : tokens) {
    const auto hash = HashToken(token);
    const auto index = static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_));
    const float sign = ((hash >> 63U) != 0U) ? -1.0F : 1.0F;
    embedding[index] += sign;
  }

  NormalizeL2(embedding);
  return embedding;
}

std::vector<float> HashingEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = memoized_embeddings_.find(text);
    if (cached != memoized_embeddings_.end()) {
      return cached->second;
    }
  }

  auto embedding = Compute(text);

  if (memoization_capacity_ > 0) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (memoized_embeddings_.find(text) == memoized_embeddings_.end()) {
      while (memoized_embeddings_.size() >= memoization_capacity_ && !memoization_order_.empty()) {
        memoized_embeddings_.erase(memoization_order_.front());
        memoization_order_.pop_front();
      }
      memoization_order_.push_back(text);
      memoized_embeddings_[text] = embedding;
    }
  }

  return embedding;
}

std::vector<std::vector<float>> HashingEmbedder::EmbedBatch(const std::vector<std::string>& texts) {
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());
  for (const auto& text : texts) {
    out.push_back(Embed(text));
  }
  return out;
}

std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& embedder,
                                           const std::vector<std::string>& texts,
                                           std::size_t batch_size) {
  if (texts.empty()) {
    return {};
  }
  std::vector<std::vector<float>> out{};
  out.reserve(texts.size());

  try {
    if (auto* batch_embedder = dynamic_cast<BatchEmbeddingProvider*>(&embedder); batch_embedder != nullptr &&
        texts.size() > 1) {
      const std::size_t slice_size = batch_size > 0 ? batch_size : texts.size();
      for (std::size_t start = 0; start < texts.size(); start += slice_size) {
        const auto end = std::min(texts.size(), start + slice_size);
        std::vector<std::string> slice(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                       texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto partial = batch_embedder->EmbedBatch(slice);
        if (partial.size() != slice.size()) {
          throw ProviderError("embedding provider returned a mismatched batch size");
        }
        out.insert(out.end(),
                   std::make_move_iterator(partial.begin()),
                   std::make_move_iterator(partial.end()));
      }
    } else {
      for (const auto& text : texts) {
        out.push_back(embedder.Embed(text));
      }
    }
  } catch (const EngineError&) {
    throw;
  } catch (const std::exception& ex) {
    throw ProviderError(std::string("embedding failed: ") + ex.what());
  }

  for (const auto& embedding : out) {
    RequireDimensions(embedding, embedder.dimensions());
  }
  return out;
}

std::string EmbeddingModelName(const EmbeddingProvider& embedder) {
  const auto identity = embedder.identity();
  if (!identity.has_value() || !identity->model.has_value() || identity->model->empty()) {
    return {};
  }
  return identity->provider.value_or("unknown") + "/" + *identity->model;
}

}  // namespace caserag

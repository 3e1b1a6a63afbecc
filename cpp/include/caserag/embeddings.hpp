#pragma once

#include "caserag/types.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace caserag {

// Names the vectors a provider produces; stores built with one model refuse another.
struct EmbeddingIdentity {
  std::optional<std::string> provider;
  std::optional<std::string> model;
};

class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual std::optional<EmbeddingIdentity> identity() const = 0;
  // Must be safe to call from several threads at once.
  virtual std::vector<float> Embed(const std::string& text) = 0;
};

class BatchEmbeddingProvider : public EmbeddingProvider {
 public:
  ~BatchEmbeddingProvider() override = default;
  virtual std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) = 0;
};

// Deterministic feature-hashing embedder with bounded memoization.
class HashingEmbedder final : public BatchEmbeddingProvider {
 public:
  explicit HashingEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  std::optional<EmbeddingIdentity> identity() const override;
  std::vector<float> Embed(const std::string& text) override;
  std::vector<std::vector<float>> EmbedBatch(const std::vector<std::string>& texts) override;

 private:
  std::vector<float> Compute(const std::string& text) const;

  int dimensions_;
  std::size_t memoization_capacity_ = 0;
  std::unordered_map<std::string, std::vector<float>> memoized_embeddings_{};
  std::deque<std::string> memoization_order_{};
  mutable std::mutex mutex_{};
};

// Embeds every text, using EmbedBatch in slices of `batch_size` when the provider supports it.
// Provider failures are rethrown as ProviderError.
std::vector<std::vector<float>> EmbedTexts(EmbeddingProvider& embedder,
                                           const std::vector<std::string>& texts,
                                           std::size_t batch_size);

// "<provider>/<model>", or empty when the provider does not name its model.
std::string EmbeddingModelName(const EmbeddingProvider& embedder);

}  // namespace caserag

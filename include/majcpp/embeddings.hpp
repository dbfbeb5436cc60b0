#pragma once

#include "majcpp/types.hpp"

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace majcpp {

// Text to fixed-dimension vector. Calls may be slow or billed; callers embed
// each entity once, at creation.
class EmbeddingProvider {
 public:
  virtual ~EmbeddingProvider() = default;

  virtual int dimensions() const = 0;
  virtual Embedding Embed(const std::string& text) = 0;
};

// Deterministic offline embedder. Each lower-cased alphanumeric token adds a
// signed unit to one FNV-1a bucket; the sum is L2 normalised. The most
// recently used `memoization_capacity` texts are kept.
class HashedTokenEmbedder final : public EmbeddingProvider {
 public:
  explicit HashedTokenEmbedder(int dimensions = 384, std::size_t memoization_capacity = 4096);

  int dimensions() const override;
  Embedding Embed(const std::string& text) override;

  [[nodiscard]] std::size_t cache_size() const;
  [[nodiscard]] bool IsMemoized(const std::string& text) const;

 private:
  using RecentList = std::list<std::pair<std::string, Embedding>>;

  Embedding Compute(const std::string& text) const;

  int dimensions_;
  std::size_t memoization_capacity_ = 0;
  RecentList recent_{};
  std::unordered_map<std::string, RecentList::iterator> by_text_{};
  mutable std::mutex mutex_{};
};

// Calls provider.Embed and checks the result against `dimensions`. Provider
// failures and malformed vectors become CollaboratorError; `what` names the
// entity being embedded.
Embedding EmbedChecked(EmbeddingProvider& provider, const std::string& text, int dimensions, const char* what);

}  // namespace majcpp

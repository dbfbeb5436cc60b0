#include "majcpp/embeddings.hpp"
#include "majcpp/errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <exception>
#include <numeric>
#include <stdexcept>
#include <string>

namespace majcpp {
namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

}  // namespace

HashedTokenEmbedder::HashedTokenEmbedder(int dimensions, std::size_t memoization_capacity)
    : dimensions_(dimensions), memoization_capacity_(memoization_capacity) {
  if (dimensions_ <= 0) {
    throw std::runtime_error("HashedTokenEmbedder dimensions must be positive");
  }
}

int HashedTokenEmbedder::dimensions() const {
  return dimensions_;
}

Embedding HashedTokenEmbedder::Compute(const std::string& text) const {
  Embedding sums(static_cast<std::size_t>(dimensions_), 0.0F);
  std::uint64_t hash = kFnvOffset;
  bool in_token = false;
  const auto flush = [&] {
    if (!in_token) {
      return;
    }
    const float sign = (hash >> 63U) != 0U ? -1.0F : 1.0F;
    sums[static_cast<std::size_t>(hash % static_cast<std::uint64_t>(dimensions_))] += sign;
    hash = kFnvOffset;
    in_token = false;
  };

  for (const unsigned char ch : text) {
    if (std::isalnum(ch) == 0) {
      flush();
      continue;
    }
    hash ^= static_cast<std::uint64_t>(std::tolower(ch));
    hash *= kFnvPrime;
    in_token = true;
  }
  flush();

  const double length = std::sqrt(std::inner_product(sums.begin(), sums.end(), sums.begin(), 0.0));
  if (length > 0.0) {
    for (auto& value : sums) {
      value = static_cast<float>(value / length);
    }
  }
  return sums;
}

Embedding HashedTokenEmbedder::Embed(const std::string& text) {
  if (memoization_capacity_ == 0) {
    return Compute(text);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto hit = by_text_.find(text);
  if (hit != by_text_.end()) {
    recent_.splice(recent_.begin(), recent_, hit->second);
    return hit->second->second;
  }

  auto embedding = Compute(text);
  if (recent_.size() >= memoization_capacity_) {
    by_text_.erase(recent_.back().first);
    recent_.pop_back();
  }
  recent_.emplace_front(text, embedding);
  by_text_[text] = recent_.begin();
  return embedding;
}

std::size_t HashedTokenEmbedder::cache_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return recent_.size();
}

bool HashedTokenEmbedder::IsMemoized(const std::string& text) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_text_.find(text) != by_text_.end();
}

Embedding EmbedChecked(EmbeddingProvider& provider, const std::string& text, int dimensions, const char* what) {
  Embedding embedding{};
  try {
    embedding = provider.Embed(text);
  } catch (const std::exception& ex) {
    throw CollaboratorError(std::string("embedder failed for ") + what + ": " + ex.what());
  }
  if (embedding.size() != static_cast<std::size_t>(dimensions)) {
    throw CollaboratorError(std::string("embedder returned ") + std::to_string(embedding.size()) +
                            " dimensions for " + what + ", expected " + std::to_string(dimensions));
  }
  for (const float value : embedding) {
    if (!std::isfinite(value)) {
      throw CollaboratorError(std::string("embedder returned a non-finite value for ") + what);
    }
  }
  return embedding;
}

}  // namespace majcpp

#include "majcpp/cosine_index.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

namespace majcpp {
namespace {

float DotProduct(const float* lhs, const float* rhs, std::size_t n) {
  return std::inner_product(lhs, lhs + n, rhs, 0.0F);
}

float Length(const float* v, std::size_t n) {
  return std::sqrt(std::max(DotProduct(v, v, n), 0.0F));
}

float ScoreFromParts(float dot, float lhs_norm, float rhs_norm) {
  if (lhs_norm <= 0.0F || rhs_norm <= 0.0F) {
    return 0.0F;
  }
  return std::clamp(dot / (lhs_norm * rhs_norm), -1.0F, 1.0F);
}

}  // namespace

float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs) {
  if (lhs.size() != rhs.size()) {
    throw std::runtime_error("CosineSimilarity dimension mismatch");
  }
  const auto n = lhs.size();
  return ScoreFromParts(DotProduct(lhs.data(), rhs.data(), n), Length(lhs.data(), n), Length(rhs.data(), n));
}

CosineIndex::CosineIndex(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw std::runtime_error("CosineIndex dimensions must be positive");
  }
}

void CosineIndex::Add(std::uint64_t slot, const std::vector<float>& vector) {
  if (vector.size() != static_cast<std::size_t>(dimensions_)) {
    throw std::runtime_error("CosineIndex::Add expected " + std::to_string(dimensions_) + " values, got " +
                             std::to_string(vector.size()));
  }
  rows_.insert(rows_.end(), vector.begin(), vector.end());
  norms_.push_back(Length(vector.data(), vector.size()));
  slots_.push_back(slot);
}

std::vector<CosineIndex::Hit> CosineIndex::Search(const std::vector<float>& query, int top_k) const {
  if (query.size() != static_cast<std::size_t>(dimensions_)) {
    throw std::runtime_error("CosineIndex::Search dimension mismatch");
  }
  if (top_k <= 0 || slots_.empty()) {
    return {};
  }

  const auto width = static_cast<std::size_t>(dimensions_);
  const auto query_norm = Length(query.data(), width);
  std::vector<float> scores(slots_.size());
  for (std::size_t row = 0; row < slots_.size(); ++row) {
    const float* values = rows_.data() + row * width;
    scores[row] = ScoreFromParts(DotProduct(query.data(), values, width), query_norm, norms_[row]);
  }

  std::vector<std::size_t> order(slots_.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  const auto keep = std::min(order.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(keep), order.end(),
                    [&scores](std::size_t lhs, std::size_t rhs) {
                      if (scores[lhs] != scores[rhs]) {
                        return scores[lhs] > scores[rhs];
                      }
                      return lhs < rhs;
                    });

  std::vector<Hit> hits{};
  hits.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    hits.emplace_back(slots_[order[i]], scores[order[i]]);
  }
  return hits;
}

void CosineIndex::Clear() {
  rows_.clear();
  norms_.clear();
  slots_.clear();
}

}  // namespace majcpp

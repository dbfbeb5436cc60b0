#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace majcpp {

// Cosine of two equal-length vectors in [-1, 1]; 0 when either has zero norm.
float CosineSimilarity(const std::vector<float>& lhs, const std::vector<float>& rhs);

// Append-only exact cosine index for one node kind. Rows keep their norms so a
// search is one pass of dot products. Equal scores rank by insertion order.
class CosineIndex {
 public:
  using Hit = std::pair<std::uint64_t, float>;

  explicit CosineIndex(int dimensions);

  int dimensions() const { return dimensions_; }
  std::size_t size() const { return slots_.size(); }

  void Add(std::uint64_t slot, const std::vector<float>& vector);
  std::vector<Hit> Search(const std::vector<float>& query, int top_k) const;
  void Clear();

 private:
  int dimensions_;
  std::vector<float> rows_;
  std::vector<float> norms_;
  std::vector<std::uint64_t> slots_;
};

}  // namespace majcpp

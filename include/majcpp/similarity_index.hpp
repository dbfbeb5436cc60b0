#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <vector>

namespace majcpp {

// Per-kind nearest-neighbour lookup. A query against one kind never returns
// nodes of another; an empty result is not an error.
class SimilarityIndex {
 public:
  explicit SimilarityIndex(std::shared_ptr<GraphStore> store);

  [[nodiscard]] std::vector<SimilarityHit> Query(NodeKind kind, const Embedding& vector, int k) const;
  [[nodiscard]] int dimensions() const;

 private:
  std::shared_ptr<GraphStore> store_;
};

}  // namespace majcpp

#include "majcpp/similarity_index.hpp"
#include "majcpp/errors.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace majcpp {

SimilarityIndex::SimilarityIndex(std::shared_ptr<GraphStore> store) : store_(std::move(store)) {
  if (store_ == nullptr) {
    throw std::invalid_argument("SimilarityIndex requires a graph store");
  }
}

std::vector<SimilarityHit> SimilarityIndex::Query(NodeKind kind, const Embedding& vector, int k) const {
  if (k <= 0) {
    return {};
  }
  auto hits = store_->QueryNearest(kind, vector, k);
  if (hits.size() > static_cast<std::size_t>(k)) {
    throw GraphError("SimilarityIndex::Query store returned more than k results");
  }
  for (std::size_t i = 0; i < hits.size(); ++i) {
    if (hits[i].node.kind != kind) {
      throw GraphError("SimilarityIndex::Query store returned a " + std::string(ToString(hits[i].node.kind)) +
                       " node for a " + std::string(ToString(kind)) + " query");
    }
    if (i > 0 && hits[i].score > hits[i - 1].score) {
      throw GraphError("SimilarityIndex::Query store results are not ordered by score");
    }
  }
  return hits;
}

int SimilarityIndex::dimensions() const {
  return store_->dimensions();
}

}  // namespace majcpp

#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <optional>

namespace majcpp {

// Nearest successful and failed Attempts for a query vector. No score floor
// is applied here; see ApplyConfidenceFloors.
class ContrastiveRetriever {
 public:
  explicit ContrastiveRetriever(std::shared_ptr<GraphStore> store, std::optional<RetrievalConfig> config = std::nullopt);

  // Fetches overfetch * k Attempts, then keeps the first k of each polarity
  // in similarity order. Attempts with no recorded verdict are skipped.
  ContrastiveExamples FindContrastive(const Embedding& query, int k) const;

 private:
  std::shared_ptr<GraphStore> store_;
  RetrievalConfig config_{};
};

// Drops positives below positive_floor and negatives below negative_floor.
ContrastiveExamples ApplyConfidenceFloors(ContrastiveExamples examples, float positive_floor, float negative_floor);

}  // namespace majcpp

#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace majcpp {

// Rolls Issues up to their Semantic categories.
class PatternAggregator {
 public:
  explicit PatternAggregator(std::shared_ptr<GraphStore> store, std::optional<RetrievalConfig> config = std::nullopt);

  // Query-driven: the nearest pattern_overfetch * k Issues scoring at least
  // pattern_score_floor, grouped by the Semantic they abstract to. Ordered by
  // frequency, then avg_similarity, both descending; at most k results.
  std::vector<SemanticPattern> FindPatterns(const Embedding& query, int k) const;

  // History-driven: Issues CAUSED by exactly the given Attempts, grouped by
  // Semantic and ordered by issue_count descending. Duplicate ids count once.
  std::vector<HistoryPattern> HistoryPatterns(const std::vector<std::string>& attempt_ids) const;

 private:
  std::shared_ptr<GraphStore> store_;
  RetrievalConfig config_{};
};

}  // namespace majcpp

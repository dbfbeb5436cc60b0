#include "majcpp/contrastive_retriever.hpp"

#include "majcpp/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace majcpp {

ContrastiveRetriever::ContrastiveRetriever(std::shared_ptr<GraphStore> store, std::optional<RetrievalConfig> config)
    : store_(std::move(store)),
      config_(config.has_value() ? *config : LoadMemoryConfigFromEnvironment().retrieval) {
  if (store_ == nullptr) {
    throw std::invalid_argument("ContrastiveRetriever requires a graph store");
  }
  if (config_.contrastive_overfetch <= 0) {
    throw std::invalid_argument("ContrastiveRetriever overfetch must be positive");
  }
}

ContrastiveExamples ContrastiveRetriever::FindContrastive(const Embedding& query, int k) const {
  ContrastiveExamples out{};
  if (k <= 0) {
    return out;
  }
  const auto candidates =
      store_->QueryNearest(NodeKind::kAttempt, query, OverfetchTopK(config_.contrastive_overfetch, k));
  const auto limit = static_cast<std::size_t>(k);
  for (const auto& hit : candidates) {
    if (out.positive.size() >= limit && out.negative.size() >= limit) {
      break;
    }
    if (!hit.node.is_successful.has_value()) {
      continue;
    }
    auto& bucket = *hit.node.is_successful ? out.positive : out.negative;
    if (bucket.size() < limit) {
      bucket.push_back(ScoredAttempt{AttemptFromNode(hit.node), hit.score});
    }
  }
  return out;
}

ContrastiveExamples ApplyConfidenceFloors(ContrastiveExamples examples, float positive_floor, float negative_floor) {
  const auto below = [](float floor) {
    return [floor](const ScoredAttempt& item) { return item.score < floor; };
  };
  examples.positive.erase(
      std::remove_if(examples.positive.begin(), examples.positive.end(), below(positive_floor)),
      examples.positive.end());
  examples.negative.erase(
      std::remove_if(examples.negative.begin(), examples.negative.end(), below(negative_floor)),
      examples.negative.end());
  return examples;
}

}  // namespace majcpp

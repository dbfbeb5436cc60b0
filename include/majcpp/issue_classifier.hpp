#pragma once

#include "majcpp/embeddings.hpp"
#include "majcpp/evaluator.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <vector>

namespace majcpp {

struct ClassifiedIssue {
  Semantic semantic;
  bool is_new = false;
};

// Maps an Issue onto an existing Semantic category or proposes a new one.
// Nothing is persisted here.
class IssueClassifier {
 public:
  IssueClassifier(std::shared_ptr<CategoryClassifier> classifier,
                  std::shared_ptr<EmbeddingProvider> embedder = nullptr,
                  int dimensions = 0);

  ClassifiedIssue Classify(const Issue& issue, const std::vector<Semantic>& existing) const;

 private:
  Semantic NewSemantic(const CategoryDecision& decision, const Issue& issue) const;

  std::shared_ptr<CategoryClassifier> classifier_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  int dimensions_ = 0;
};

}  // namespace majcpp

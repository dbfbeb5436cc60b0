#include "majcpp/issue_classifier.hpp"

#include "majcpp/errors.hpp"
#include "majcpp/log.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace majcpp {

IssueClassifier::IssueClassifier(std::shared_ptr<CategoryClassifier> classifier,
                                 std::shared_ptr<EmbeddingProvider> embedder,
                                 int dimensions)
    : classifier_(std::move(classifier)), embedder_(std::move(embedder)), dimensions_(dimensions) {
  if (classifier_ == nullptr) {
    throw std::invalid_argument("IssueClassifier requires a category classifier");
  }
  if (embedder_ != nullptr && dimensions_ <= 0) {
    dimensions_ = embedder_->dimensions();
  }
}

ClassifiedIssue IssueClassifier::Classify(const Issue& issue, const std::vector<Semantic>& existing) const {
  ClassificationRequest request{};
  request.issue_description = issue.description;
  request.existing_categories.reserve(existing.size());
  for (const auto& semantic : existing) {
    request.existing_categories.push_back(CategorySummary{semantic.name, semantic.description});
  }

  CategoryDecision decision{};
  try {
    decision = classifier_->ClassifyIssue(request);
  } catch (const std::exception& ex) {
    throw CollaboratorError(std::string("IssueClassifier::Classify classifier failed: ") + ex.what());
  }
  if (decision.name.empty()) {
    throw CollaboratorError("IssueClassifier::Classify classifier returned an empty category name");
  }

  if (!decision.is_new) {
    for (const auto& semantic : existing) {
      if (semantic.name == decision.name) {
        return ClassifiedIssue{semantic, false};
      }
    }
    log::Warn("IssueClassifier: unknown category '" + decision.name + "' claimed as existing, creating it");
  }
  return ClassifiedIssue{NewSemantic(decision, issue), true};
}

Semantic IssueClassifier::NewSemantic(const CategoryDecision& decision, const Issue& issue) const {
  Semantic semantic{};
  semantic.name = decision.name;
  semantic.description = decision.description.empty() ? issue.description : decision.description;
  if (embedder_ != nullptr) {
    semantic.embedding = EmbedChecked(*embedder_, semantic.name + ": " + semantic.description, dimensions_,
                                      "semantic category");
  }
  return semantic;
}

}  // namespace majcpp

#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace majcpp {

// Typed edges. Every Link* call throws NotFoundError when an endpoint has not
// been persisted yet; the caller decides whether to retry.
class RelationshipStore {
 public:
  explicit RelationshipStore(std::shared_ptr<GraphStore> store);

  void LinkAttemptSatisfiesPolicy(const std::string& attempt_id, const std::string& policy_id);
  void LinkAttemptCausesIssue(const std::string& attempt_id, const std::string& issue_id);
  void LinkFixResolvesIssue(const std::string& fix_id, const std::string& issue_id);
  void LinkIssueAbstractsToSemantic(const std::string& issue_id, const std::string& semantic_id);
  void Link(const Relationship& relationship);

  [[nodiscard]] bool Exists(const Relationship& relationship) const;

  [[nodiscard]] std::vector<Attempt> AttemptsForPolicy(const std::string& policy_id) const;
  [[nodiscard]] std::vector<Issue> IssuesForAttempt(const std::string& attempt_id) const;
  [[nodiscard]] std::vector<Fix> FixesForIssue(const std::string& issue_id) const;
  [[nodiscard]] std::vector<Semantic> SemanticsForIssue(const std::string& issue_id) const;

 private:
  std::shared_ptr<GraphStore> store_;
};

}  // namespace majcpp

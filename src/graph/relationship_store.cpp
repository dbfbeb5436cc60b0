#include "majcpp/relationship_store.hpp"

#include <stdexcept>
#include <utility>

namespace majcpp {

RelationshipStore::RelationshipStore(std::shared_ptr<GraphStore> store) : store_(std::move(store)) {
  if (store_ == nullptr) {
    throw std::invalid_argument("RelationshipStore requires a graph store");
  }
}

void RelationshipStore::LinkAttemptSatisfiesPolicy(const std::string& attempt_id, const std::string& policy_id) {
  store_->CreateRelationship(RelationKind::kSatisfies, attempt_id, policy_id);
}

void RelationshipStore::LinkAttemptCausesIssue(const std::string& attempt_id, const std::string& issue_id) {
  store_->CreateRelationship(RelationKind::kCauses, attempt_id, issue_id);
}

void RelationshipStore::LinkFixResolvesIssue(const std::string& fix_id, const std::string& issue_id) {
  store_->CreateRelationship(RelationKind::kResolves, fix_id, issue_id);
}

void RelationshipStore::LinkIssueAbstractsToSemantic(const std::string& issue_id, const std::string& semantic_id) {
  store_->CreateRelationship(RelationKind::kAbstractsTo, issue_id, semantic_id);
}

void RelationshipStore::Link(const Relationship& relationship) {
  store_->CreateRelationship(relationship.kind, relationship.from_id, relationship.to_id);
}

bool RelationshipStore::Exists(const Relationship& relationship) const {
  return store_->HasRelationship(relationship.kind, relationship.from_id, relationship.to_id);
}

std::vector<Attempt> RelationshipStore::AttemptsForPolicy(const std::string& policy_id) const {
  std::vector<Attempt> out{};
  for (const auto& neighbor : store_->Incoming(policy_id, RelationKind::kSatisfies)) {
    out.push_back(AttemptFromNode(neighbor.node));
  }
  return out;
}

std::vector<Issue> RelationshipStore::IssuesForAttempt(const std::string& attempt_id) const {
  std::vector<Issue> out{};
  for (const auto& neighbor : store_->Outgoing({attempt_id}, RelationKind::kCauses)) {
    out.push_back(IssueFromNode(neighbor.node));
  }
  return out;
}

std::vector<Fix> RelationshipStore::FixesForIssue(const std::string& issue_id) const {
  std::vector<Fix> out{};
  for (const auto& neighbor : store_->Incoming(issue_id, RelationKind::kResolves)) {
    out.push_back(FixFromNode(neighbor.node));
  }
  return out;
}

std::vector<Semantic> RelationshipStore::SemanticsForIssue(const std::string& issue_id) const {
  std::vector<Semantic> out{};
  for (const auto& neighbor : store_->Outgoing({issue_id}, RelationKind::kAbstractsTo)) {
    out.push_back(SemanticFromNode(neighbor.node));
  }
  return out;
}

}  // namespace majcpp

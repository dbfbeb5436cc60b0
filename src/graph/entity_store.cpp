#include "majcpp/entity_store.hpp"

#include <stdexcept>
#include <utility>

namespace majcpp {

EntityStore::EntityStore(std::shared_ptr<GraphStore> store) : store_(std::move(store)) {
  if (store_ == nullptr) {
    throw std::invalid_argument("EntityStore requires a graph store");
  }
}

std::string EntityStore::CreatePolicy(const Policy& policy) {
  store_->CreateNode(ToNode(policy));
  return policy.id;
}

std::string EntityStore::CreateAttempt(const Attempt& attempt) {
  store_->CreateNode(ToNode(attempt));
  return attempt.id;
}

std::string EntityStore::CreateIssue(const Issue& issue) {
  store_->CreateNode(ToNode(issue));
  return issue.id;
}

std::string EntityStore::CreateFix(const Fix& fix) {
  store_->CreateNode(ToNode(fix));
  return fix.id;
}

std::string EntityStore::CreateSemantic(const Semantic& semantic) {
  store_->CreateNode(ToNode(semantic));
  return semantic.id;
}

std::optional<Node> EntityStore::GetOfKind(const std::string& id, NodeKind kind) const {
  auto node = store_->GetNode(id);
  if (!node.has_value() || node->kind != kind) {
    return std::nullopt;
  }
  return node;
}

std::optional<Policy> EntityStore::GetPolicy(const std::string& id) const {
  const auto node = GetOfKind(id, NodeKind::kPolicy);
  if (!node.has_value()) {
    return std::nullopt;
  }
  return PolicyFromNode(*node);
}

std::optional<Attempt> EntityStore::GetAttempt(const std::string& id) const {
  const auto node = GetOfKind(id, NodeKind::kAttempt);
  if (!node.has_value()) {
    return std::nullopt;
  }
  return AttemptFromNode(*node);
}

std::optional<Issue> EntityStore::GetIssue(const std::string& id) const {
  const auto node = GetOfKind(id, NodeKind::kIssue);
  if (!node.has_value()) {
    return std::nullopt;
  }
  return IssueFromNode(*node);
}

std::optional<Fix> EntityStore::GetFix(const std::string& id) const {
  const auto node = GetOfKind(id, NodeKind::kFix);
  if (!node.has_value()) {
    return std::nullopt;
  }
  return FixFromNode(*node);
}

std::optional<Semantic> EntityStore::GetSemantic(const std::string& id) const {
  const auto node = GetOfKind(id, NodeKind::kSemantic);
  if (!node.has_value()) {
    return std::nullopt;
  }
  return SemanticFromNode(*node);
}

bool EntityStore::Exists(const std::string& id) const {
  return store_->GetNode(id).has_value();
}

std::vector<Semantic> EntityStore::AllSemantics() const {
  const auto nodes = store_->NodesOfKind(NodeKind::kSemantic);
  std::vector<Semantic> out{};
  out.reserve(nodes.size());
  for (const auto& node : nodes) {
    out.push_back(SemanticFromNode(node));
  }
  return out;
}

std::size_t EntityStore::Count(NodeKind kind) const {
  return store_->NodeCount(kind);
}

void EntityStore::Clear() {
  store_->Clear();
}

}  // namespace majcpp

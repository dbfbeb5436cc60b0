#include "majcpp/in_memory_graph_store.hpp"
#include "majcpp/errors.hpp"

#include "node_validation.hpp"

#include <stdexcept>
#include <utility>

namespace majcpp {

InMemoryGraphStore::InMemoryGraphStore(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw std::runtime_error("InMemoryGraphStore dimensions must be positive");
  }
  for (auto& index : indexes_) {
    index = std::make_unique<CosineIndex>(dimensions_);
  }
}

int InMemoryGraphStore::dimensions() const {
  return dimensions_;
}

std::string InMemoryGraphStore::AdjacencyKey(RelationKind kind, const std::string& id) {
  return std::string(ToString(kind)) + '\x1F' + id;
}

std::string InMemoryGraphStore::EdgeKey(RelationKind kind, const std::string& from_id, const std::string& to_id) {
  return AdjacencyKey(kind, from_id) + '\x1F' + to_id;
}

void InMemoryGraphStore::InsertLocked(const Node& node) {
  store::ValidateNodeForInsert(node, dimensions_, "InMemoryGraphStore::CreateNode");
  if (nodes_.find(node.id) != nodes_.end()) {
    throw DuplicateEntityError("InMemoryGraphStore::CreateNode duplicate id: " + node.id, node.id);
  }

  const auto slot = next_slot_++;
  const auto kind_index = KindIndex(node.kind);
  if (node.embedding.has_value()) {
    indexes_[kind_index]->Add(slot, *node.embedding);
  }
  slot_ids_.emplace(slot, node.id);
  insertion_order_[kind_index].push_back(node.id);
  nodes_.emplace(node.id, StoredNode{node, slot});
}

void InMemoryGraphStore::CreateNode(const Node& node) {
  std::lock_guard<std::mutex> lock(mutex_);
  InsertLocked(node);
}

UpsertResult InMemoryGraphStore::CreateNodeUnlessSimilar(const Node& candidate, float threshold) {
  if (!candidate.embedding.has_value()) {
    throw GraphError("InMemoryGraphStore::CreateNodeUnlessSimilar candidate requires an embedding");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  const auto nearest = QueryNearestLocked(candidate.kind, *candidate.embedding, 1);
  if (!nearest.empty() && nearest.front().score >= threshold) {
    return UpsertResult{nearest.front().node.id, false};
  }
  InsertLocked(candidate);
  return UpsertResult{candidate.id, true};
}

std::optional<Node> InMemoryGraphStore::GetNode(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second.node;
}

void InMemoryGraphStore::CreateRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto from_it = nodes_.find(from_id);
  if (from_it == nodes_.end()) {
    throw NotFoundError("InMemoryGraphStore::CreateRelationship endpoint not found: " + from_id, from_id);
  }
  const auto to_it = nodes_.find(to_id);
  if (to_it == nodes_.end()) {
    throw NotFoundError("InMemoryGraphStore::CreateRelationship endpoint not found: " + to_id, to_id);
  }
  store::ValidateEndpointKinds(kind, from_it->second.node.kind, to_it->second.node.kind,
                               "InMemoryGraphStore::CreateRelationship");

  if (!edge_keys_.insert(EdgeKey(kind, from_id, to_id)).second) {
    return;
  }
  outgoing_[AdjacencyKey(kind, from_id)].push_back(to_id);
  incoming_[AdjacencyKey(kind, to_id)].push_back(from_id);
}

bool InMemoryGraphStore::HasRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return edge_keys_.find(EdgeKey(kind, from_id, to_id)) != edge_keys_.end();
}

std::vector<SimilarityHit> InMemoryGraphStore::QueryNearestLocked(NodeKind kind,
                                                                  const Embedding& vector,
                                                                  int top_k) const {
  store::ValidateQueryVector(vector, dimensions_, "InMemoryGraphStore::QueryNearest");
  if (top_k <= 0) {
    return {};
  }
  const auto ranked = indexes_[KindIndex(kind)]->Search(vector, top_k);
  std::vector<SimilarityHit> hits{};
  hits.reserve(ranked.size());
  for (const auto& [slot, score] : ranked) {
    const auto id_it = slot_ids_.find(slot);
    if (id_it == slot_ids_.end()) {
      throw GraphError("InMemoryGraphStore::QueryNearest index references unknown slot");
    }
    hits.push_back(SimilarityHit{nodes_.at(id_it->second).node, score});
  }
  return hits;
}

std::vector<SimilarityHit> InMemoryGraphStore::QueryNearest(NodeKind kind, const Embedding& vector, int top_k) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return QueryNearestLocked(kind, vector, top_k);
}

std::vector<Neighbor> InMemoryGraphStore::Outgoing(const std::vector<std::string>& from_ids, RelationKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Neighbor> out{};
  for (const auto& from_id : from_ids) {
    const auto it = outgoing_.find(AdjacencyKey(kind, from_id));
    if (it == outgoing_.end()) {
      continue;
    }
    for (const auto& to_id : it->second) {
      out.push_back(Neighbor{from_id, nodes_.at(to_id).node});
    }
  }
  return out;
}

std::vector<Neighbor> InMemoryGraphStore::Incoming(const std::string& to_id, RelationKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Neighbor> out{};
  const auto it = incoming_.find(AdjacencyKey(kind, to_id));
  if (it == incoming_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const auto& from_id : it->second) {
    out.push_back(Neighbor{from_id, nodes_.at(from_id).node});
  }
  return out;
}

std::vector<Node> InMemoryGraphStore::NodesOfKind(NodeKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& ids = insertion_order_[KindIndex(kind)];
  std::vector<Node> out{};
  out.reserve(ids.size());
  for (const auto& id : ids) {
    out.push_back(nodes_.at(id).node);
  }
  return out;
}

std::size_t InMemoryGraphStore::NodeCount(std::optional<NodeKind> kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!kind.has_value()) {
    return nodes_.size();
  }
  return insertion_order_[KindIndex(*kind)].size();
}

std::size_t InMemoryGraphStore::RelationshipCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return edge_keys_.size();
}

void InMemoryGraphStore::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  nodes_.clear();
  slot_ids_.clear();
  for (auto& ids : insertion_order_) {
    ids.clear();
  }
  for (auto& index : indexes_) {
    index->Clear();
  }
  outgoing_.clear();
  incoming_.clear();
  edge_keys_.clear();
  next_slot_ = 0;
}

}  // namespace majcpp

#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/cosine_index.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace majcpp {

// Process-local graph store: one cosine index per node kind plus
// adjacency lists. A single mutex serialises all calls.
class InMemoryGraphStore final : public GraphStore {
 public:
  explicit InMemoryGraphStore(int dimensions);

  int dimensions() const override;
  void CreateNode(const Node& node) override;
  UpsertResult CreateNodeUnlessSimilar(const Node& candidate, float threshold) override;
  std::optional<Node> GetNode(const std::string& id) const override;
  void CreateRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) override;
  bool HasRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) const override;
  std::vector<SimilarityHit> QueryNearest(NodeKind kind, const Embedding& vector, int top_k) const override;
  std::vector<Neighbor> Outgoing(const std::vector<std::string>& from_ids, RelationKind kind) const override;
  std::vector<Neighbor> Incoming(const std::string& to_id, RelationKind kind) const override;
  std::vector<Node> NodesOfKind(NodeKind kind) const override;
  std::size_t NodeCount(std::optional<NodeKind> kind = std::nullopt) const override;
  std::size_t RelationshipCount() const override;
  void Clear() override;

 private:
  struct StoredNode {
    Node node;
    std::uint64_t slot = 0;
  };

  void InsertLocked(const Node& node);
  std::vector<SimilarityHit> QueryNearestLocked(NodeKind kind, const Embedding& vector, int top_k) const;

  static std::string AdjacencyKey(RelationKind kind, const std::string& id);
  static std::string EdgeKey(RelationKind kind, const std::string& from_id, const std::string& to_id);

  int dimensions_;
  std::uint64_t next_slot_ = 0;
  std::unordered_map<std::string, StoredNode> nodes_;
  std::unordered_map<std::uint64_t, std::string> slot_ids_;
  std::array<std::vector<std::string>, kNodeKindCount> insertion_order_{};
  std::array<std::unique_ptr<CosineIndex>, kNodeKindCount> indexes_{};
  std::unordered_map<std::string, std::vector<std::string>> outgoing_;
  std::unordered_map<std::string, std::vector<std::string>> incoming_;
  std::unordered_set<std::string> edge_keys_;
  mutable std::mutex mutex_{};
};

}  // namespace majcpp

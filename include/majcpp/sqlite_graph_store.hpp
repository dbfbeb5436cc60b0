#pragma once

#include "majcpp/graph_store.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace majcpp {

// Graph store on a SQLite database file (or ":memory:"). Similarity is an
// exact cosine scan over the kind's stored embeddings. Conditional inserts run
// inside BEGIN IMMEDIATE, so dedup stays strict across processes sharing the
// same file.
class SqliteGraphStore final : public GraphStore {
 public:
  SqliteGraphStore(const std::string& path, int dimensions);
  ~SqliteGraphStore() override;
  SqliteGraphStore(const SqliteGraphStore&) = delete;
  SqliteGraphStore& operator=(const SqliteGraphStore&) = delete;

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

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  struct SQLiteState;

  void InsertLocked(const Node& node);
  std::vector<SimilarityHit> QueryNearestLocked(NodeKind kind, const Embedding& vector, int top_k) const;

  std::string path_;
  int dimensions_;
  std::unique_ptr<SQLiteState> sqlite_;
  mutable std::mutex mutex_{};
};

}  // namespace majcpp

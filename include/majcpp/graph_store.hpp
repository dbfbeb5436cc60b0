#pragma once

#include "majcpp/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace majcpp {

// Persistence and query boundary for the experience graph. Implementations
// must be safe to call from any thread; every method is one blocking round
// trip. Store failures surface as GraphError (or a subclass).
class GraphStore {
 public:
  virtual ~GraphStore() = default;

  // Dimension shared by every embedding of every node kind.
  virtual int dimensions() const = 0;

  // Throws DuplicateEntityError when the id is taken. A present embedding
  // must have exactly dimensions() entries.
  virtual void CreateNode(const Node& node) = 0;

  // Atomic form of "k=1 nearest of the candidate's kind; reuse when
  // score >= threshold, otherwise insert". The check and the insert run under
  // the store's write lock so concurrent callers cannot both insert. The
  // candidate must carry an embedding.
  virtual UpsertResult CreateNodeUnlessSimilar(const Node& candidate, float threshold) = 0;

  virtual std::optional<Node> GetNode(const std::string& id) const = 0;

  // Throws NotFoundError when either endpoint is missing; nothing is stored
  // in that case. Creating an existing edge again is a no-op.
  virtual void CreateRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) = 0;
  virtual bool HasRelationship(RelationKind kind, const std::string& from_id, const std::string& to_id) const = 0;

  // Nearest nodes of one kind by cosine similarity, best first, at most top_k.
  // Nodes without an embedding never match.
  virtual std::vector<SimilarityHit> QueryNearest(NodeKind kind, const Embedding& vector, int top_k) const = 0;

  // One hop along `kind` from each id in `from_ids`. Results follow the order
  // of `from_ids`, then edge creation order. Unknown ids contribute nothing.
  virtual std::vector<Neighbor> Outgoing(const std::vector<std::string>& from_ids, RelationKind kind) const = 0;

  // Sources of `kind` edges pointing at `to_id`, in edge creation order.
  // `from_id` of each result is the source node id.
  virtual std::vector<Neighbor> Incoming(const std::string& to_id, RelationKind kind) const = 0;

  // Every node of a kind in insertion order.
  virtual std::vector<Node> NodesOfKind(NodeKind kind) const = 0;

  virtual std::size_t NodeCount(std::optional<NodeKind> kind = std::nullopt) const = 0;
  virtual std::size_t RelationshipCount() const = 0;

  // Deletes every node and edge. Safe to call on an empty store.
  virtual void Clear() = 0;
};

}  // namespace majcpp

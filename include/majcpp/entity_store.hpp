#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace majcpp {

// Typed create/read over the graph store. Creation never deduplicates; use
// DedupEngine for Policy and Semantic reuse.
class EntityStore {
 public:
  explicit EntityStore(std::shared_ptr<GraphStore> store);

  std::string CreatePolicy(const Policy& policy);
  std::string CreateAttempt(const Attempt& attempt);
  std::string CreateIssue(const Issue& issue);
  std::string CreateFix(const Fix& fix);
  std::string CreateSemantic(const Semantic& semantic);

  [[nodiscard]] std::optional<Policy> GetPolicy(const std::string& id) const;
  [[nodiscard]] std::optional<Attempt> GetAttempt(const std::string& id) const;
  [[nodiscard]] std::optional<Issue> GetIssue(const std::string& id) const;
  [[nodiscard]] std::optional<Fix> GetFix(const std::string& id) const;
  [[nodiscard]] std::optional<Semantic> GetSemantic(const std::string& id) const;
  [[nodiscard]] bool Exists(const std::string& id) const;

  [[nodiscard]] std::vector<Semantic> AllSemantics() const;
  [[nodiscard]] std::size_t Count(NodeKind kind) const;

  // Full wipe of nodes and edges. Test/reset only.
  void Clear();

 private:
  std::optional<Node> GetOfKind(const std::string& id, NodeKind kind) const;

  std::shared_ptr<GraphStore> store_;
};

}  // namespace majcpp

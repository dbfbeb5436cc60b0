#pragma once

#include "majcpp/graph_store.hpp"
#include "majcpp/types.hpp"

#include <memory>
#include <optional>

namespace majcpp {

// Get-or-create for Policy and Semantic nodes. A candidate whose nearest
// same-kind neighbour scores at or above the threshold is folded into that
// neighbour; otherwise it is stored as given.
//
// Threshold resolution: explicit argument, then the instance config, then
// DefaultDedupConfig() (environment over built-in defaults).
class DedupEngine {
 public:
  explicit DedupEngine(std::shared_ptr<GraphStore> store, std::optional<DedupConfig> config = std::nullopt);

  // Throws std::invalid_argument for kinds other than Policy/Semantic and for
  // thresholds outside [-1, 1]. Store errors propagate unchanged.
  UpsertResult GetOrCreate(const Node& candidate, std::optional<float> threshold = std::nullopt);

  UpsertResult GetOrCreatePolicy(const Policy& policy, std::optional<float> threshold = std::nullopt);
  UpsertResult GetOrCreateSemantic(const Semantic& semantic, std::optional<float> threshold = std::nullopt);

  [[nodiscard]] float ResolveThreshold(NodeKind kind, std::optional<float> threshold) const;
  [[nodiscard]] const DedupConfig& config() const { return config_; }

 private:
  UpsertResult ResolveConflict(const Node& candidate, float threshold);

  std::shared_ptr<GraphStore> store_;
  DedupConfig config_{};
};

}  // namespace majcpp

#include "majcpp/dedup_engine.hpp"

#include "majcpp/config.hpp"
#include "majcpp/errors.hpp"
#include "majcpp/log.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace majcpp {
namespace {

void LogDecision(const Node& candidate, const UpsertResult& result, float threshold) {
  if (!log::Enabled(log::Level::kDebug)) {
    return;
  }
  std::string message = "dedup ";
  message += ToString(candidate.kind);
  message += result.created ? " created " : " reused ";
  message += result.id;
  message += " threshold=" + std::to_string(threshold);
  log::Debug(message);
}

}  // namespace

DedupEngine::DedupEngine(std::shared_ptr<GraphStore> store, std::optional<DedupConfig> config)
    : store_(std::move(store)), config_(config.has_value() ? *config : DefaultDedupConfig()) {
  if (store_ == nullptr) {
    throw std::invalid_argument("DedupEngine requires a graph store");
  }
}

float DedupEngine::ResolveThreshold(NodeKind kind, std::optional<float> threshold) const {
  float resolved = 0.0F;
  if (threshold.has_value()) {
    resolved = *threshold;
  } else if (kind == NodeKind::kPolicy) {
    resolved = config_.policy_threshold;
  } else if (kind == NodeKind::kSemantic) {
    resolved = config_.semantic_threshold;
  } else {
    throw std::invalid_argument("DedupEngine does not deduplicate " + std::string(ToString(kind)) + " nodes");
  }
  if (!std::isfinite(resolved) || resolved < -1.0F || resolved > 1.0F) {
    throw std::invalid_argument("DedupEngine threshold must be finite and within [-1, 1]");
  }
  return resolved;
}

UpsertResult DedupEngine::GetOrCreate(const Node& candidate, std::optional<float> threshold) {
  if (candidate.kind != NodeKind::kPolicy && candidate.kind != NodeKind::kSemantic) {
    throw std::invalid_argument("DedupEngine does not deduplicate " + std::string(ToString(candidate.kind)) +
                                " nodes");
  }
  const float resolved = ResolveThreshold(candidate.kind, threshold);

  if (!candidate.embedding.has_value()) {
    store_->CreateNode(candidate);
    UpsertResult result{candidate.id, true};
    LogDecision(candidate, result, resolved);
    return result;
  }

  UpsertResult result{};
  try {
    result = store_->CreateNodeUnlessSimilar(candidate, resolved);
  } catch (const DuplicateEntityError&) {
    result = ResolveConflict(candidate, resolved);
  }
  LogDecision(candidate, result, resolved);
  return result;
}

UpsertResult DedupEngine::ResolveConflict(const Node& candidate, float threshold) {
  const auto nearest = store_->QueryNearest(candidate.kind, *candidate.embedding, 1);
  if (!nearest.empty() && nearest.front().score >= threshold) {
    return UpsertResult{nearest.front().node.id, false};
  }
  const auto existing = store_->GetNode(candidate.id);
  if (existing.has_value() && existing->kind == candidate.kind) {
    return UpsertResult{existing->id, false};
  }
  throw DuplicateEntityError("DedupEngine::GetOrCreate id taken by an unrelated node: " + candidate.id,
                             candidate.id);
}

UpsertResult DedupEngine::GetOrCreatePolicy(const Policy& policy, std::optional<float> threshold) {
  return GetOrCreate(ToNode(policy), threshold);
}

UpsertResult DedupEngine::GetOrCreateSemantic(const Semantic& semantic, std::optional<float> threshold) {
  return GetOrCreate(ToNode(semantic), threshold);
}

}  // namespace majcpp

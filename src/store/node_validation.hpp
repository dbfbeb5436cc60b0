#pragma once

#include "majcpp/errors.hpp"
#include "majcpp/types.hpp"

#include <cmath>
#include <string>

namespace majcpp::store {

inline void ValidateNodeForInsert(const Node& node, int dimensions, const char* what) {
  if (node.id.empty()) {
    throw GraphError(std::string(what) + " node id must be non-empty");
  }
  if (node.kind == NodeKind::kSemantic && (!node.name.has_value() || node.name->empty())) {
    throw GraphError(std::string(what) + " Semantic node requires a name");
  }
  if (!node.embedding.has_value()) {
    return;
  }
  if (node.embedding->size() != static_cast<std::size_t>(dimensions)) {
    throw GraphError(std::string(what) + " embedding dimension mismatch: expected " + std::to_string(dimensions) +
                     ", got " + std::to_string(node.embedding->size()));
  }
  for (const float value : *node.embedding) {
    if (!std::isfinite(value)) {
      throw GraphError(std::string(what) + " embedding contains a non-finite value");
    }
  }
}

inline void ValidateQueryVector(const Embedding& vector, int dimensions, const char* what) {
  if (vector.size() != static_cast<std::size_t>(dimensions)) {
    throw GraphError(std::string(what) + " query dimension mismatch: expected " + std::to_string(dimensions) +
                     ", got " + std::to_string(vector.size()));
  }
}

inline void ValidateEndpointKinds(RelationKind kind, NodeKind from, NodeKind to, const char* what) {
  const auto expected = EndpointsOf(kind);
  if (expected.from != from || expected.to != to) {
    throw GraphError(std::string(what) + " " + std::string(ToString(kind)) + " expects " +
                     std::string(ToString(expected.from)) + " -> " + std::string(ToString(expected.to)) + ", got " +
                     std::string(ToString(from)) + " -> " + std::string(ToString(to)));
  }
}

}  // namespace majcpp::store

#include "majcpp/types.hpp"

#include <array>
#include <cstdint>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>

namespace majcpp {
namespace {

constexpr std::array<std::string_view, kNodeKindCount> kNodeKindNames = {
    "Policy",
    "Attempt",
    "Issue",
    "Fix",
    "Semantic",
};

constexpr std::array<std::string_view, 4> kRelationKindNames = {
    "SATISFIES",
    "CAUSES",
    "RESOLVES",
    "ABSTRACTS_TO",
};

std::mt19937_64& IdEngine() {
  static std::mt19937_64 engine = []() {
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device(), device(), device(), device(), device()};
    return std::mt19937_64(seed);
  }();
  return engine;
}

std::mutex& IdMutex() {
  static std::mutex mutex;
  return mutex;
}

void ExpectKind(const Node& node, NodeKind expected, const char* what) {
  if (node.kind != expected) {
    throw std::invalid_argument(std::string(what) + " expects a " + std::string(ToString(expected)) +
                                " node, got " + std::string(ToString(node.kind)));
  }
}

}  // namespace

std::string_view ToString(NodeKind kind) {
  return kNodeKindNames[KindIndex(kind)];
}

std::string_view ToString(RelationKind kind) {
  return kRelationKindNames[static_cast<std::size_t>(kind)];
}

std::optional<NodeKind> ParseNodeKind(std::string_view text) {
  for (std::size_t i = 0; i < kNodeKindNames.size(); ++i) {
    if (kNodeKindNames[i] == text) {
      return static_cast<NodeKind>(i);
    }
  }
  return std::nullopt;
}

std::optional<RelationKind> ParseRelationKind(std::string_view text) {
  for (std::size_t i = 0; i < kRelationKindNames.size(); ++i) {
    if (kRelationKindNames[i] == text) {
      return static_cast<RelationKind>(i);
    }
  }
  return std::nullopt;
}

std::size_t KindIndex(NodeKind kind) {
  return static_cast<std::size_t>(kind);
}

RelationEndpoints EndpointsOf(RelationKind kind) {
  switch (kind) {
    case RelationKind::kSatisfies:
      return {NodeKind::kAttempt, NodeKind::kPolicy};
    case RelationKind::kCauses:
      return {NodeKind::kAttempt, NodeKind::kIssue};
    case RelationKind::kResolves:
      return {NodeKind::kFix, NodeKind::kIssue};
    case RelationKind::kAbstractsTo:
      return {NodeKind::kIssue, NodeKind::kSemantic};
  }
  throw std::invalid_argument("unknown relation kind");
}

std::string GenerateNodeId() {
  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  {
    std::lock_guard<std::mutex> lock(IdMutex());
    hi = IdEngine()();
    lo = IdEngine()();
  }
  // Version 4, variant 10xx.
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out{};
  out.reserve(36);
  const auto append_bits = [&](std::uint64_t value, int first_nibble, int last_nibble) {
    for (int nibble = first_nibble; nibble >= last_nibble; --nibble) {
      out.push_back(kHex[(value >> (4 * nibble)) & 0xFU]);
    }
  };
  append_bits(hi, 15, 8);
  out.push_back('-');
  append_bits(hi, 7, 4);
  out.push_back('-');
  append_bits(hi, 3, 0);
  out.push_back('-');
  append_bits(lo, 15, 12);
  out.push_back('-');
  append_bits(lo, 11, 0);
  return out;
}

Node ToNode(const Policy& policy) {
  Node node{};
  node.id = policy.id;
  node.kind = NodeKind::kPolicy;
  node.description = policy.description;
  node.embedding = policy.embedding;
  return node;
}

Node ToNode(const Attempt& attempt) {
  Node node{};
  node.id = attempt.id;
  node.kind = NodeKind::kAttempt;
  node.description = attempt.description;
  node.is_successful = attempt.is_successful;
  node.reasoning = attempt.reasoning;
  node.embedding = attempt.embedding;
  return node;
}

Node ToNode(const Issue& issue) {
  Node node{};
  node.id = issue.id;
  node.kind = NodeKind::kIssue;
  node.description = issue.description;
  node.embedding = issue.embedding;
  return node;
}

Node ToNode(const Fix& fix) {
  Node node{};
  node.id = fix.id;
  node.kind = NodeKind::kFix;
  node.description = fix.description;
  node.embedding = fix.embedding;
  return node;
}

Node ToNode(const Semantic& semantic) {
  Node node{};
  node.id = semantic.id;
  node.kind = NodeKind::kSemantic;
  node.name = semantic.name;
  node.description = semantic.description;
  node.embedding = semantic.embedding;
  return node;
}

Policy PolicyFromNode(const Node& node) {
  ExpectKind(node, NodeKind::kPolicy, "PolicyFromNode");
  return Policy{node.id, node.description, node.embedding};
}

Attempt AttemptFromNode(const Node& node) {
  ExpectKind(node, NodeKind::kAttempt, "AttemptFromNode");
  return Attempt{node.id, node.description, node.is_successful, node.reasoning, node.embedding};
}

Issue IssueFromNode(const Node& node) {
  ExpectKind(node, NodeKind::kIssue, "IssueFromNode");
  return Issue{node.id, node.description, node.embedding};
}

Fix FixFromNode(const Node& node) {
  ExpectKind(node, NodeKind::kFix, "FixFromNode");
  return Fix{node.id, node.description, node.embedding};
}

Semantic SemanticFromNode(const Node& node) {
  ExpectKind(node, NodeKind::kSemantic, "SemanticFromNode");
  return Semantic{node.id, node.name.value_or(std::string{}), node.description, node.embedding};
}

}  // namespace majcpp

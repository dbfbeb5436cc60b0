#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace majcpp {

using Embedding = std::vector<float>;

enum class NodeKind {
  kPolicy,
  kAttempt,
  kIssue,
  kFix,
  kSemantic,
};

inline constexpr std::size_t kNodeKindCount = 5;

enum class RelationKind {
  kSatisfies,
  kCauses,
  kResolves,
  kAbstractsTo,
};

struct RelationEndpoints {
  NodeKind from = NodeKind::kAttempt;
  NodeKind to = NodeKind::kPolicy;
};

std::string_view ToString(NodeKind kind);
std::string_view ToString(RelationKind kind);
std::optional<NodeKind> ParseNodeKind(std::string_view text);
std::optional<RelationKind> ParseRelationKind(std::string_view text);
std::size_t KindIndex(NodeKind kind);

// Attempt -SATISFIES-> Policy, Attempt -CAUSES-> Issue,
// Fix -RESOLVES-> Issue, Issue -ABSTRACTS_TO-> Semantic.
RelationEndpoints EndpointsOf(RelationKind kind);

// Random RFC 4122 version-4 identifier.
std::string GenerateNodeId();

// Generic property bag as the Graph Store sees it. Typed entities below
// convert to and from this shape.
struct Node {
  std::string id;
  NodeKind kind = NodeKind::kPolicy;
  std::string description;
  std::optional<std::string> name;
  std::optional<bool> is_successful;
  std::optional<std::string> reasoning;
  std::optional<Embedding> embedding;
};

struct Policy {
  std::string id = GenerateNodeId();
  std::string description;
  std::optional<Embedding> embedding;
};

struct Attempt {
  std::string id = GenerateNodeId();
  std::string description;
  std::optional<bool> is_successful;
  std::optional<std::string> reasoning;
  std::optional<Embedding> embedding;
};

struct Issue {
  std::string id = GenerateNodeId();
  std::string description;
  std::optional<Embedding> embedding;
};

struct Fix {
  std::string id = GenerateNodeId();
  std::string description;
  std::optional<Embedding> embedding;
};

struct Semantic {
  std::string id = GenerateNodeId();
  std::string name;
  std::string description;
  std::optional<Embedding> embedding;
};

Node ToNode(const Policy& policy);
Node ToNode(const Attempt& attempt);
Node ToNode(const Issue& issue);
Node ToNode(const Fix& fix);
Node ToNode(const Semantic& semantic);

Policy PolicyFromNode(const Node& node);
Attempt AttemptFromNode(const Node& node);
Issue IssueFromNode(const Node& node);
Fix FixFromNode(const Node& node);
Semantic SemanticFromNode(const Node& node);

struct Relationship {
  RelationKind kind = RelationKind::kSatisfies;
  std::string from_id;
  std::string to_id;
};

struct SimilarityHit {
  Node node;
  float score = 0.0F;
};

// One hop of a traversal: the source id and the node reached from it.
struct Neighbor {
  std::string from_id;
  Node node;
};

struct UpsertResult {
  std::string id;
  bool created = false;
};

struct ScoredAttempt {
  Attempt attempt;
  float score = 0.0F;
};

struct ContrastiveExamples {
  std::vector<ScoredAttempt> positive;
  std::vector<ScoredAttempt> negative;
};

struct SemanticPattern {
  std::string semantic_id;
  std::string name;
  std::string description;
  int frequency = 0;
  float avg_similarity = 0.0F;
};

struct HistoryPattern {
  std::string semantic_id;
  std::string name;
  std::string description;
  int issue_count = 0;
  std::vector<std::string> sample_issues;
};

struct DedupConfig {
  float policy_threshold = 0.90F;
  float semantic_threshold = 0.85F;
};

struct RetrievalConfig {
  int contrastive_overfetch = 4;
  int pattern_overfetch = 3;
  float pattern_score_floor = 0.85F;
  int history_sample_issues = 3;
};

struct MemoryContextConfig {
  int top_k = 3;
  int pattern_top_k = 5;
  float positive_floor = 0.80F;
  float negative_floor = 0.90F;
  float pattern_floor = 0.85F;
  bool include_history = true;
};

struct MemoryConfig {
  int embedding_dimensions = 1536;
  DedupConfig dedup{};
  RetrievalConfig retrieval{};
  MemoryContextConfig context{};
};

}  // namespace majcpp

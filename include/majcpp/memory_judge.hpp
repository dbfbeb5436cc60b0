#pragma once

#include "majcpp/config.hpp"
#include "majcpp/contrastive_retriever.hpp"
#include "majcpp/dedup_engine.hpp"
#include "majcpp/embeddings.hpp"
#include "majcpp/entity_store.hpp"
#include "majcpp/evaluator.hpp"
#include "majcpp/graph_store.hpp"
#include "majcpp/issue_classifier.hpp"
#include "majcpp/pattern_aggregator.hpp"
#include "majcpp/relationship_store.hpp"
#include "majcpp/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace majcpp {

struct RecalledIssue {
  std::string description;
  std::vector<std::string> fixes;
};

struct MemoryExample {
  ScoredAttempt example;
  // Populated for failed attempts only.
  std::vector<RecalledIssue> issues;
};

// Precedent gathered for one evaluation, already filtered by the floors.
struct MemoryContext {
  std::vector<MemoryExample> positive;
  std::vector<MemoryExample> negative;
  std::vector<SemanticPattern> patterns;
  std::optional<std::string> matched_policy_id;
  std::vector<HistoryPattern> history;

  [[nodiscard]] bool empty() const {
    return positive.empty() && negative.empty() && patterns.empty() && history.empty();
  }
};

struct MemoryUsage {
  int positive_examples = 0;
  int negative_examples = 0;
  int patterns = 0;
  int history_patterns = 0;
};

// An evaluated attempt, embedded and classified but not yet persisted.
// issues, fixes and classifications are parallel arrays.
struct JudgeOutcome {
  Policy policy;
  Attempt attempt;
  std::vector<Issue> issues;
  std::vector<Fix> fixes;
  std::vector<ClassifiedIssue> classifications;
  std::optional<std::string> attempt_summary;
  std::optional<std::string> memory_context;
  MemoryUsage memory_used{};
};

// Ids actually written for a JudgeOutcome plus every edge it implies.
struct RecordedJudgment {
  std::string policy_id;
  bool policy_created = false;
  std::string attempt_id;
  std::vector<std::string> issue_ids;
  std::vector<std::string> fix_ids;
  std::vector<std::string> semantic_ids;
  std::vector<Relationship> relationships;
};

struct ReconcileReport {
  std::size_t created = 0;
  std::size_t already_present = 0;
  std::size_t blocked = 0;
};

struct MemoryStats {
  std::size_t policies = 0;
  std::size_t attempts = 0;
  std::size_t issues = 0;
  std::size_t fixes = 0;
  std::size_t semantics = 0;
  std::size_t relationships = 0;
};

class MemoryJudge {
 public:
  MemoryJudge(std::shared_ptr<GraphStore> store,
              std::shared_ptr<Evaluator> evaluator,
              std::shared_ptr<EmbeddingProvider> embedder,
              const MemoryConfig& config = LoadMemoryConfigFromEnvironment());

  JudgeOutcome Judge(const std::string& task, const std::string& agent_output, const std::string& goal);
  JudgeOutcome JudgeWithMemory(const std::string& task, const std::string& agent_output, const std::string& goal);

  // Precedent for an attempt embedding. policy_embedding selects the task
  // history; without it no history patterns are gathered.
  MemoryContext BuildMemoryContext(const Embedding& attempt_embedding,
                                   const std::optional<Embedding>& policy_embedding = std::nullopt) const;

  // RecordNodes followed by LinkRecorded. Not transactional: a failure
  // propagates and can leave a partial judgment behind.
  RecordedJudgment Record(const JudgeOutcome& outcome);
  RecordedJudgment RecordNodes(const JudgeOutcome& outcome);
  void LinkRecorded(const RecordedJudgment& recorded);

  // Creates planned edges that are missing and whose endpoints exist.
  ReconcileReport Reconcile(const RecordedJudgment& recorded);

  std::vector<Attempt> AttemptsForPolicy(const std::string& policy_id) const;
  std::vector<Issue> IssuesForAttempt(const std::string& attempt_id) const;
  std::vector<Fix> FixesForIssue(const std::string& issue_id) const;

  MemoryStats Stats() const;
  const MemoryConfig& config() const { return config_; }

 private:
  JudgeOutcome Evaluate(const std::string& task,
                        const std::string& agent_output,
                        const std::string& goal,
                        bool with_memory);
  Embedding EmbedText(const std::string& text, const char* what) const;

  std::shared_ptr<GraphStore> store_;
  std::shared_ptr<Evaluator> evaluator_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  MemoryConfig config_;
  EntityStore entities_;
  RelationshipStore relationships_;
  DedupEngine dedup_;
  ContrastiveRetriever contrastive_;
  PatternAggregator patterns_;
  IssueClassifier classifier_;
};

// Deterministic text rendering of a memory context for the Evaluator.
std::string FormatMemoryContext(const MemoryContext& context);

}  // namespace majcpp

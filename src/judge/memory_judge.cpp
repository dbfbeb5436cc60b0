#include "majcpp/memory_judge.hpp"

#include "majcpp/errors.hpp"
#include "majcpp/log.hpp"

#include <cstdint>
#include <exception>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace majcpp {
namespace {

Judgment CallEvaluator(Evaluator& evaluator, JudgeRequest request) {
  try {
    return evaluator.Judge(request);
  } catch (const std::exception& ex) {
    throw CollaboratorError(std::string("MemoryJudge evaluator failed: ") + ex.what());
  }
}

MemoryUsage UsageOf(const MemoryContext& context) {
  MemoryUsage usage{};
  usage.positive_examples = static_cast<int>(context.positive.size());
  usage.negative_examples = static_cast<int>(context.negative.size());
  usage.patterns = static_cast<int>(context.patterns.size());
  usage.history_patterns = static_cast<int>(context.history.size());
  return usage;
}

void AppendExample(std::ostringstream& out, const MemoryExample& item, bool passed) {
  const auto& attempt = item.example.attempt;
  out << (passed ? "[PASSED]" : "[FAILED]") << " similarity=" << std::fixed << std::setprecision(2)
      << item.example.score << "\n";
  out << "  Attempt: " << attempt.description << "\n";
  if (attempt.reasoning.has_value() && !attempt.reasoning->empty()) {
    out << "  Reasoning: " << *attempt.reasoning << "\n";
  }
  for (const auto& issue : item.issues) {
    out << "  Issue: " << issue.description << "\n";
    for (const auto& fix : issue.fixes) {
      out << "    Fix: " << fix << "\n";
    }
  }
}

}  // namespace

MemoryJudge::MemoryJudge(std::shared_ptr<GraphStore> store,
                         std::shared_ptr<Evaluator> evaluator,
                         std::shared_ptr<EmbeddingProvider> embedder,
                         const MemoryConfig& config)
    : store_(std::move(store)),
      evaluator_(std::move(evaluator)),
      embedder_(std::move(embedder)),
      config_(config),
      entities_(store_),
      relationships_(store_),
      dedup_(store_, config_.dedup),
      contrastive_(store_, config_.retrieval),
      patterns_(store_, config_.retrieval),
      classifier_(evaluator_, embedder_, store_->dimensions()) {
  if (embedder_ == nullptr) {
    throw std::invalid_argument("MemoryJudge requires an embedder");
  }
  if (embedder_->dimensions() != store_->dimensions()) {
    throw std::invalid_argument("MemoryJudge embedder dimensions " + std::to_string(embedder_->dimensions()) +
                                " do not match store dimensions " + std::to_string(store_->dimensions()));
  }
  ValidateMemoryConfig(config_);
}

Embedding MemoryJudge::EmbedText(const std::string& text, const char* what) const {
  return EmbedChecked(*embedder_, text, store_->dimensions(), what);
}

JudgeOutcome MemoryJudge::Judge(const std::string& task, const std::string& agent_output, const std::string& goal) {
  return Evaluate(task, agent_output, goal, false);
}

JudgeOutcome MemoryJudge::JudgeWithMemory(const std::string& task,
                                          const std::string& agent_output,
                                          const std::string& goal) {
  return Evaluate(task, agent_output, goal, true);
}

JudgeOutcome MemoryJudge::Evaluate(const std::string& task,
                                   const std::string& agent_output,
                                   const std::string& goal,
                                   bool with_memory) {
  JudgeOutcome outcome{};
  outcome.policy.description = task;
  outcome.policy.embedding = EmbedText(task, "policy");
  outcome.attempt.description = agent_output;
  outcome.attempt.embedding = EmbedText(agent_output, "attempt");

  JudgeRequest request{};
  request.task = task;
  request.agent_output = agent_output;
  request.goal = goal;
  if (with_memory) {
    const auto context = BuildMemoryContext(*outcome.attempt.embedding, outcome.policy.embedding);
    outcome.memory_used = UsageOf(context);
    if (!context.empty()) {
      request.memory_context = FormatMemoryContext(context);
      outcome.memory_context = request.memory_context;
    }
  }

  const auto judgment = CallEvaluator(*evaluator_, std::move(request));
  outcome.attempt.is_successful = judgment.is_successful;
  outcome.attempt.reasoning = judgment.reasoning;
  outcome.attempt_summary = judgment.attempt_summary;

  const auto existing = entities_.AllSemantics();
  for (const auto& pair : judgment.issue_fix_pairs) {
    if (pair.issue.empty()) {
      throw CollaboratorError("MemoryJudge evaluator returned an issue with no description");
    }
    Issue issue{};
    issue.description = pair.issue;
    issue.embedding = EmbedText(pair.issue, "issue");
    Fix fix{};
    fix.description = pair.fix;
    fix.embedding = EmbedText(pair.fix, "fix");

    outcome.classifications.push_back(classifier_.Classify(issue, existing));
    outcome.issues.push_back(std::move(issue));
    outcome.fixes.push_back(std::move(fix));
  }
  return outcome;
}

MemoryContext MemoryJudge::BuildMemoryContext(const Embedding& attempt_embedding,
                                              const std::optional<Embedding>& policy_embedding) const {
  const auto& settings = config_.context;
  MemoryContext context{};

  const auto examples = ApplyConfidenceFloors(contrastive_.FindContrastive(attempt_embedding, settings.top_k),
                                              settings.positive_floor,
                                              settings.negative_floor);
  for (const auto& item : examples.positive) {
    context.positive.push_back(MemoryExample{item, {}});
  }
  for (const auto& item : examples.negative) {
    MemoryExample example{item, {}};
    for (const auto& issue : relationships_.IssuesForAttempt(item.attempt.id)) {
      RecalledIssue recalled{issue.description, {}};
      for (const auto& fix : relationships_.FixesForIssue(issue.id)) {
        recalled.fixes.push_back(fix.description);
      }
      example.issues.push_back(std::move(recalled));
    }
    context.negative.push_back(std::move(example));
  }

  for (auto& pattern : patterns_.FindPatterns(attempt_embedding, settings.pattern_top_k)) {
    if (pattern.avg_similarity >= settings.pattern_floor) {
      context.patterns.push_back(std::move(pattern));
    }
  }

  if (settings.include_history && policy_embedding.has_value()) {
    const auto nearest = store_->QueryNearest(NodeKind::kPolicy, *policy_embedding, 1);
    if (!nearest.empty() && nearest.front().score >= config_.dedup.policy_threshold) {
      context.matched_policy_id = nearest.front().node.id;
      std::vector<std::string> attempt_ids{};
      for (const auto& attempt : relationships_.AttemptsForPolicy(*context.matched_policy_id)) {
        attempt_ids.push_back(attempt.id);
      }
      context.history = patterns_.HistoryPatterns(attempt_ids);
      if (context.history.size() > static_cast<std::size_t>(settings.pattern_top_k)) {
        context.history.resize(static_cast<std::size_t>(settings.pattern_top_k));
      }
    }
  }
  return context;
}

RecordedJudgment MemoryJudge::Record(const JudgeOutcome& outcome) {
  auto recorded = RecordNodes(outcome);
  try {
    LinkRecorded(recorded);
  } catch (const GraphError& ex) {
    log::Warn(std::string("MemoryJudge::Record partial judgment for attempt ") + recorded.attempt_id + ": " +
              ex.what());
    throw;
  }
  return recorded;
}

RecordedJudgment MemoryJudge::RecordNodes(const JudgeOutcome& outcome) {
  if (outcome.issues.size() != outcome.fixes.size() || outcome.issues.size() != outcome.classifications.size()) {
    throw std::invalid_argument("MemoryJudge::Record issues, fixes and classifications must line up");
  }
  RecordedJudgment recorded{};

  const auto policy = dedup_.GetOrCreatePolicy(outcome.policy);
  recorded.policy_id = policy.id;
  recorded.policy_created = policy.created;
  recorded.attempt_id = entities_.CreateAttempt(outcome.attempt);
  recorded.relationships.push_back(Relationship{RelationKind::kSatisfies, recorded.attempt_id, recorded.policy_id});

  // New categories proposed twice in one judgment share a node.
  std::unordered_map<std::string, std::string> new_semantic_ids{};
  for (std::size_t i = 0; i < outcome.issues.size(); ++i) {
    const auto issue_id = entities_.CreateIssue(outcome.issues[i]);
    const auto fix_id = entities_.CreateFix(outcome.fixes[i]);
    recorded.issue_ids.push_back(issue_id);
    recorded.fix_ids.push_back(fix_id);
    recorded.relationships.push_back(Relationship{RelationKind::kCauses, recorded.attempt_id, issue_id});
    recorded.relationships.push_back(Relationship{RelationKind::kResolves, fix_id, issue_id});

    const auto& classified = outcome.classifications[i];
    std::string semantic_id = classified.semantic.id;
    if (classified.is_new) {
      const auto known = new_semantic_ids.find(classified.semantic.name);
      if (known != new_semantic_ids.end()) {
        semantic_id = known->second;
      } else {
        semantic_id = dedup_.GetOrCreateSemantic(classified.semantic).id;
        new_semantic_ids.emplace(classified.semantic.name, semantic_id);
      }
    }
    recorded.semantic_ids.push_back(semantic_id);
    recorded.relationships.push_back(Relationship{RelationKind::kAbstractsTo, issue_id, semantic_id});
  }

  if (log::Enabled(log::Level::kInfo)) {
    log::Info("MemoryJudge recorded attempt " + recorded.attempt_id + " policy " + recorded.policy_id +
              (recorded.policy_created ? " (new)" : " (reused)") + " issues=" +
              std::to_string(recorded.issue_ids.size()));
  }
  return recorded;
}

void MemoryJudge::LinkRecorded(const RecordedJudgment& recorded) {
  for (const auto& relationship : recorded.relationships) {
    relationships_.Link(relationship);
  }
}

ReconcileReport MemoryJudge::Reconcile(const RecordedJudgment& recorded) {
  ReconcileReport report{};
  for (const auto& relationship : recorded.relationships) {
    if (relationships_.Exists(relationship)) {
      ++report.already_present;
      continue;
    }
    if (!entities_.Exists(relationship.from_id) || !entities_.Exists(relationship.to_id)) {
      ++report.blocked;
      continue;
    }
    relationships_.Link(relationship);
    ++report.created;
  }
  log::KV(log::Level::kInfo, "reconcile.created", static_cast<std::uint64_t>(report.created));
  log::KV(log::Level::kInfo, "reconcile.blocked", static_cast<std::uint64_t>(report.blocked));
  return report;
}

std::vector<Attempt> MemoryJudge::AttemptsForPolicy(const std::string& policy_id) const {
  return relationships_.AttemptsForPolicy(policy_id);
}

std::vector<Issue> MemoryJudge::IssuesForAttempt(const std::string& attempt_id) const {
  return relationships_.IssuesForAttempt(attempt_id);
}

std::vector<Fix> MemoryJudge::FixesForIssue(const std::string& issue_id) const {
  return relationships_.FixesForIssue(issue_id);
}

MemoryStats MemoryJudge::Stats() const {
  MemoryStats stats{};
  stats.policies = entities_.Count(NodeKind::kPolicy);
  stats.attempts = entities_.Count(NodeKind::kAttempt);
  stats.issues = entities_.Count(NodeKind::kIssue);
  stats.fixes = entities_.Count(NodeKind::kFix);
  stats.semantics = entities_.Count(NodeKind::kSemantic);
  stats.relationships = store_->RelationshipCount();
  return stats;
}

std::string FormatMemoryContext(const MemoryContext& context) {
  if (context.empty()) {
    return "No relevant past evaluations.";
  }
  std::ostringstream out{};
  if (!context.positive.empty() || !context.negative.empty()) {
    out << "SIMILAR PAST ATTEMPTS:\n";
    for (const auto& item : context.positive) {
      AppendExample(out, item, true);
    }
    for (const auto& item : context.negative) {
      AppendExample(out, item, false);
    }
  }
  if (!context.patterns.empty()) {
    if (out.tellp() > 0) {
      out << "\n";
    }
    out << "RECURRING ISSUE PATTERNS (check if applicable):\n";
    for (const auto& pattern : context.patterns) {
      out << "- " << pattern.name << " (seen " << pattern.frequency << "x, similarity=" << std::fixed
          << std::setprecision(2) << pattern.avg_similarity << "): " << pattern.description << "\n";
    }
  }
  if (!context.history.empty()) {
    if (out.tellp() > 0) {
      out << "\n";
    }
    out << "PAST ISSUES FOR THIS TASK (check if applicable):\n";
    for (const auto& pattern : context.history) {
      out << "- " << pattern.name << " (" << pattern.issue_count << " issue"
          << (pattern.issue_count == 1 ? "" : "s") << ")";
      for (std::size_t i = 0; i < pattern.sample_issues.size(); ++i) {
        out << (i == 0 ? ": " : "; ") << pattern.sample_issues[i];
      }
      out << "\n";
    }
  }
  return out.str();
}

}  // namespace majcpp

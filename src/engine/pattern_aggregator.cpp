#include "majcpp/pattern_aggregator.hpp"

#include "majcpp/config.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace majcpp {
namespace {

struct PatternAccumulator {
  Node semantic;
  std::unordered_set<std::string> issue_ids{};
  double score_sum = 0.0;
};

struct HistoryAccumulator {
  Node semantic;
  std::unordered_set<std::string> issue_ids{};
  std::vector<std::string> samples{};
};

}  // namespace

PatternAggregator::PatternAggregator(std::shared_ptr<GraphStore> store, std::optional<RetrievalConfig> config)
    : store_(std::move(store)),
      config_(config.has_value() ? *config : LoadMemoryConfigFromEnvironment().retrieval) {
  if (store_ == nullptr) {
    throw std::invalid_argument("PatternAggregator requires a graph store");
  }
  if (config_.pattern_overfetch <= 0) {
    throw std::invalid_argument("PatternAggregator overfetch must be positive");
  }
  if (config_.history_sample_issues < 0) {
    throw std::invalid_argument("PatternAggregator sample count must not be negative");
  }
}

std::vector<SemanticPattern> PatternAggregator::FindPatterns(const Embedding& query, int k) const {
  if (k <= 0) {
    return {};
  }
  const auto hits = store_->QueryNearest(NodeKind::kIssue, query, OverfetchTopK(config_.pattern_overfetch, k));

  std::vector<std::string> issue_ids{};
  std::unordered_map<std::string, float> issue_scores{};
  for (const auto& hit : hits) {
    if (hit.score < config_.pattern_score_floor) {
      continue;
    }
    if (issue_scores.emplace(hit.node.id, hit.score).second) {
      issue_ids.push_back(hit.node.id);
    }
  }
  if (issue_ids.empty()) {
    return {};
  }

  std::vector<PatternAccumulator> groups{};
  std::unordered_map<std::string, std::size_t> group_index{};
  for (const auto& neighbor : store_->Outgoing(issue_ids, RelationKind::kAbstractsTo)) {
    auto [it, inserted] = group_index.emplace(neighbor.node.id, groups.size());
    if (inserted) {
      groups.push_back(PatternAccumulator{neighbor.node});
    }
    auto& group = groups[it->second];
    if (group.issue_ids.insert(neighbor.from_id).second) {
      group.score_sum += issue_scores.at(neighbor.from_id);
    }
  }

  std::vector<SemanticPattern> patterns{};
  patterns.reserve(groups.size());
  for (const auto& group : groups) {
    SemanticPattern pattern{};
    pattern.semantic_id = group.semantic.id;
    pattern.name = group.semantic.name.value_or(std::string{});
    pattern.description = group.semantic.description;
    pattern.frequency = static_cast<int>(group.issue_ids.size());
    pattern.avg_similarity = static_cast<float>(group.score_sum / static_cast<double>(group.issue_ids.size()));
    patterns.push_back(std::move(pattern));
  }
  std::stable_sort(patterns.begin(), patterns.end(), [](const SemanticPattern& lhs, const SemanticPattern& rhs) {
    if (lhs.frequency != rhs.frequency) {
      return lhs.frequency > rhs.frequency;
    }
    return lhs.avg_similarity > rhs.avg_similarity;
  });
  if (patterns.size() > static_cast<std::size_t>(k)) {
    patterns.resize(static_cast<std::size_t>(k));
  }
  return patterns;
}

std::vector<HistoryPattern> PatternAggregator::HistoryPatterns(const std::vector<std::string>& attempt_ids) const {
  if (attempt_ids.empty()) {
    return {};
  }
  std::vector<std::string> unique_attempts{};
  std::unordered_set<std::string> seen_attempts{};
  for (const auto& id : attempt_ids) {
    if (seen_attempts.insert(id).second) {
      unique_attempts.push_back(id);
    }
  }

  std::vector<std::string> issue_ids{};
  std::unordered_map<std::string, std::string> issue_descriptions{};
  for (const auto& neighbor : store_->Outgoing(unique_attempts, RelationKind::kCauses)) {
    if (issue_descriptions.emplace(neighbor.node.id, neighbor.node.description).second) {
      issue_ids.push_back(neighbor.node.id);
    }
  }
  if (issue_ids.empty()) {
    return {};
  }

  const auto sample_limit = static_cast<std::size_t>(config_.history_sample_issues);
  std::vector<HistoryAccumulator> groups{};
  std::unordered_map<std::string, std::size_t> group_index{};
  for (const auto& neighbor : store_->Outgoing(issue_ids, RelationKind::kAbstractsTo)) {
    auto [it, inserted] = group_index.emplace(neighbor.node.id, groups.size());
    if (inserted) {
      groups.push_back(HistoryAccumulator{neighbor.node});
    }
    auto& group = groups[it->second];
    if (!group.issue_ids.insert(neighbor.from_id).second) {
      continue;
    }
    const auto& description = issue_descriptions.at(neighbor.from_id);
    if (group.samples.size() < sample_limit &&
        std::find(group.samples.begin(), group.samples.end(), description) == group.samples.end()) {
      group.samples.push_back(description);
    }
  }

  std::vector<HistoryPattern> patterns{};
  patterns.reserve(groups.size());
  for (auto& group : groups) {
    HistoryPattern pattern{};
    pattern.semantic_id = group.semantic.id;
    pattern.name = group.semantic.name.value_or(std::string{});
    pattern.description = group.semantic.description;
    pattern.issue_count = static_cast<int>(group.issue_ids.size());
    pattern.sample_issues = std::move(group.samples);
    patterns.push_back(std::move(pattern));
  }
  std::stable_sort(patterns.begin(), patterns.end(), [](const HistoryPattern& lhs, const HistoryPattern& rhs) {
    return lhs.issue_count > rhs.issue_count;
  });
  return patterns;
}

}  // namespace majcpp

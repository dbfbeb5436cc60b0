#include "majcpp/dedup_engine.hpp"
#include "majcpp/in_memory_graph_store.hpp"
#include "majcpp/sqlite_graph_store.hpp"

#include "../test_logger.hpp"
#include "../test_support.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

majcpp::Policy MakePolicy(const std::string& description, majcpp::Embedding embedding) {
  majcpp::Policy policy{};
  policy.description = description;
  policy.embedding = std::move(embedding);
  return policy;
}

void ScenarioEmailPolicyReuse() {
  majcpp::tests::Log("scenario: email policy reuse");
  auto inner = std::make_shared<majcpp::InMemoryGraphStore>(3);
  auto store = std::make_shared<majcpp::tests::CountingGraphStore>(inner);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});

  const auto first = dedup.GetOrCreatePolicy(
      MakePolicy("Write a function to validate email addresses", majcpp::tests::Axis(0)));
  Require(first.created, "first policy is created");

  const auto second = dedup.GetOrCreatePolicy(MakePolicy("Validate email addresses", majcpp::tests::AtCosine(0.95F)));
  Require(!second.created, "similar wording reuses the policy");
  Require(second.id == first.id, "reused policy keeps the first id");
  Require(inner->NodeCount(majcpp::NodeKind::kPolicy) == 1, "exactly one policy stored");
  Require(store->conditional_create_calls == 2 && store->create_node_calls == 0,
          "embedded candidates go through the conditional insert");

  const auto third = dedup.GetOrCreatePolicy(MakePolicy("Parse CSV rows", majcpp::tests::AtCosine(0.5F)));
  Require(third.created && third.id != first.id, "unrelated task gets its own policy");
}

void ScenarioSemanticDefaultThreshold() {
  majcpp::tests::Log("scenario: semantic default threshold");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});

  majcpp::Semantic injection{};
  injection.name = "SQL Injection";
  injection.description = "untrusted input in SQL";
  injection.embedding = majcpp::tests::Axis(0);
  Require(dedup.GetOrCreateSemantic(injection).created, "first semantic is created");

  majcpp::Semantic near{};
  near.name = "SQL injection risk";
  near.description = "query built from user input";
  near.embedding = majcpp::tests::AtCosine(0.88F);
  const auto reused = dedup.GetOrCreateSemantic(near);
  Require(!reused.created && reused.id == injection.id, "0.88 clears the 0.85 semantic threshold");

  majcpp::Semantic other{};
  other.name = "Missing TLD check";
  other.description = "email regex accepts a@b";
  other.embedding = majcpp::tests::AtCosine(0.8F);
  Require(dedup.GetOrCreateSemantic(other).created, "0.80 stays below the semantic threshold");
}

void ScenarioThresholdPrecedence() {
  majcpp::tests::Log("scenario: threshold precedence");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::DedupEngine strict(store, majcpp::DedupConfig{0.5F, 0.5F});
  Require(strict.ResolveThreshold(majcpp::NodeKind::kPolicy, std::nullopt) == 0.5F, "instance config applies");
  Require(strict.ResolveThreshold(majcpp::NodeKind::kPolicy, 0.99F) == 0.99F, "per-call value wins");

  strict.GetOrCreatePolicy(MakePolicy("base", majcpp::tests::Axis(0)));
  Require(!strict.GetOrCreatePolicy(MakePolicy("loose", majcpp::tests::AtCosine(0.6F))).created,
          "instance threshold 0.5 reuses at 0.6");
  Require(strict.GetOrCreatePolicy(MakePolicy("strict", majcpp::tests::AtCosine(0.95F)), 0.99F).created,
          "per-call threshold 0.99 creates at 0.95");

  ::setenv("MAJCPP_POLICY_THRESHOLD", "0.97", 1);
  majcpp::DedupEngine from_environment(store);
  ::unsetenv("MAJCPP_POLICY_THRESHOLD");
  Require(from_environment.config().policy_threshold == 0.97F, "environment default applies without config");
  Require(from_environment.config().semantic_threshold == 0.85F, "unset variable keeps the built-in default");
}

void ScenarioMissingEmbedding() {
  majcpp::tests::Log("scenario: missing embedding");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});
  majcpp::Policy bare{};
  bare.description = "Validate email addresses";
  majcpp::Policy bare_again{};
  bare_again.description = "Validate email addresses";
  Require(dedup.GetOrCreatePolicy(bare).created, "candidate without embedding is created");
  Require(dedup.GetOrCreatePolicy(bare_again).created, "identical text without embedding is created again");
  Require(store->NodeCount(majcpp::NodeKind::kPolicy) == 2, "both bare policies are stored");
}

void ScenarioInvalidArguments() {
  majcpp::tests::Log("scenario: invalid arguments");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});

  majcpp::Attempt attempt{};
  attempt.description = "attempt";
  attempt.embedding = majcpp::tests::Axis(0);
  Require(majcpp::tests::Throws<std::invalid_argument>([&] { (void)dedup.GetOrCreate(majcpp::ToNode(attempt)); }),
          "attempts are never deduplicated");

  const auto policy = MakePolicy("p", majcpp::tests::Axis(0));
  Require(majcpp::tests::Throws<std::invalid_argument>([&] { (void)dedup.GetOrCreatePolicy(policy, 1.5F); }),
          "threshold above 1 must be rejected");
  Require(majcpp::tests::Throws<std::invalid_argument>(
              [&] { (void)dedup.GetOrCreatePolicy(policy, std::numeric_limits<float>::quiet_NaN()); }),
          "NaN threshold must be rejected");
  Require(store->NodeCount() == 0, "rejected calls store nothing");
}

void ScenarioRepeatedCandidate() {
  majcpp::tests::Log("scenario: repeated candidate");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});
  const auto policy = MakePolicy("Validate email addresses", majcpp::tests::Axis(0));
  store->CreateNode(majcpp::ToNode(policy));

  auto moved = policy;
  moved.embedding = majcpp::tests::Axis(1);
  const auto result = dedup.GetOrCreatePolicy(moved);
  Require(!result.created && result.id == policy.id, "id conflict resolves to the stored node");
  Require(store->NodeCount(majcpp::NodeKind::kPolicy) == 1, "no second node for a conflicting id");
}

void RunConcurrentGetOrCreate(const std::shared_ptr<majcpp::GraphStore>& store, const std::string& label) {
  majcpp::tests::Log("scenario: concurrent get-or-create on " + label);
  majcpp::DedupEngine dedup(store, majcpp::DedupConfig{});
  constexpr int kThreads = 16;
  std::vector<majcpp::UpsertResult> results(kThreads);
  std::vector<std::thread> workers{};
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t] {
      // Pairwise cosine stays above 0.98 across all candidates.
      const float cosine = 0.999F - 0.001F * static_cast<float>(t);
      results[static_cast<std::size_t>(t)] =
          dedup.GetOrCreatePolicy(MakePolicy("Validate email " + std::to_string(t), majcpp::tests::AtCosine(cosine)));
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  int created = 0;
  std::set<std::string> ids{};
  for (const auto& result : results) {
    created += result.created ? 1 : 0;
    ids.insert(result.id);
  }
  Require(created == 1, label + ": exactly one concurrent caller creates");
  Require(ids.size() == 1, label + ": every caller sees the same policy id");
  Require(store->NodeCount(majcpp::NodeKind::kPolicy) == 1, label + ": exactly one policy stored");
}

}  // namespace

int main() {
  try {
    majcpp::tests::Log("dedup_engine_test: start");
    ScenarioEmailPolicyReuse();
    ScenarioSemanticDefaultThreshold();
    ScenarioThresholdPrecedence();
    ScenarioMissingEmbedding();
    ScenarioInvalidArguments();
    ScenarioRepeatedCandidate();
    RunConcurrentGetOrCreate(std::make_shared<majcpp::InMemoryGraphStore>(3), "in-memory");
    RunConcurrentGetOrCreate(std::make_shared<majcpp::SqliteGraphStore>(":memory:", 3), "sqlite");
    majcpp::tests::Log("dedup_engine_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    majcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

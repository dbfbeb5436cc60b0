#include "majcpp/entity_store.hpp"
#include "majcpp/errors.hpp"
#include "majcpp/in_memory_graph_store.hpp"
#include "majcpp/relationship_store.hpp"
#include "majcpp/similarity_index.hpp"

#include "../test_logger.hpp"
#include "../test_support.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

void ScenarioTypedCreateAndRead() {
  majcpp::tests::Log("scenario: typed create and read");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::EntityStore entities(store);

  majcpp::Policy policy{};
  policy.description = "Write a function to validate email addresses";
  policy.embedding = majcpp::tests::Axis(0);
  Require(entities.CreatePolicy(policy) == policy.id, "create returns the entity id");

  majcpp::Semantic semantic{};
  semantic.name = "Input Validation";
  semantic.description = "input accepted without checks";
  entities.CreateSemantic(semantic);

  const auto loaded = entities.GetPolicy(policy.id);
  Require(loaded.has_value() && loaded->description == policy.description, "policy readable by id");
  Require(!entities.GetAttempt(policy.id).has_value(), "typed getter rejects a node of another kind");
  Require(!entities.GetIssue("missing").has_value(), "unknown id yields nothing");
  Require(entities.Exists(semantic.id), "exists sees the semantic");
  Require(entities.AllSemantics().size() == 1 && entities.AllSemantics()[0].name == "Input Validation",
          "all semantics lists the category");
  Require(entities.Count(majcpp::NodeKind::kPolicy) == 1, "policy count");

  bool duplicate = false;
  try {
    entities.CreatePolicy(policy);
  } catch (const majcpp::DuplicateEntityError& ex) {
    duplicate = ex.id() == policy.id;
  }
  Require(duplicate, "creating the same entity twice must raise DuplicateEntityError");

  entities.Clear();
  Require(entities.Count(majcpp::NodeKind::kPolicy) == 0 && !entities.Exists(semantic.id), "clear wipes the graph");
  entities.Clear();
  Require(store->NodeCount() == 0 && store->RelationshipCount() == 0, "clearing an empty graph is a no-op");
}

void ScenarioTypedRelationships() {
  majcpp::tests::Log("scenario: typed relationships");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::EntityStore entities(store);
  majcpp::RelationshipStore relationships(store);

  majcpp::Policy policy{};
  policy.description = "fetch user";
  majcpp::Attempt failed{};
  failed.description = "string formatted SQL";
  failed.is_successful = false;
  majcpp::Attempt passed{};
  passed.description = "parameterized SQL";
  passed.is_successful = true;
  majcpp::Issue issue{};
  issue.description = "SQL injection via f-string";
  majcpp::Fix fix{};
  fix.description = "use placeholders";
  majcpp::Semantic semantic{};
  semantic.name = "SQL Injection";
  semantic.description = "untrusted input in SQL";

  entities.CreatePolicy(policy);
  entities.CreateAttempt(failed);
  entities.CreateAttempt(passed);
  entities.CreateIssue(issue);
  entities.CreateFix(fix);
  entities.CreateSemantic(semantic);

  relationships.LinkAttemptSatisfiesPolicy(failed.id, policy.id);
  relationships.LinkAttemptSatisfiesPolicy(passed.id, policy.id);
  relationships.LinkAttemptCausesIssue(failed.id, issue.id);
  relationships.LinkFixResolvesIssue(fix.id, issue.id);
  relationships.LinkIssueAbstractsToSemantic(issue.id, semantic.id);

  const auto attempts = relationships.AttemptsForPolicy(policy.id);
  Require(attempts.size() == 2 && attempts[0].id == failed.id && attempts[1].id == passed.id,
          "attempts for policy in link order");
  Require(attempts[0].is_successful == std::optional<bool>(false), "attempt verdict preserved");
  const auto issues = relationships.IssuesForAttempt(failed.id);
  Require(issues.size() == 1 && issues[0].id == issue.id, "issues for attempt");
  Require(relationships.IssuesForAttempt(passed.id).empty(), "successful attempt has no issues");
  const auto fixes = relationships.FixesForIssue(issue.id);
  Require(fixes.size() == 1 && fixes[0].description == "use placeholders", "fixes for issue");
  const auto semantics = relationships.SemanticsForIssue(issue.id);
  Require(semantics.size() == 1 && semantics[0].name == "SQL Injection", "semantics for issue");
  Require(relationships.Exists(majcpp::Relationship{majcpp::RelationKind::kCauses, failed.id, issue.id}),
          "exists sees the CAUSES edge");

  bool not_found = false;
  try {
    relationships.LinkAttemptCausesIssue(passed.id, "not-yet-persisted");
  } catch (const majcpp::NotFoundError&) {
    not_found = true;
  }
  Require(not_found, "linking to a missing endpoint must raise NotFoundError");
  Require(store->RelationshipCount() == 5, "failed link stores nothing");
}

void ScenarioSimilarityIndex() {
  majcpp::tests::Log("scenario: similarity index");
  auto store = std::make_shared<majcpp::InMemoryGraphStore>(3);
  majcpp::EntityStore entities(store);
  majcpp::SimilarityIndex index(store);
  Require(index.dimensions() == 3, "index dimension follows the store");

  majcpp::Issue close{};
  close.description = "close";
  close.embedding = majcpp::tests::AtCosine(0.9F);
  majcpp::Issue distant{};
  distant.description = "distant";
  distant.embedding = majcpp::tests::AtCosine(0.1F);
  majcpp::Fix same_direction{};
  same_direction.description = "fix along the query";
  same_direction.embedding = majcpp::tests::Axis(0);
  entities.CreateIssue(distant);
  entities.CreateIssue(close);
  entities.CreateFix(same_direction);

  const auto hits = index.Query(majcpp::NodeKind::kIssue, majcpp::tests::Axis(0), 5);
  Require(hits.size() == 2, "only issues are returned");
  Require(hits[0].node.id == close.id && hits[1].node.id == distant.id, "issues ordered by similarity");
  Require(hits[0].score >= hits[1].score, "scores descending");
  Require(index.Query(majcpp::NodeKind::kIssue, majcpp::tests::Axis(0), 0).empty(), "k = 0 yields nothing");
  Require(index.Query(majcpp::NodeKind::kSemantic, majcpp::tests::Axis(0), 3).empty(), "empty kind yields nothing");

  bool threw = false;
  try {
    (void)index.Query(majcpp::NodeKind::kIssue, majcpp::Embedding{1.0F, 0.0F}, 1);
  } catch (const majcpp::GraphError&) {
    threw = true;
  }
  Require(threw, "query with the wrong dimension must throw");
}

}  // namespace

int main() {
  try {
    majcpp::tests::Log("graph_access_test: start");
    ScenarioTypedCreateAndRead();
    ScenarioTypedRelationships();
    ScenarioSimilarityIndex();
    majcpp::tests::Log("graph_access_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    majcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

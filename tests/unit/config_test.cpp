#include "majcpp/config.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

const char* const kVariables[] = {
    "MAJCPP_POLICY_THRESHOLD",   "MAJCPP_SEMANTIC_THRESHOLD", "MAJCPP_CONTRASTIVE_OVERFETCH",
    "MAJCPP_PATTERN_OVERFETCH",  "MAJCPP_PATTERN_FLOOR",      "MAJCPP_EMBEDDING_DIM",
};

void ClearEnvironment() {
  for (const auto* name : kVariables) {
    ::unsetenv(name);
  }
}

void ScenarioDefaultsWithoutEnvironment() {
  majcpp::tests::Log("scenario: defaults without environment");
  ClearEnvironment();
  const auto config = majcpp::LoadMemoryConfigFromEnvironment();
  Require(config.dedup.policy_threshold == 0.90F, "policy threshold default");
  Require(config.dedup.semantic_threshold == 0.85F, "semantic threshold default");
  Require(config.embedding_dimensions == 1536, "embedding dimension default");
  const auto dedup = majcpp::DefaultDedupConfig();
  Require(dedup.policy_threshold == 0.90F && dedup.semantic_threshold == 0.85F, "default dedup config");
}

void ScenarioEnvironmentOverlay() {
  majcpp::tests::Log("scenario: environment overlay");
  ClearEnvironment();
  ::setenv("MAJCPP_POLICY_THRESHOLD", "0.75", 1);
  ::setenv("MAJCPP_SEMANTIC_THRESHOLD", "0.5", 1);
  ::setenv("MAJCPP_CONTRASTIVE_OVERFETCH", "6", 1);
  ::setenv("MAJCPP_PATTERN_OVERFETCH", "2", 1);
  ::setenv("MAJCPP_PATTERN_FLOOR", "0.6", 1);
  ::setenv("MAJCPP_EMBEDDING_DIM", "384", 1);

  majcpp::MemoryConfig base{};
  base.context.top_k = 7;
  const auto config = majcpp::LoadMemoryConfigFromEnvironment(base);
  Require(config.dedup.policy_threshold == 0.75F, "policy threshold from environment");
  Require(config.dedup.semantic_threshold == 0.5F, "semantic threshold from environment");
  Require(config.retrieval.contrastive_overfetch == 6, "contrastive overfetch from environment");
  Require(config.retrieval.pattern_overfetch == 2, "pattern overfetch from environment");
  Require(config.retrieval.pattern_score_floor == 0.6F, "pattern floor from environment");
  Require(config.embedding_dimensions == 384, "embedding dimension from environment");
  Require(config.context.top_k == 7, "unrelated base fields are kept");
  Require(majcpp::DefaultDedupConfig().policy_threshold == 0.75F, "default dedup config follows environment");
  ClearEnvironment();
}

void ScenarioMalformedValues() {
  majcpp::tests::Log("scenario: malformed values");
  const auto expect_throw = [](const char* name, const char* value) {
    ClearEnvironment();
    ::setenv(name, value, 1);
    bool threw = false;
    try {
      (void)majcpp::LoadMemoryConfigFromEnvironment();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    ClearEnvironment();
    Require(threw, std::string(name) + "=" + value + " must be rejected");
  };
  expect_throw("MAJCPP_POLICY_THRESHOLD", "high");
  expect_throw("MAJCPP_POLICY_THRESHOLD", "1.5");
  expect_throw("MAJCPP_SEMANTIC_THRESHOLD", "nan");
  expect_throw("MAJCPP_CONTRASTIVE_OVERFETCH", "0");
  expect_throw("MAJCPP_PATTERN_OVERFETCH", "3x");
  expect_throw("MAJCPP_EMBEDDING_DIM", "-8");
}

void ScenarioValidation() {
  majcpp::tests::Log("scenario: validation");
  majcpp::MemoryConfig config{};
  majcpp::ValidateMemoryConfig(config);

  config.context.negative_floor = -2.0F;
  bool threw = false;
  try {
    majcpp::ValidateMemoryConfig(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Require(threw, "out-of-range floor must be rejected");

  config = majcpp::MemoryConfig{};
  config.retrieval.history_sample_issues = -1;
  threw = false;
  try {
    majcpp::ValidateMemoryConfig(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  Require(threw, "negative sample count must be rejected");
}

void ScenarioOverfetchTopK() {
  majcpp::tests::Log("scenario: overfetch top_k");
  constexpr int kMax = std::numeric_limits<int>::max();
  Require(majcpp::OverfetchTopK(4, 3) == 12, "small products are exact");
  Require(majcpp::OverfetchTopK(4, kMax / 2) == kMax, "overflowing product saturates");
  Require(majcpp::OverfetchTopK(kMax, kMax) == kMax, "largest inputs saturate");
  Require(majcpp::OverfetchTopK(3, 0) == 0 && majcpp::OverfetchTopK(0, 5) == 0, "zero input gives zero");
  Require(majcpp::OverfetchTopK(-3, 5) == 0, "negative input gives zero");
}

}  // namespace

int main() {
  try {
    majcpp::tests::Log("config_test: start");
    ScenarioDefaultsWithoutEnvironment();
    ScenarioEnvironmentOverlay();
    ScenarioMalformedValues();
    ScenarioValidation();
    ScenarioOverfetchTopK();
    majcpp::tests::Log("config_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    majcpp::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}

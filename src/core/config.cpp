#include "majcpp/config.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

namespace majcpp {
namespace {

std::optional<std::string> ReadEnv(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr || *env == '\0') {
    return std::nullopt;
  }
  return std::string(env);
}

std::optional<float> ReadEnvFloat(const char* name) {
  const auto raw = ReadEnv(name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(raw->c_str(), &end);
  if (errno != 0 || end == raw->c_str() || *end != '\0' || !std::isfinite(value)) {
    throw std::runtime_error(std::string(name) + " must be a number, got '" + *raw + "'");
  }
  return static_cast<float>(value);
}

std::optional<int> ReadEnvInt(const char* name) {
  const auto raw = ReadEnv(name);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  const long value = std::strtol(raw->c_str(), &end, 10);
  if (errno != 0 || end == raw->c_str() || *end != '\0' ||
      value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::runtime_error(std::string(name) + " must be an integer, got '" + *raw + "'");
  }
  return static_cast<int>(value);
}

void RequireSimilarity(float value, const char* what) {
  if (!std::isfinite(value) || value < -1.0F || value > 1.0F) {
    throw std::runtime_error(std::string(what) + " must be within [-1, 1]");
  }
}

void RequirePositive(int value, const char* what) {
  if (value <= 0) {
    throw std::runtime_error(std::string(what) + " must be positive");
  }
}

}  // namespace

MemoryConfig LoadMemoryConfigFromEnvironment(MemoryConfig base) {
  if (const auto value = ReadEnvFloat("MAJCPP_POLICY_THRESHOLD")) {
    base.dedup.policy_threshold = *value;
  }
  if (const auto value = ReadEnvFloat("MAJCPP_SEMANTIC_THRESHOLD")) {
    base.dedup.semantic_threshold = *value;
  }
  if (const auto value = ReadEnvInt("MAJCPP_CONTRASTIVE_OVERFETCH")) {
    base.retrieval.contrastive_overfetch = *value;
  }
  if (const auto value = ReadEnvInt("MAJCPP_PATTERN_OVERFETCH")) {
    base.retrieval.pattern_overfetch = *value;
  }
  if (const auto value = ReadEnvFloat("MAJCPP_PATTERN_FLOOR")) {
    base.retrieval.pattern_score_floor = *value;
  }
  if (const auto value = ReadEnvInt("MAJCPP_EMBEDDING_DIM")) {
    base.embedding_dimensions = *value;
  }
  ValidateMemoryConfig(base);
  return base;
}

DedupConfig DefaultDedupConfig() {
  return LoadMemoryConfigFromEnvironment().dedup;
}

void ValidateMemoryConfig(const MemoryConfig& config) {
  RequirePositive(config.embedding_dimensions, "embedding_dimensions");
  RequireSimilarity(config.dedup.policy_threshold, "dedup.policy_threshold");
  RequireSimilarity(config.dedup.semantic_threshold, "dedup.semantic_threshold");
  RequirePositive(config.retrieval.contrastive_overfetch, "retrieval.contrastive_overfetch");
  RequirePositive(config.retrieval.pattern_overfetch, "retrieval.pattern_overfetch");
  RequireSimilarity(config.retrieval.pattern_score_floor, "retrieval.pattern_score_floor");
  if (config.retrieval.history_sample_issues < 0) {
    throw std::runtime_error("retrieval.history_sample_issues must be non-negative");
  }
  if (config.context.top_k < 0 || config.context.pattern_top_k < 0) {
    throw std::runtime_error("context top_k values must be non-negative");
  }
  RequireSimilarity(config.context.positive_floor, "context.positive_floor");
  RequireSimilarity(config.context.negative_floor, "context.negative_floor");
  RequireSimilarity(config.context.pattern_floor, "context.pattern_floor");
}

int OverfetchTopK(int multiplier, int k) {
  if (multiplier <= 0 || k <= 0) {
    return 0;
  }
  const auto wanted = static_cast<std::int64_t>(multiplier) * static_cast<std::int64_t>(k);
  return static_cast<int>(std::min<std::int64_t>(wanted, std::numeric_limits<int>::max()));
}

}  // namespace majcpp

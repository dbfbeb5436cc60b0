#pragma once

#include "majcpp/types.hpp"

namespace majcpp {

// Overlays MAJCPP_POLICY_THRESHOLD, MAJCPP_SEMANTIC_THRESHOLD,
// MAJCPP_CONTRASTIVE_OVERFETCH, MAJCPP_PATTERN_OVERFETCH,
// MAJCPP_PATTERN_FLOOR and MAJCPP_EMBEDDING_DIM on top of `base`.
// Unset variables keep the base value; malformed ones throw.
MemoryConfig LoadMemoryConfigFromEnvironment(MemoryConfig base = {});

// Dedup thresholds with only the environment applied to the defaults.
DedupConfig DefaultDedupConfig();

void ValidateMemoryConfig(const MemoryConfig& config);

// Candidate count for an overfetching query: multiplier * k, saturated at
// INT_MAX. Non-positive inputs give 0.
int OverfetchTopK(int multiplier, int k);

}  // namespace majcpp

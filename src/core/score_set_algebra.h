// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/types/span.h>

#include "core/score_set.h"

namespace gzset {

// How scores of a member present in several inputs are combined.
enum class AggType : uint8_t { SUM, MIN, MAX };

// Input of a multi-set operation. A null set stands for a missing key and behaves as empty.
struct WeightedSet {
  const ScoreSet* set = nullptr;
  double weight = 1;
};

// All results are ordered like ScoreSet ranges: by score, then by member.
// Scores are multiplied by their input weight before aggregation and a NaN produced on the
// way, e.g. by inf * 0 or inf + -inf, becomes 0.

ScoredArray UnionSets(absl::Span<const WeightedSet> inputs, AggType agg_type = AggType::SUM);

ScoredArray InterSets(absl::Span<const WeightedSet> inputs, AggType agg_type = AggType::SUM);

// Members of the first input that are not present in any other input, with their first input
// scores.
ScoredArray DiffSets(absl::Span<const ScoreSet* const> inputs);

// Size of the intersection, counting stops once limit is reached. limit 0 means no limit.
size_t InterCard(absl::Span<const ScoreSet* const> inputs, size_t limit = 0);

}  // namespace gzset

// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_set.h>
#include <absl/random/bit_gen_ref.h>

#include <cstdint>

namespace gzset {

using RandomPick = uint32_t;

// Source of random ranks for member sampling. The random engine is borrowed from the caller
// and must outlive the generator.
class PicksGenerator {
 public:
  virtual RandomPick Generate() = 0;
  virtual ~PicksGenerator() = default;
};

// Independent picks, repeats allowed.
class NonUniquePicksGenerator : public PicksGenerator {
 public:
  /* The generated value will be within the closed-open interval [0, max_range) */
  NonUniquePicksGenerator(RandomPick max_range, absl::BitGenRef bitgen);

  RandomPick Generate() override;

 private:
  const RandomPick max_range_;
  absl::BitGenRef bitgen_;
};

// Distinct picks, each in O(1) regardless of how many were drawn so far.
// Generate() may be called at most picks_count times.
// Based on Robert Floyd's sampling algorithm: https://dl.acm.org/doi/pdf/10.1145/30401.315746
class UniquePicksGenerator : public PicksGenerator {
 public:
  // Generated values are within [0, max_range). Requires picks_count <= max_range.
  UniquePicksGenerator(uint32_t picks_count, RandomPick max_range, absl::BitGenRef bitgen);

  RandomPick Generate() override;

 private:
  RandomPick current_random_limit_;
  uint32_t remaining_picks_count_;
  absl::flat_hash_set<RandomPick> picked_indexes_;
  absl::BitGenRef bitgen_;
};

}  // namespace gzset

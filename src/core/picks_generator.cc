// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/picks_generator.h"

#include <absl/random/distributions.h>
#include <glog/logging.h>

namespace gzset {

NonUniquePicksGenerator::NonUniquePicksGenerator(RandomPick max_range, absl::BitGenRef bitgen)
    : max_range_(max_range), bitgen_(bitgen) {
  CHECK_GT(max_range, RandomPick(0));
}

RandomPick NonUniquePicksGenerator::Generate() {
  return absl::Uniform(bitgen_, 0u, max_range_);
}

UniquePicksGenerator::UniquePicksGenerator(uint32_t picks_count, RandomPick max_range,
                                           absl::BitGenRef bitgen)
    : remaining_picks_count_(picks_count), picked_indexes_(picks_count), bitgen_(bitgen) {
  CHECK_GE(max_range, picks_count);
  current_random_limit_ = max_range - picks_count;
}

RandomPick UniquePicksGenerator::Generate() {
  DCHECK_GT(remaining_picks_count_, 0u);

  remaining_picks_count_--;

  const RandomPick max_index = current_random_limit_++;
  const RandomPick random_index = absl::Uniform(bitgen_, 0u, max_index + 1u);

  const bool random_index_is_picked = picked_indexes_.emplace(random_index).second;
  if (random_index_is_picked) {
    return random_index;
  }

  // max_index has never been eligible before this round, so it is surely free.
  picked_indexes_.insert(max_index);
  return max_index;
}

}  // namespace gzset

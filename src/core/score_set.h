// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/random/bit_gen_ref.h>
#include <absl/types/span.h>

#include <functional>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/member_index.h"
#include "core/op_status.h"
#include "core/scan_cursor.h"
#include "core/score_tree.h"
#include "core/string_pool.h"

namespace gzset {

using ScoredMember = std::pair<std::string, double>;
using ScoredArray = std::vector<ScoredMember>;

enum class AddResult : uint8_t { kAdded, kUpdated, kNoop };

struct ScanPage {
  ScoredArray items;

  // Position after items, or the start cursor if the scan is complete.
  ScanCursor cursor;
};

/**
 * @brief ScoreSet is the value of a single ordered set key. It holds unique members ordered by
 * score and then by member bytes, the same total order for ranks, ranges, pops and scans.
 *
 * Member names are interned in a StringPool, the MemberIndex maps member ids to scores and the
 * score tree is an order-statistics B-tree of (score, id) pairs, which gives O(log n) ranks and
 * O(log n + k) rank ranges. Members with equal scores form contiguous runs in the tree.
 *
 * Not thread safe. All memory is allocated from the resource passed to the constructor.
 */
class ScoreSet {
 public:
  explicit ScoreSet(std::pmr::memory_resource* mr = std::pmr::get_default_resource());

  ScoreSet(const ScoreSet&) = delete;
  ScoreSet& operator=(const ScoreSet&) = delete;

  // Inserts member or moves it to a new score. -0 is stored as 0.
  // Returns INVALID_FLOAT for NaN scores, the set is not modified in that case.
  OpResult<AddResult> Add(double score, std::string_view member);

  // Returns false if member does not exist.
  bool Delete(std::string_view member);

  std::optional<double> GetScore(std::string_view member) const;

  // One entry per requested member, in request order.
  std::vector<std::optional<double>> GetScores(absl::Span<const std::string_view> members) const;

  size_t Size() const {
    return members_.Size();
  }

  bool Empty() const {
    return Size() == 0;
  }

  // 0-based position of member in ascending order, or in descending order if reverse is set.
  std::optional<unsigned> GetRank(std::string_view member, bool reverse = false) const;

  // Items with ranks in [start, stop]. Negative ranks count from the end, -1 being the last item.
  // With reverse set ranks are taken in descending order and the result is descending too.
  ScoredArray GetRangeByRank(int64_t start, int64_t stop, bool reverse = false) const;

  // Runs cb for each element in the range [start_rank, start_rank + len).
  // Stops iteration if cb returns false. Returns false in this case.
  // A member view passed to cb stays valid while the member is in the set.
  bool Iterate(unsigned start_rank, unsigned len, bool reverse,
               std::function<bool(std::string_view, double)> cb) const;

  // Removes and returns up to count lowest items, or highest if reverse is set.
  // The result is ordered from the extreme inwards.
  ScoredArray PopTopScores(unsigned count, bool reverse);

  // A uniformly chosen member, or nullopt if the set is empty.
  std::optional<ScoredMember> RandomMember(absl::BitGenRef gen) const;

  // count >= 0: min(count, Size()) distinct members.
  // count < 0: exactly -count members chosen independently, so repeats are possible.
  // Returns OUT_OF_RANGE if -count does not fit 32 bits.
  OpResult<ScoredArray> RandomMembers(int64_t count, absl::BitGenRef gen) const;

  // Returns the items that follow cursor in ascending order, at most --zset_scan_batch of them.
  ScanPage Scan(const ScanCursor& cursor) const;
  ScanPage Scan(const ScanCursor& cursor, unsigned limit) const;

  void Clear();

  // Estimated heap bytes held by the set.
  size_t MallocUsed() const;

  // Checks that the indices agree with each other. Linear, for tests.
  bool DEBUG_Validate() const;

 private:
  ScoredMember ToScoredMember(ScoreKey key) const {
    return {std::string{pool_.Resolve(key.id)}, key.score};
  }

  // Removes id from all indices. key must be in the tree.
  void Remove(ScoreKey key);

  StringPool pool_;
  MemberIndex members_;

  // Declared last: its comparator reads member names from pool_.
  ScoreTree score_tree_;
};

}  // namespace gzset

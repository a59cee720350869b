// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/score_set.h"

#include <absl/flags/flag.h>
#include <absl/random/distributions.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>

#include "core/picks_generator.h"

ABSL_FLAG(uint32_t, zset_scan_batch, 10,
          "Maximal number of items returned by a single ordered set scan call.");

namespace gzset {

using namespace std;

ScoreSet::ScoreSet(pmr::memory_resource* mr)
    : pool_(mr), members_(mr), score_tree_(&pool_, mr) {
}

OpResult<AddResult> ScoreSet::Add(double score, string_view member) {
  if (isnan(score))
    return OpStatus::INVALID_FLOAT;

  // -0.0 == 0.0 but they would render differently, keep a single representation.
  if (score == 0)
    score = 0;

  auto [id, interned] = pool_.Intern(member);
  if (interned) {
    members_.Set(id, score);
    CHECK(score_tree_.Insert(ScoreKey{score, id}));
    return AddResult::kAdded;
  }

  optional<double> prev = members_.Find(id);
  CHECK(prev) << "pooled member " << member << " has no score";

  if (*prev == score)
    return AddResult::kNoop;

  // Update the score.
  CHECK(score_tree_.Delete(ScoreKey{*prev, id}));
  members_.Set(id, score);
  CHECK(score_tree_.Insert(ScoreKey{score, id}));

  return AddResult::kUpdated;
}

void ScoreSet::Remove(ScoreKey key) {
  CHECK(score_tree_.Delete(key));
  CHECK(members_.Erase(key.id));
  pool_.Release(key.id);
}

bool ScoreSet::Delete(string_view member) {
  optional<MemberId> id = pool_.Find(member);
  if (!id)
    return false;

  optional<double> score = members_.Find(*id);
  DCHECK(score);

  Remove(ScoreKey{*score, *id});
  return true;
}

optional<double> ScoreSet::GetScore(string_view member) const {
  optional<MemberId> id = pool_.Find(member);
  if (!id)
    return nullopt;

  return members_.Find(*id);
}

vector<optional<double>> ScoreSet::GetScores(absl::Span<const string_view> members) const {
  vector<optional<double>> res(members.size());
  for (size_t i = 0; i < members.size(); ++i) {
    res[i] = GetScore(members[i]);
  }
  return res;
}

optional<unsigned> ScoreSet::GetRank(string_view member, bool reverse) const {
  optional<MemberId> id = pool_.Find(member);
  if (!id)
    return nullopt;

  optional<double> score = members_.Find(*id);
  DCHECK(score);

  optional rank = score_tree_.GetRank(ScoreKey{*score, *id}, reverse);
  DCHECK(rank);
  return rank;
}

ScoredArray ScoreSet::GetRangeByRank(int64_t start, int64_t stop, bool reverse) const {
  int64_t len = Size();
  if (start < 0)
    start += len;
  if (stop < 0)
    stop += len;

  if (start < 0)
    start = 0;
  if (stop >= len)
    stop = len - 1;

  ScoredArray res;
  if (start > stop || start >= len)
    return res;

  res.reserve(stop - start + 1);
  Iterate(start, stop - start + 1, reverse, [&](string_view member, double score) {
    res.emplace_back(string{member}, score);
    return true;
  });

  return res;
}

bool ScoreSet::Iterate(unsigned start_rank, unsigned len, bool reverse,
                       function<bool(string_view, double)> cb) const {
  DCHECK_GT(len, 0u);
  if (start_rank >= Size())
    return true;

  unsigned end_rank = min<size_t>(size_t(start_rank) + len - 1, Size() - 1);
  auto tree_cb = [&](ScoreKey key) { return cb(pool_.Resolve(key.id), key.score); };

  if (reverse)
    return score_tree_.IterateReverse(start_rank, end_rank, tree_cb);

  return score_tree_.Iterate(start_rank, end_rank, tree_cb);
}

ScoredArray ScoreSet::PopTopScores(unsigned count, bool reverse) {
  DCHECK_EQ(members_.Size(), score_tree_.Size());

  ScoredArray res;
  size_t sz = Size();
  if (sz == 0 || count == 0)
    return res;

  if (count > sz)
    count = sz;

  res.reserve(count);

  vector<ScoreKey> popped;
  popped.reserve(count);

  auto cb = [&](ScoreKey key) {
    res.push_back(ToScoredMember(key));
    popped.push_back(key);
    return true;
  };

  if (reverse) {
    score_tree_.IterateReverse(0, count - 1, cb);
  } else {
    score_tree_.Iterate(0, count - 1, cb);
  }

  if (count == sz) {
    // Corner case optimization.
    Clear();
    return res;
  }

  for (ScoreKey key : popped) {
    CHECK(score_tree_.Delete(key));
  }

  // Ids are released only after the tree no longer references them.
  for (ScoreKey key : popped) {
    CHECK(members_.Erase(key.id));
    pool_.Release(key.id);
  }

  return res;
}

optional<ScoredMember> ScoreSet::RandomMember(absl::BitGenRef gen) const {
  if (Empty())
    return nullopt;

  uint32_t rank = absl::Uniform(gen, 0u, uint32_t(Size()));
  return ToScoredMember(score_tree_.AtRank(rank));
}

OpResult<ScoredArray> ScoreSet::RandomMembers(int64_t count, absl::BitGenRef gen) const {
  constexpr int64_t kMaxPicks = numeric_limits<uint32_t>::max();
  if (count < -kMaxPicks)
    return OpStatus::OUT_OF_RANGE;

  const size_t size = Size();
  if (size == 0)
    return ScoredArray{};

  const size_t picks_count = count >= 0 ? min<size_t>(count, size) : size_t(-count);

  unique_ptr<PicksGenerator> generator =
      count >= 0 ? static_cast<unique_ptr<PicksGenerator>>(
                       make_unique<UniquePicksGenerator>(picks_count, size, gen))
                 : make_unique<NonUniquePicksGenerator>(size, gen);

  ScoredArray result(picks_count);

  // Few picks over a large set are cheaper as separate rank lookups, otherwise a single pass
  // over the whole set wins.
  if (picks_count * static_cast<uint64_t>(log2(size)) < size) {
    for (size_t i = 0; i < picks_count; i++) {
      RandomPick rank = generator->Generate();
      result[i] = ToScoredMember(score_tree_.AtRank(rank));
    }
  } else {
    vector<ScoreKey> all_elements;
    all_elements.reserve(size);
    score_tree_.Iterate(0, size - 1, [&](ScoreKey key) {
      all_elements.push_back(key);
      return true;
    });

    for (size_t i = 0; i < picks_count; i++) {
      result[i] = ToScoredMember(all_elements[generator->Generate()]);
    }
  }

  return result;
}

ScanPage ScoreSet::Scan(const ScanCursor& cursor) const {
  return Scan(cursor, absl::GetFlag(FLAGS_zset_scan_batch));
}

ScanPage ScoreSet::Scan(const ScanCursor& cursor, unsigned limit) const {
  ScanPage page;
  if (Empty())
    return page;

  if (limit == 0)
    limit = 1;

  // The cursor names the last item returned, resume right after it. That item may have been
  // deleted or moved since, which does not matter for the position.
  uint32_t rank =
      cursor.IsStart() ? 0 : score_tree_.UpperBoundRank({cursor.score(), cursor.member()});
  uint32_t end_rank = min<uint64_t>(uint64_t(rank) + limit - 1, numeric_limits<uint32_t>::max());

  score_tree_.Iterate(rank, end_rank, [&](ScoreKey key) {
    page.items.push_back(ToScoredMember(key));
    return true;
  });

  if (!page.items.empty() && rank + page.items.size() < Size()) {
    const ScoredMember& last = page.items.back();
    page.cursor = ScanCursor{last.second, last.first};
  }

  DVLOG(2) << "Scan from " << cursor << " returned " << page.items.size() << " items, next "
           << page.cursor;
  return page;
}

void ScoreSet::Clear() {
  score_tree_.Clear();
  members_.Clear();
  pool_.Clear();
}

size_t ScoreSet::MallocUsed() const {
  return pool_.MallocUsed() + members_.MallocUsed() + score_tree_.MallocUsed();
}

bool ScoreSet::DEBUG_Validate() const {
  if (members_.Size() != score_tree_.Size() || members_.Size() != pool_.Size()) {
    LOG(ERROR) << "Size mismatch: index " << members_.Size() << ", tree " << score_tree_.Size()
               << ", pool " << pool_.Size();
    return false;
  }

  if (Empty())
    return true;

  optional<ScoreKey> prev;
  bool valid = true;

  score_tree_.Iterate(0, score_tree_.Size() - 1, [&](ScoreKey key) {
    if (!pool_.IsLive(key.id)) {
      LOG(ERROR) << "Dead id " << key.id << " in the score tree";
      valid = false;
      return false;
    }

    optional<double> score = members_.Find(key.id);
    if (!score || *score != key.score) {
      LOG(ERROR) << "Score of " << pool_.Resolve(key.id) << " differs: tree " << key.score;
      valid = false;
      return false;
    }

    if (prev && score_tree_.Compare(*prev, key) >= 0) {
      LOG(ERROR) << "Out of order: " << pool_.Resolve(prev->id) << " before "
                 << pool_.Resolve(key.id);
      valid = false;
      return false;
    }
    prev = key;
    return true;
  });

  return valid && score_tree_.DEBUG_Validate();
}

}  // namespace gzset

// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/score_set_algebra.h"

#include <absl/container/flat_hash_map.h>
#include <glog/logging.h>

#include <algorithm>
#include <cmath>

namespace gzset {

using namespace std;

namespace {

using ScoredMap = absl::flat_hash_map<std::string, double>;

ScoredMap FromSet(const ScoreSet& ss, double weight) {
  ScoredMap res;
  if (ss.Empty())
    return res;

  res.reserve(ss.Size());
  ss.Iterate(0, ss.Size(), false, [&](string_view member, double score) {
    score *= weight;
    if (isnan(score))
      score = 0;
    res.emplace(member, score);
    return true;
  });

  return res;
}

double Aggregate(double v1, double v2, AggType atype) {
  switch (atype) {
    case AggType::SUM:
      v1 += v2;
      return isnan(v1) ? 0 : v1;
    case AggType::MAX:
      return max(v1, v2);
    case AggType::MIN:
      return min(v1, v2);
  }
  return 0;
}

// the result is in the destination.
void UnionScoredMap(ScoredMap* dest, ScoredMap* src, AggType agg_type) {
  // Merge the smaller map into the larger one.
  if (src->size() > dest->size())
    dest->swap(*src);

  for (const auto& elem : *src) {
    auto [it, inserted] = dest->emplace(elem);
    if (!inserted) {
      it->second = Aggregate(it->second, elem.second, agg_type);
    }
  }
}

// the result is in the destination.
void InterScoredMap(ScoredMap* dest, const ScoredMap& src, AggType agg_type) {
  for (auto it = dest->begin(); it != dest->end();) {
    auto src_it = src.find(it->first);
    if (src_it == src.end()) {
      dest->erase(it++);
    } else {
      it->second = Aggregate(it->second, src_it->second, agg_type);
      ++it;
    }
  }
}

ScoredArray ToSortedArray(ScoredMap&& sm) {
  ScoredArray res;
  res.reserve(sm.size());
  for (auto& [member, score] : sm) {
    res.emplace_back(member, score);
  }

  sort(res.begin(), res.end(), [](const ScoredMember& a, const ScoredMember& b) {
    return a.second < b.second || (a.second == b.second && a.first < b.first);
  });
  return res;
}

}  // namespace

ScoredArray UnionSets(absl::Span<const WeightedSet> inputs, AggType agg_type) {
  ScoredMap result;
  for (const WeightedSet& input : inputs) {
    if (!input.set)
      continue;

    ScoredMap sm = FromSet(*input.set, input.weight);
    if (result.empty())
      result.swap(sm);
    else
      UnionScoredMap(&result, &sm, agg_type);
  }

  return ToSortedArray(std::move(result));
}

ScoredArray InterSets(absl::Span<const WeightedSet> inputs, AggType agg_type) {
  if (inputs.empty())
    return {};

  // Start from the smallest input, the intersection can only shrink.
  auto smallest = min_element(inputs.begin(), inputs.end(), [](const auto& a, const auto& b) {
    size_t sa = a.set ? a.set->Size() : 0;
    size_t sb = b.set ? b.set->Size() : 0;
    return sa < sb;
  });

  if (!smallest->set || smallest->set->Empty())
    return {};

  ScoredMap result = FromSet(*smallest->set, smallest->weight);
  for (auto it = inputs.begin(); it != inputs.end() && !result.empty(); ++it) {
    if (it == smallest)
      continue;

    InterScoredMap(&result, FromSet(*it->set, it->weight), agg_type);
  }

  VLOG(1) << "InterSets over " << inputs.size() << " inputs: " << result.size() << " members";
  return ToSortedArray(std::move(result));
}

ScoredArray DiffSets(absl::Span<const ScoreSet* const> inputs) {
  ScoredArray res;
  if (inputs.empty() || !inputs[0] || inputs[0]->Empty())
    return res;

  const ScoreSet& first = *inputs[0];
  auto rest = inputs.subspan(1);

  // Iteration follows the set order, so the result needs no sorting.
  first.Iterate(0, first.Size(), false, [&](string_view member, double score) {
    for (const ScoreSet* other : rest) {
      if (other && other->GetScore(member))
        return true;
    }
    res.emplace_back(string{member}, score);
    return true;
  });

  return res;
}

size_t InterCard(absl::Span<const ScoreSet* const> inputs, size_t limit) {
  if (inputs.empty())
    return 0;

  for (const ScoreSet* input : inputs) {
    if (!input || input->Empty())
      return 0;
  }

  auto by_size = [](const ScoreSet* a, const ScoreSet* b) { return a->Size() < b->Size(); };
  auto smallest = min_element(inputs.begin(), inputs.end(), by_size);

  size_t count = 0;
  (*smallest)->Iterate(0, (*smallest)->Size(), false, [&](string_view member, double) {
    for (const ScoreSet* other : inputs) {
      if (other != *smallest && !other->GetScore(member))
        return true;
    }
    ++count;
    return limit == 0 || count < limit;
  });

  return count;
}

}  // namespace gzset

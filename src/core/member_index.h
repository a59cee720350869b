// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>

#include <memory_resource>
#include <optional>

#include "core/string_pool.h"

namespace gzset {

// Current score of every live member of an ordered set. This is the authority on membership,
// the score tree is derived from it.
class MemberIndex {
  using Alloc = std::pmr::polymorphic_allocator<std::pair<const MemberId, double>>;
  using Map =
      absl::flat_hash_map<MemberId, double, absl::Hash<MemberId>, std::equal_to<MemberId>, Alloc>;

 public:
  explicit MemberIndex(std::pmr::memory_resource* mr) : map_(mr) {
  }

  std::optional<double> Find(MemberId id) const {
    auto it = map_.find(id);
    if (it == map_.end())
      return std::nullopt;
    return it->second;
  }

  // Returns the previous score of id if it had one.
  std::optional<double> Set(MemberId id, double score) {
    auto [it, inserted] = map_.try_emplace(id, score);
    if (inserted)
      return std::nullopt;

    double prev = it->second;
    it->second = score;
    return prev;
  }

  bool Erase(MemberId id) {
    return map_.erase(id) > 0;
  }

  size_t Size() const {
    return map_.size();
  }

  void Clear() {
    map_.clear();
  }

  size_t MallocUsed() const {
    return map_.capacity() * (sizeof(Map::value_type) + 1);
  }

 private:
  Map map_;
};

}  // namespace gzset

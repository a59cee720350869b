// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_set.h>

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gzset {

using MemberId = uint32_t;

// Interns member names of a single ordered set and hands out compact ids for them.
// Ids of released members are reused before new slots are added. Slots never move, so the view
// returned by Resolve() stays valid until the id is released or the pool is cleared, even if
// other members are interned meanwhile.
class StringPool {
  StringPool(const StringPool&) = delete;
  StringPool& operator=(const StringPool&) = delete;

 public:
  explicit StringPool(std::pmr::memory_resource* mr);

  // Returns the id of text and true if it was interned by this call.
  std::pair<MemberId, bool> Intern(std::string_view text);

  std::optional<MemberId> Find(std::string_view text) const;

  // id must be live.
  void Release(MemberId id);

  std::string_view Resolve(MemberId id) const;

  bool IsLive(MemberId id) const {
    return id < slots_.size() && slots_[id].live;
  }

  // Number of live ids.
  size_t Size() const {
    return index_.size();
  }

  // Number of ids ever allocated, live or free.
  size_t AllocatedIds() const {
    return slots_.size();
  }

  void Clear();

  size_t MallocUsed() const;

 private:
  struct Slot {
    using allocator_type = std::pmr::polymorphic_allocator<char>;

    explicit Slot(const allocator_type& alloc) : text(alloc) {
    }

    Slot(const Slot& o, const allocator_type& alloc) : text(o.text, alloc), live(o.live) {
    }

    Slot(Slot&& o, const allocator_type& alloc) : text(std::move(o.text), alloc), live(o.live) {
    }

    std::pmr::string text;
    bool live = false;
  };

  // The index stores ids only and resolves them through the pool for hashing and equality,
  // so a lookup by text does not need a temporary id.
  struct Hasher {
    using is_transparent = void;  // to allow heterogeneous lookups.

    size_t operator()(MemberId id) const {
      return (*this)(pool->Resolve(id));
    }

    size_t operator()(std::string_view s) const {
      return absl::Hash<std::string_view>{}(s);
    }

    const StringPool* pool;
  };

  struct Eq {
    using is_transparent = void;  // to allow heterogeneous lookups.

    bool operator()(MemberId left, MemberId right) const {
      return left == right;
    }

    bool operator()(MemberId left, std::string_view right) const {
      return pool->Resolve(left) == right;
    }

    bool operator()(std::string_view left, MemberId right) const {
      return left == pool->Resolve(right);
    }

    const StringPool* pool;
  };

  using IdSet =
      absl::flat_hash_set<MemberId, Hasher, Eq, std::pmr::polymorphic_allocator<MemberId>>;

  // A deque keeps slots in place when it grows. Short texts live inside the slot itself.
  std::pmr::deque<Slot> slots_;
  std::pmr::vector<MemberId> free_ids_;
  IdSet index_;

  // Heap bytes held by the texts of live slots.
  size_t text_bytes_ = 0;
};

}  // namespace gzset

// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/string_pool.h"

#include <glog/logging.h>

#include <limits>

namespace gzset {

using namespace std;

namespace {

// Short strings live inside the std::string object itself and cost no heap.
size_t HeapBytes(const pmr::string& s) {
  return s.capacity() > pmr::string{}.capacity() ? s.capacity() + 1 : 0;
}

}  // namespace

StringPool::StringPool(pmr::memory_resource* mr)
    : slots_(mr), free_ids_(mr), index_(0, Hasher{this}, Eq{this}, mr) {
}

pair<MemberId, bool> StringPool::Intern(string_view text) {
  auto it = index_.find(text);
  if (it != index_.end())
    return {*it, false};

  MemberId id;
  if (free_ids_.empty()) {
    CHECK_LT(slots_.size(), size_t(numeric_limits<MemberId>::max()));
    id = slots_.size();
    slots_.emplace_back();
  } else {
    id = free_ids_.back();
    free_ids_.pop_back();
  }

  Slot& slot = slots_[id];
  DCHECK(!slot.live);
  DCHECK(slot.text.empty());

  slot.text.assign(text.data(), text.size());
  slot.live = true;
  text_bytes_ += HeapBytes(slot.text);

  // The slot must hold the text before the index hashes the id.
  index_.insert(id);

  return {id, true};
}

optional<MemberId> StringPool::Find(string_view text) const {
  auto it = index_.find(text);
  if (it == index_.end())
    return nullopt;
  return *it;
}

void StringPool::Release(MemberId id) {
  DCHECK(IsLive(id)) << "releasing dead member id " << id;

  Slot& slot = slots_[id];
  size_t erased = index_.erase(id);
  DCHECK_EQ(erased, 1u);

  text_bytes_ -= HeapBytes(slot.text);

  // Drop the heap buffer so that the next owner of this id starts from an empty slot.
  pmr::string empty(slots_.get_allocator());
  slot.text.swap(empty);
  slot.live = false;

  free_ids_.push_back(id);
}

string_view StringPool::Resolve(MemberId id) const {
  DCHECK(IsLive(id)) << "resolving dead member id " << id;
  return slots_[id].text;
}

void StringPool::Clear() {
  index_.clear();

  // clear() may keep the capacity, swapping with empty containers frees it.
  decltype(slots_)(slots_.get_allocator()).swap(slots_);
  decltype(free_ids_)(free_ids_.get_allocator()).swap(free_ids_);
  text_bytes_ = 0;
}

size_t StringPool::MallocUsed() const {
  // flat_hash_set keeps one control byte per slot besides the slot itself.
  return slots_.size() * sizeof(Slot) + free_ids_.capacity() * sizeof(MemberId) +
         index_.capacity() * (sizeof(MemberId) + 1) + text_bytes_;
}

}  // namespace gzset

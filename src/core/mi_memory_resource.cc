// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#include "core/mi_memory_resource.h"

#include <glog/logging.h>

#include <algorithm>
#include <new>

namespace gzset {

using namespace std;

void* MiMemoryResource::do_allocate(size_t size, size_t align) {
  DCHECK(align);

  void* res = mi_heap_malloc_aligned(heap_, size, align);

  if (!res)
    throw bad_alloc{};

  size_t delta = mi_usable_size(res);

  used_ += delta;
  peak_used_ = max(peak_used_, used_);
  ++num_blocks_;
  DVLOG(2) << "do_allocate: " << heap_ << " " << size << "/" << delta;

  return res;
}

void MiMemoryResource::do_deallocate(void* ptr, size_t size, size_t align) {
  size_t usable = mi_usable_size(ptr);

  DVLOG(2) << "do_deallocate: " << heap_ << " " << usable;

  DCHECK_GE(used_, usable);
  DCHECK_GT(num_blocks_, 0u);
  used_ -= usable;
  --num_blocks_;
  mi_free_size_aligned(ptr, size, align);
}

}  // namespace gzset

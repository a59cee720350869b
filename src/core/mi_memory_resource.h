// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <mimalloc.h>

#include <memory_resource>

namespace gzset {

// Memory resource that places all allocations of an ordered set in a single mimalloc heap
// and keeps count of the bytes it handed out, as reported by mi_usable_size.
class MiMemoryResource : public std::pmr::memory_resource {
 public:
  explicit MiMemoryResource(mi_heap_t* heap) : heap_(heap) {
  }

  size_t used() const {
    return used_;
  }

  // High watermark of used().
  size_t peak_used() const {
    return peak_used_;
  }

  // Number of live allocations.
  size_t num_blocks() const {
    return num_blocks_;
  }

 private:
  void* do_allocate(std::size_t size, std::size_t align) final;

  void do_deallocate(void* ptr, std::size_t size, std::size_t align) final;

  bool do_is_equal(const std::pmr::memory_resource& o) const noexcept {
    return this == &o;
  }

  mi_heap_t* heap_;
  size_t used_ = 0;
  size_t peak_used_ = 0;
  size_t num_blocks_ = 0;
};

}  // namespace gzset

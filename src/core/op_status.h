// Copyright 2021, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>
#include <utility>

namespace gzset {

enum class OpStatus : uint16_t {
  OK,
  INVALID_FLOAT,
  INVALID_CURSOR,
  OUT_OF_RANGE,
};

class OpResultBase {
 public:
  OpResultBase(OpStatus st = OpStatus::OK) : st_(st) {
  }

  constexpr explicit operator bool() const {
    return st_ == OpStatus::OK;
  }

  OpStatus status() const {
    return st_;
  }

 private:
  OpStatus st_;
};

template <typename V> class OpResult : public OpResultBase {
 public:
  OpResult(V&& v) : v_(std::move(v)) {
  }

  OpResult(const V& v) : v_(v) {
  }

  using OpResultBase::OpResultBase;

  const V& value() const {
    return v_;
  }

  V& value() {
    return v_;
  }

  V* operator->() {
    return &v_;
  }

  V& operator*() & {
    return v_;
  }

  V&& operator*() && {
    return std::move(v_);
  }

  const V* operator->() const {
    return &v_;
  }

  const V& operator*() const& {
    return v_;
  }

 private:
  V v_{};
};

// Returns the error text a host would reply with for a failed status.
std::string_view StatusToMsg(OpStatus status);

}  // namespace gzset

namespace std {

inline std::ostream& operator<<(std::ostream& os, const gzset::OpStatus op) {
  os << int(op);
  return os;
}

}  // namespace std

// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/op_status.h"

#include <glog/logging.h>

namespace gzset {

namespace {

constexpr char kInvalidFloatErr[] = "value is not a valid float";
constexpr char kInvalidCursorErr[] = "invalid cursor";
constexpr char kIndexOutOfRange[] = "value is out of range";

}  // namespace

std::string_view StatusToMsg(OpStatus status) {
  switch (status) {
    case OpStatus::OK:
      return "OK";
    case OpStatus::INVALID_FLOAT:
      return kInvalidFloatErr;
    case OpStatus::INVALID_CURSOR:
      return kInvalidCursorErr;
    case OpStatus::OUT_OF_RANGE:
      return kIndexOutOfRange;
    default:
      LOG(ERROR) << "Unsupported status " << status;
      return "Internal error";
  }
}

}  // namespace gzset

// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/op_status.h"

namespace gzset {

// Resume position of an ordered set scan: the last (score, member) pair a caller has seen.
// Its text form is "<score>|<member>" where every '|' in the member is written as "%7C".
// The scan start and scan end are both represented by the "0" token.
class ScanCursor {
 public:
  static constexpr std::string_view kStartToken = "0";

  // Start cursor.
  ScanCursor() = default;

  ScanCursor(double score, std::string member) : pos_(Position{score, std::move(member)}) {
  }

  static ScanCursor Start() {
    return ScanCursor{};
  }

  // Parses the text form. Fails with INVALID_CURSOR on a missing separator, an unparsable or
  // NaN score or an unescaped '|' in the member part.
  static OpResult<ScanCursor> TryFrom(std::string_view text);

  std::string ToString() const;

  bool IsStart() const {
    return !pos_.has_value();
  }

  double score() const {
    return pos_->score;
  }

  const std::string& member() const {
    return pos_->member;
  }

  bool operator==(const ScanCursor& o) const;

 private:
  struct Position {
    double score;
    std::string member;
  };

  std::optional<Position> pos_;
};

std::ostream& operator<<(std::ostream& os, const ScanCursor& cursor);

}  // namespace gzset

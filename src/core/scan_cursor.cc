// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/scan_cursor.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_replace.h>
#include <glog/logging.h>

#include "core/score_format.h"

namespace gzset {

using namespace std;

namespace {

constexpr char kSeparator = '|';
constexpr string_view kEscapedSeparator = "%7C";

}  // namespace

OpResult<ScanCursor> ScanCursor::TryFrom(string_view text) {
  if (text == kStartToken)
    return ScanCursor{};

  size_t sep = text.find(kSeparator);
  if (sep == string_view::npos) {
    VLOG(1) << "cursor without separator: " << text;
    return OpStatus::INVALID_CURSOR;
  }

  double score;
  if (!ParseScore(text.substr(0, sep), &score)) {
    VLOG(1) << "bad cursor score: " << text.substr(0, sep);
    return OpStatus::INVALID_CURSOR;
  }

  string_view member = text.substr(sep + 1);
  if (member.find(kSeparator) != string_view::npos) {
    VLOG(1) << "unescaped separator in cursor member: " << text;
    return OpStatus::INVALID_CURSOR;
  }

  return ScanCursor{score, absl::StrReplaceAll(member, {{kEscapedSeparator, "|"}})};
}

string ScanCursor::ToString() const {
  if (IsStart())
    return string{kStartToken};

  char buf[kMaxScoreLen];
  return absl::StrCat(FormatScore(pos_->score, buf, sizeof(buf)), "|",
                      absl::StrReplaceAll(pos_->member, {{"|", kEscapedSeparator}}));
}

bool ScanCursor::operator==(const ScanCursor& o) const {
  if (IsStart() || o.IsStart())
    return IsStart() == o.IsStart();

  return pos_->score == o.pos_->score && pos_->member == o.pos_->member;
}

ostream& operator<<(ostream& os, const ScanCursor& cursor) {
  return os << cursor.ToString();
}

}  // namespace gzset

// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/score_format.h"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <double-conversion/double-to-string.h>
#include <glog/logging.h>

#include <cmath>

namespace gzset {

using namespace std;
using double_conversion::DoubleToStringConverter;
using double_conversion::StringBuilder;

namespace {

constexpr unsigned kConvFlags = DoubleToStringConverter::UNIQUE_ZERO;

const DoubleToStringConverter score_conv(kConvFlags, "inf", "nan", 'e', -6, 21, 6, 0);

}  // namespace

string_view FormatScore(double score, char* dest, size_t len) {
  DCHECK_GE(len, kMaxScoreLen);

  StringBuilder sb(dest, len);
  CHECK(score_conv.ToShortest(score, &sb));
  size_t sz = sb.position();
  sb.Finalize();
  return string_view{dest, sz};
}

string FormatScore(double score) {
  char buf[kMaxScoreLen];
  return string{FormatScore(score, buf, sizeof(buf))};
}

bool ParseScore(string_view text, double* score) {
  // SimpleAtod tolerates surrounding whitespace, cursors must not.
  if (text.empty() || absl::ascii_isspace(text.front()) || absl::ascii_isspace(text.back()))
    return false;

  double val;
  if (!absl::SimpleAtod(text, &val) || isnan(val))
    return false;

  *score = val;
  return true;
}

}  // namespace gzset

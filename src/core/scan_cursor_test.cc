// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/scan_cursor.h"

#include <gtest/gtest.h>

#include <limits>

using namespace std;

namespace gzset {

class ScanCursorTest : public ::testing::Test {
 protected:
  static ScanCursor Parse(string_view text) {
    OpResult<ScanCursor> res = ScanCursor::TryFrom(text);
    EXPECT_TRUE(res) << text;
    return res.value();
  }

  static OpStatus ParseError(string_view text) {
    return ScanCursor::TryFrom(text).status();
  }
};

TEST_F(ScanCursorTest, Start) {
  ScanCursor start;
  EXPECT_TRUE(start.IsStart());
  EXPECT_EQ("0", start.ToString());
  EXPECT_TRUE(Parse("0").IsStart());
  EXPECT_EQ(ScanCursor::Start(), Parse("0"));
}

TEST_F(ScanCursorTest, Encode) {
  EXPECT_EQ("1|b", ScanCursor(1, "b").ToString());
  EXPECT_EQ("-2.5|x", ScanCursor(-2.5, "x").ToString());
  EXPECT_EQ("inf|top", ScanCursor(numeric_limits<double>::infinity(), "top").ToString());
  EXPECT_EQ("0|", ScanCursor(0, "").ToString());
  EXPECT_EQ("3|a%7Cb%7C", ScanCursor(3, "a|b|").ToString());

  // Only the separator is escaped.
  EXPECT_EQ("1|a b%c", ScanCursor(1, "a b%c").ToString());
}

TEST_F(ScanCursorTest, Decode) {
  ScanCursor c = Parse("1|b");
  ASSERT_FALSE(c.IsStart());
  EXPECT_EQ(1, c.score());
  EXPECT_EQ("b", c.member());

  c = Parse("-inf|%7C%7C");
  EXPECT_EQ(-numeric_limits<double>::infinity(), c.score());
  EXPECT_EQ("||", c.member());

  c = Parse("0|");
  EXPECT_FALSE(c.IsStart());
  EXPECT_EQ("", c.member());
}

TEST_F(ScanCursorTest, RoundTrip) {
  for (string member : {"plain", "with|pipe", "|", "||lead", "trail|", "", "sp ace", "%7"}) {
    for (double score : {0.0, 1.0, -1.0, 0.1, 1e300, -numeric_limits<double>::infinity()}) {
      ScanCursor orig(score, member);
      ScanCursor decoded = Parse(orig.ToString());
      EXPECT_EQ(orig, decoded) << orig.ToString();
    }
  }
}

TEST_F(ScanCursorTest, Malformed) {
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError(""));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("1"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("abc"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("|a"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("x|a"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("nan|a"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("1.5.5|a"));
  EXPECT_EQ(OpStatus::INVALID_CURSOR, ParseError("1|a|b"));
  EXPECT_EQ("invalid cursor", StatusToMsg(OpStatus::INVALID_CURSOR));
}

}  // namespace gzset

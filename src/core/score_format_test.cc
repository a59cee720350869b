// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "core/score_format.h"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <random>

using namespace std;

namespace gzset {

class ScoreFormatTest : public ::testing::Test {};

TEST_F(ScoreFormatTest, Format) {
  EXPECT_EQ("1", FormatScore(1.0));
  EXPECT_EQ("-3", FormatScore(-3.0));
  EXPECT_EQ("0", FormatScore(0.0));
  EXPECT_EQ("0", FormatScore(-0.0));
  EXPECT_EQ("0.1", FormatScore(0.1));
  EXPECT_EQ("42.5", FormatScore(42.5));
  EXPECT_EQ("inf", FormatScore(numeric_limits<double>::infinity()));
  EXPECT_EQ("-inf", FormatScore(-numeric_limits<double>::infinity()));
  EXPECT_EQ("1e21", FormatScore(1e21));
  EXPECT_EQ("1e-7", FormatScore(1e-7));
}

TEST_F(ScoreFormatTest, Parse) {
  double d = 0;
  EXPECT_TRUE(ParseScore("1", &d));
  EXPECT_EQ(1, d);
  EXPECT_TRUE(ParseScore("-2.5", &d));
  EXPECT_EQ(-2.5, d);
  EXPECT_TRUE(ParseScore("inf", &d));
  EXPECT_EQ(numeric_limits<double>::infinity(), d);
  EXPECT_TRUE(ParseScore("-inf", &d));
  EXPECT_EQ(-numeric_limits<double>::infinity(), d);

  d = 7;
  EXPECT_FALSE(ParseScore("", &d));
  EXPECT_FALSE(ParseScore("nan", &d));
  EXPECT_FALSE(ParseScore("1x", &d));
  EXPECT_FALSE(ParseScore(" 1", &d));
  EXPECT_FALSE(ParseScore("1 ", &d));
  EXPECT_FALSE(ParseScore("abc", &d));
  EXPECT_EQ(7, d);
}

TEST_F(ScoreFormatTest, RoundTrip) {
  mt19937_64 gen(7);
  uniform_real_distribution<double> dist(-1e12, 1e12);

  for (unsigned i = 0; i < 10000; ++i) {
    double val = dist(gen);
    double parsed;
    ASSERT_TRUE(ParseScore(FormatScore(val), &parsed)) << val;
    ASSERT_EQ(val, parsed);
  }

  for (double val : {numeric_limits<double>::min(), numeric_limits<double>::max(),
                     numeric_limits<double>::lowest(), numeric_limits<double>::denorm_min()}) {
    double parsed;
    ASSERT_TRUE(ParseScore(FormatScore(val), &parsed)) << val;
    EXPECT_EQ(val, parsed);
  }
}

}  // namespace gzset

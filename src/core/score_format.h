// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <string>
#include <string_view>

namespace gzset {

// Enough for any double in shortest form, including sign and exponent.
constexpr size_t kMaxScoreLen = 32;

// Writes the shortest decimal text that parses back to exactly `score` into dest and returns
// a view of it. Integral values have no fraction part, infinities are "inf" and "-inf".
std::string_view FormatScore(double score, char* dest, size_t len);

std::string FormatScore(double score);

// Strict inverse of FormatScore. Fails on empty input, trailing garbage and NaN.
bool ParseScore(std::string_view text, double* score);

}  // namespace gzset

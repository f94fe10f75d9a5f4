// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cmath>
#include <cstdint>

namespace decimaliser {

// The largest n such that every 10^n fits into an int64_t.
constexpr int LargestExponentInLong = 18;

// Zero is reported as 0 * 10^-1 (i.e. "0.0"), with its sign.
constexpr int ZeroExponent = 1;

namespace impl {

constexpr uint64_t kPow10_u64[] = {
    1ull,
    10ull,
    100ull,
    1000ull,
    10000ull,
    100000ull,
    1000000ull,
    10000000ull,
    100000000ull,
    1000000000ull,
    10000000000ull,
    100000000000ull,
    1000000000000ull,
    10000000000000ull,
    100000000000000ull,
    1000000000000000ull,
    10000000000000000ull,
    100000000000000000ull,
    1000000000000000000ull,
};

// All of these are exactly representable.
constexpr double kPow10_f64[] = {
    1e+00, 1e+01, 1e+02, 1e+03, 1e+04, 1e+05, 1e+06, 1e+07,
    1e+08, 1e+09, 1e+10, 1e+11, 1e+12, 1e+13, 1e+14, 1e+15,
    1e+16, 1e+17, 1e+18, 1e+19, 1e+20, 1e+21, 1e+22,
};

constexpr int kMaxExactPow10 = 22;

// Returns floor(x + 0.5), i.e. x rounded half-up (x >= 0).
// Returns false if the result does not fit into an int64_t.
inline bool RoundToInt64(double x, int64_t& result)
{
    DECIMALISER_ASSERT(!(x < 0));

    const double r = std::floor(x);
    if (!(r < 9223372036854775808.0)) // also catches NaN
        return false;

    // x - floor(x) is exact.
    // For r >= 2^52, x is an integer and the fraction is 0.
    int64_t q = static_cast<int64_t>(r);
    if (x - r >= 0.5)
        ++q;

    result = q;
    return true;
}

} // namespace impl

} // namespace decimaliser

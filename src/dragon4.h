// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>

namespace decimaliser {
namespace dragon4 {

// Computes the shortest decimal digits in the rounding interval of v = f * 2^e:
//
//      v ~= digits * 10^exponent
//
// PRE: f != 0, f < 2^53
void Dragon4(uint64_t& digits, int& exponent, uint64_t f, int e, bool accept_bounds, bool lower_boundary_is_closer);

// Shortest digits which round back to 'value' in the precision of 'Float'.
// For float, the rounding interval is computed in single-precision.
// The result has at most max_digits10 digits and no trailing zeros.
//
// PRE: value is finite and strictly positive
template <typename Float>
inline void ToDigits(uint64_t& digits, int& exponent, Float value)
{
    using Fp = IEEE<Float>;

    const Fp v(value);
    DECIMALISER_ASSERT(v.IsFinite());
    DECIMALISER_ASSERT(!v.IsZero());
    DECIMALISER_ASSERT(!v.SignBit());

    const auto F = v.PhysicalSignificand();
    const auto E = v.PhysicalExponent();

    uint64_t f;
    int e;
    if (E == 0) // subnormal
    {
        f = F;
        e = Fp::MinExponent;
    }
    else
    {
        f = F + Fp::HiddenBit;
        e = static_cast<int>(E) - Fp::ExponentBias;
    }

    const bool accept_bounds = (f % 2 == 0);
    const bool lower_boundary_is_closer = (F == 0 && E > 1);

    Dragon4(digits, exponent, f, e, accept_bounds, lower_boundary_is_closer);
    DECIMALISER_ASSERT(digits != 0);

    while (digits % 10 == 0)
    {
        digits /= 10;
        exponent++;
    }
}

} // namespace dragon4
} // namespace decimaliser

// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "dragon4.h"

#include "diy_int.h"

//==================================================================================================
// Dragon4
//
// Implements the Dragon4 algorithm for (IEEE) binary to decimal floating-point conversion.
//
// References:
//
// [1]  Burger, Dybvig, "Printing Floating-Point Numbers Quickly and Accurately",
//      Proceedings of the ACM SIGPLAN 1996 Conference on Programming Language Design and Implementation, PLDI 1996
// [2]  Steele, White, "How to Print FloatingPoint Numbers Accurately",
//      Proceedings of the ACM SIGPLAN 1990 conference on Programming language design and implementation, PLDI 1990
//==================================================================================================

using namespace decimaliser;
using namespace decimaliser::impl;

static inline int SAR(int x, int n)
{
    // Technically, right-shift of negative integers is implementation defined...
    return x < 0 ? ~(~x >> n) : (x >> n);
}

// Returns: ceil(log_10(2^e))
static inline int CeilLog10Pow2(int e)
{
    DECIMALISER_ASSERT(e >= -2620);
    DECIMALISER_ASSERT(e <=  2620);
    return SAR(e * 315653 + ((1 << 20) - 1), 20);
}

static inline int EffectivePrecision(uint64_t f)
{
    DECIMALISER_ASSERT(f != 0);
    return 64 - CountLeadingZeros64(f);
}

// Sets up r / s = v (scaled by 2^boundaryShift) and the distance delta to the boundaries,
// and returns an estimate k of ceil(log_10(v)), which is either exact or one too small.
static int ComputeInitialValuesAndEstimate(DiyInt& r, DiyInt& s, DiyInt& delta, uint64_t f, int e, bool lower_boundary_is_closer)
{
    const int boundary_shift = lower_boundary_is_closer ? 2 : 1;
    const int p = EffectivePrecision(f);
    DECIMALISER_ASSERT(p >= 1);
    DECIMALISER_ASSERT(p <= 53);
    const int k = CeilLog10Pow2(e + (p - 1));

    if (e >= 0)
    {
        DECIMALISER_ASSERT(e <= 971);
        DECIMALISER_ASSERT(k >= 0);

        // r = f * 2^(boundary_shift + e)
        AssignU64MulPow2(r, f << boundary_shift, e);
        // s = 2^boundary_shift * 10^k
        AssignPow2MulPow5(s, boundary_shift + k, k);
        // delta = 2^e
        AssignPow2(delta, e);
    }
    else if (k < 0)
    {
        DECIMALISER_ASSERT(e >= -1074);
        DECIMALISER_ASSERT(k >= -323);

        // r = f * 2^boundary_shift * 10^(-k)
        AssignU64MulPow10(r, f << boundary_shift, -k);
        // s = 2^(boundary_shift - e)
        AssignPow2(s, boundary_shift - e);
        // delta = 10^(-k)
        AssignPow10(delta, -k);
    }
    else
    {
        DECIMALISER_ASSERT(e >= -55);
        DECIMALISER_ASSERT(k <= 16);

        // r = f * 2^boundary_shift
        AssignU64(r, f << boundary_shift);
        // s = 2^(boundary_shift - e) * 10^k
        AssignPow2MulPow5(s, boundary_shift - e + k, k);
        // delta = 1
        AssignU32(delta, 1);
    }

    return k;
}

void dragon4::Dragon4(uint64_t& digits, int& exponent, uint64_t f, int e, bool accept_bounds, bool lower_boundary_is_closer)
{
    DiyInt r;
    DiyInt s;
    DiyInt delta;

    int k = ComputeInitialValuesAndEstimate(r, s, delta, f, e, lower_boundary_is_closer);

    // Fixup, in case k is too low.
    const int cmpf = CompareAdd(r, delta, s);
    if (accept_bounds ? (cmpf >= 0) : (cmpf > 0))
    {
        Mul10(s);
        k++;
    }

    Mul10(r);
    Mul10(delta);

    // Generate digits from left to right.
    uint64_t d = 0;
    int length = 0;
    for (;;)
    {
        DECIMALISER_ASSERT(length < 17);
        DECIMALISER_ASSERT(r.size > 0);

        // q = r / s
        // r = r % s
        uint32_t q = DivMod(r, s);
        DECIMALISER_ASSERT(q <= 9);

        const int cmp1 = Compare(r, delta);
        if (lower_boundary_is_closer)
        {
            Mul2(delta);
        }
        const int cmp2 = CompareAdd(r, delta, s);

        const bool tc1 = accept_bounds ? (cmp1 <= 0) : (cmp1 < 0);
        const bool tc2 = accept_bounds ? (cmp2 >= 0) : (cmp2 > 0);
        if (tc1 && tc2)
        {
            // Both candidates are within the bounds: take the one closer to v.
            // Ties are broken towards the even digit.
            const int cmpr = CompareAdd(r, r, s);
            if (cmpr > 0 || (cmpr == 0 && q % 2 != 0))
            {
                q++;
            }
        }
        else if (!tc1 && tc2)
        {
            q++;
        }

        DECIMALISER_ASSERT(q <= 9);
        d = 10 * d + q;
        length++;
        k--;

        if (tc1 || tc2)
            break;

        Mul10(r);
        MulAddU32(delta, lower_boundary_is_closer ? 5 : 10);
    }

    digits = d;
    exponent = k;
}

// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "ieee.h"

#include <cstdint>
#include <cstring>
#ifdef _MSC_VER
#include <intrin.h>
#endif

namespace decimaliser {
namespace impl {

//==================================================================================================
// DiyInt
//
// Unsigned arbitrary-precision integer with a fixed capacity, large enough to hold
//  - the scaled values and boundaries used by Dragon4 for all finite binary64 numbers, and
//  - the exact decimal expansion f * 5^1074 of the smallest subnormal binary64 number.
//==================================================================================================

struct DiyInt
{
    static constexpr int MaxBits = 2560;
    static constexpr int Capacity = (MaxBits + (32 - 1)) / 32;

    uint32_t bigits[Capacity] = {}; // Significand stored in little-endian form.
    int      size = 0;
};

// Returns the number of leading 0-bits in x, starting at the most significant bit position.
// If x is 0, the result is undefined.
inline int CountLeadingZeros32(uint32_t x)
{
    DECIMALISER_ASSERT(x != 0);

#if defined(__GNUC__)
    return __builtin_clz(x);
#elif defined(_MSC_VER)
    unsigned long index;
    _BitScanReverse(&index, x);
    return static_cast<int>(31 - index);
#else
    int z = 0;
    while ((x >> 31) == 0) {
        x <<= 1;
        ++z;
    }
    return z;
#endif
}

inline int CountLeadingZeros64(uint64_t x)
{
    DECIMALISER_ASSERT(x != 0);

    const uint32_t hi = static_cast<uint32_t>(x >> 32);
    if (hi != 0)
        return CountLeadingZeros32(hi);

    return 32 + CountLeadingZeros32(static_cast<uint32_t>(x));
}

inline bool IsZero(DiyInt const& x)
{
    return x.size == 0;
}

// Returns the number of significant bits in x, or 0 if x is 0.
inline int BitLength(DiyInt const& x)
{
    if (x.size == 0)
        return 0;

    return 32 * x.size - CountLeadingZeros32(x.bigits[x.size - 1]);
}

inline void AssignU32(DiyInt& x, uint32_t value)
{
    x.bigits[0] = value;
    x.size = (value != 0) ? 1 : 0;
}

inline void AssignU64(DiyInt& x, uint64_t value)
{
    x.bigits[0] = static_cast<uint32_t>(value);
    x.bigits[1] = static_cast<uint32_t>(value >> 32);
    x.size = (x.bigits[1] != 0) ? 2 : ((x.bigits[0] != 0) ? 1 : 0);
}

// PRE: BitLength(x) <= 64
inline uint64_t ToU64(DiyInt const& x)
{
    DECIMALISER_ASSERT(x.size <= 2);

    switch (x.size)
    {
    case 0:
        return 0;
    case 1:
        return x.bigits[0];
    default:
        return uint64_t{x.bigits[1]} << 32 | x.bigits[0];
    }
}

// x := A * x + B
inline void MulAddU32(DiyInt& x, uint32_t A, uint32_t B = 0)
{
    DECIMALISER_ASSERT(x.size >= 0);

    if (A == 1 && B == 0)
        return;

    if (A == 0 || x.size <= 0)
    {
        AssignU32(x, B);
        return;
    }

    uint32_t carry = B;
    for (int i = 0; i < x.size; ++i)
    {
        const uint64_t p = uint64_t{x.bigits[i]} * A + carry;
        x.bigits[i]      = static_cast<uint32_t>(p);
        carry            = static_cast<uint32_t>(p >> 32);
    }

    if (carry != 0)
    {
        DECIMALISER_ASSERT(x.size < DiyInt::Capacity);
        x.bigits[x.size++] = carry;
    }
}

// x := x * 2^e2
inline void MulPow2(DiyInt& x, int e2)
{
    DECIMALISER_ASSERT(x.size >= 0);
    DECIMALISER_ASSERT(e2 >= 0);

    if (x.size <= 0 || e2 == 0)
        return;

    const int bigit_shift = e2 / 32;
    const int bit_shift   = e2 % 32;

    if (bit_shift > 0)
    {
        uint32_t carry = 0;
        for (int i = 0; i < x.size; ++i)
        {
            const uint32_t h = x.bigits[i] >> (32 - bit_shift);
            x.bigits[i]      = x.bigits[i] << bit_shift | carry;
            carry            = h;
        }

        if (carry != 0)
        {
            DECIMALISER_ASSERT(x.size < DiyInt::Capacity);
            x.bigits[x.size++] = carry;
        }
    }

    if (bigit_shift > 0)
    {
        DECIMALISER_ASSERT(x.size <= DiyInt::Capacity - bigit_shift);

        std::memmove(x.bigits + bigit_shift, x.bigits, sizeof(uint32_t) * static_cast<size_t>(x.size));
        std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<size_t>(bigit_shift));
        x.size += bigit_shift;
    }
}

// x := x * 5^e5
inline void MulPow5(DiyInt& x, int e5)
{
    static constexpr uint32_t kPow5_32[] = {
        1, // (unused)
        5,
        25,
        125,
        625,
        3125,
        15625,
        78125,
        390625,
        1953125,
        9765625,
        48828125,
        244140625,
        1220703125, // 5^13
    };

    DECIMALISER_ASSERT(e5 >= 0);

    if (x.size <= 0)
        return;

    while (e5 > 0)
    {
        const int n = e5 < 13 ? e5 : 13;
        MulAddU32(x, kPow5_32[n]);
        e5 -= n;
    }
}

inline void Mul2(DiyInt& x)
{
    MulPow2(x, 1);
}

inline void Mul10(DiyInt& x)
{
    MulAddU32(x, 10);
}

// x := 2^e2
inline void AssignPow2(DiyInt& x, int e2)
{
    DECIMALISER_ASSERT(e2 >= 0);
    DECIMALISER_ASSERT(e2 < DiyInt::MaxBits);

    const int bigit_shift = e2 / 32;
    const int bit_shift   = e2 % 32;

    std::memset(x.bigits, 0, sizeof(uint32_t) * static_cast<size_t>(bigit_shift));

    x.bigits[bigit_shift] = 1u << bit_shift;
    x.size = bigit_shift + 1;
}

// x := 10^e10
inline void AssignPow10(DiyInt& x, int e10)
{
    AssignU32(x, 1);
    MulPow5(x, e10);
    MulPow2(x, e10);
}

// x := value * 2^e2
inline void AssignU64MulPow2(DiyInt& x, uint64_t value, int e2)
{
    AssignU64(x, value);
    MulPow2(x, e2);
}

// x := value * 10^e10
inline void AssignU64MulPow10(DiyInt& x, uint64_t value, int e10)
{
    AssignU64MulPow2(x, value, e10);
    MulPow5(x, e10);
}

// x := 2^e2 * 5^e5
inline void AssignPow2MulPow5(DiyInt& x, int e2, int e5)
{
    AssignPow2(x, e2);
    MulPow5(x, e5);
}

// q, r = divmod(x, d)
// x := q
// return r
inline uint32_t DivModU32(DiyInt& x, uint32_t d)
{
    DECIMALISER_ASSERT(d != 0);

    uint32_t r = 0;
    for (int i = x.size - 1; i >= 0; --i)
    {
        const uint64_t t = (uint64_t{r} << 32) | x.bigits[i];
        x.bigits[i] = static_cast<uint32_t>(t / d);
        r           = static_cast<uint32_t>(t % d);
    }

    while (x.size > 0 && x.bigits[x.size - 1] == 0)
        --x.size;

    return r;
}

// q, r = divmod(u, v)
// u := r
// return q
//
// Knuth, TAOCP Vol. 2, 4.3.1, Algorithm D, specialized for a single quotient digit.
// PRE: 0 <= q <= 9
inline uint32_t DivMod(DiyInt& u, DiyInt const& v)
{
    DECIMALISER_ASSERT(u.size > 0);
    DECIMALISER_ASSERT(v.size > 0);
    DECIMALISER_ASSERT(u.bigits[u.size - 1] != 0);
    DECIMALISER_ASSERT(v.bigits[v.size - 1] != 0);

    const int m = u.size;
    const int n = v.size;
    if (m < n)
        return 0;

    // Single-digit divisor. The general case below needs at least two.
    if (n == 1)
    {
        const uint32_t den = v.bigits[0];

        uint32_t q = 0;
        uint32_t r = 0;
        for (int i = m - 1; i >= 0; --i)
        {
            const uint64_t t = (uint64_t{r} << 32) | u.bigits[i];
            q = static_cast<uint32_t>(t / den);
            r = static_cast<uint32_t>(t % den);
        }
        AssignU32(u, r);
        return q;
    }

    DECIMALISER_ASSERT(DiyInt::Capacity >= m + 1);
    u.bigits[m] = 0;

    // Estimate q from the normalized leading digits.
    // Only the leading bits of u and v are shifted, the numbers themselves are left unchanged.
    uint32_t v1 = v.bigits[n - 1];
    uint32_t v2 = v.bigits[n - 2];

    const int shift = CountLeadingZeros32(v1);
    if (shift > 0)
    {
        const uint32_t v3 = (n >= 3) ? v.bigits[n - 3] : 0;
        v1 = (v1 << shift) | (v2 >> (32 - shift));
        v2 = (v2 << shift) | (v3 >> (32 - shift));
    }

    uint32_t u0 = u.bigits[n];
    uint32_t u1 = u.bigits[n - 1];
    uint32_t u2 = u.bigits[n - 2];

    if (shift > 0)
    {
        DECIMALISER_ASSERT((u0 >> (32 - shift)) == 0);

        const uint32_t u3 = (n >= 3) ? u.bigits[n - 3] : 0;
        u0 = (u0 << shift) | (u1 >> (32 - shift));
        u1 = (u1 << shift) | (u2 >> (32 - shift));
        u2 = (u2 << shift) | (u3 >> (32 - shift));
    }

    // q' = floor((u0 * b + u1) / v1), at most 10 iterations since q <= 9.
    uint64_t rp = uint64_t{u0} << 32 | u1;
    uint32_t qp = 0;
    while (rp >= v1)
    {
        rp -= v1;
        qp++;
    }
    DECIMALISER_ASSERT(qp <= 10);

    if (uint64_t{qp} * v2 > (rp << 32 | u2))
    {
        DECIMALISER_ASSERT(qp > 0);
        qp--;
    }
    DECIMALISER_ASSERT(qp <= 9);

    if (qp == 0)
        return 0;

    // u := u - q' * v
    uint32_t borrow = 0;
    for (int i = 0; i < n; ++i)
    {
        const uint32_t ui = u.bigits[i];
        const uint32_t vi = v.bigits[i];
        const uint64_t p  = uint64_t{qp} * vi + borrow;
        const uint32_t si = static_cast<uint32_t>(p);
        borrow            = static_cast<uint32_t>(p >> 32);
        const uint32_t di = ui - si;
        borrow           += di > ui;
        u.bigits[i]       = di;
    }
    const uint32_t un = u.bigits[n];
    const uint32_t dn = un - borrow;

    // The estimate was one too large (rare): add v back.
    if (dn > un)
    {
        qp--;

        uint32_t carry = 0;
        for (int i = 0; i < n; ++i)
        {
            const uint64_t s = uint64_t{u.bigits[i]} + v.bigits[i] + carry;
            u.bigits[i]      = static_cast<uint32_t>(s);
            carry            = static_cast<uint32_t>(s >> 32);
        }
    }

    // The remainder is < v and fits into n digits.
    int k = n;
    while (k > 0 && u.bigits[k - 1] == 0)
        --k;
    u.size = k;

    return qp;
}

inline int Compare(DiyInt const& lhs, DiyInt const& rhs)
{
    const int n1 = lhs.size;
    const int n2 = rhs.size;

    if (n1 < n2) return -1;
    if (n1 > n2) return +1;

    for (int i = n1 - 1; i >= 0; --i)
    {
        const uint32_t b1 = lhs.bigits[i];
        const uint32_t b2 = rhs.bigits[i];

        if (b1 < b2) return -1;
        if (b1 > b2) return +1;
    }

    return 0;
}

// Returns sign(a + b - c).
// PRE: c.size >= a.size
inline int CompareAdd(DiyInt const& a, DiyInt const& b, DiyInt const& c)
{
    DECIMALISER_ASSERT(c.size >= a.size);

    const int na = a.size;
    const int nb = b.size;
    const int nc = c.size;

    const int m = na < nb ? nb : na;
    if (m + 1 < nc)
        return -1; // a + b < c
    if (m > nc)
        return +1; // max(a, b) > c

    // Left-to-right subtraction c - (a + b), stopping as soon as the sign is known.
    // The borrow (0 or 1) carries one unit of the previous digit to the right.
    uint64_t borrow = 0;
    for (int i = nc - 1; i >= 0; --i)
    {
        DECIMALISER_ASSERT(borrow == 0 || borrow == 1);
        const uint64_t ci = borrow << 32 | c.bigits[i];
        const uint32_t ai = i < na ? a.bigits[i] : 0;
        const uint32_t bi = i < nb ? b.bigits[i] : 0;
        const uint64_t si = static_cast<uint64_t>(ai) + bi;
        const uint64_t di = ci - si;
        if (di > ci)
            return +1;
        if (di > 1)
            return -1;

        borrow = di;
    }

    return -static_cast<int>(borrow);
}

} // namespace impl
} // namespace decimaliser

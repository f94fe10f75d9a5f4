// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "big_decimal.h"

#include "decimal_math.h"
#include "dragon4.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

using namespace decimaliser;

template <typename Float>
static void CheckFinite(Float value)
{
    if (!IEEE<Float>(value).IsFinite())
        throw std::invalid_argument("BigDecimal: NaN or infinite value");
}

// Returns x / 10^k, rounded to nearest-even or truncated.
// PRE: the result fits into a uint64_t.
static uint64_t DivPow10(impl::DiyInt x, int k, bool round)
{
    if (k <= 0)
    {
        impl::MulPow5(x, -k);
        impl::MulPow2(x, -k);
        return impl::ToU64(x);
    }

    bool sticky = false;
    while (k > 1)
    {
        const int n = std::min(k - 1, 9);
        sticky |= impl::DivModU32(x, static_cast<uint32_t>(impl::kPow10_u64[n])) != 0;
        k -= n;
    }

    const uint32_t r = impl::DivModU32(x, 10);
    uint64_t q = impl::ToU64(x);
    if (round && (r > 5 || (r == 5 && (sticky || q % 2 != 0))))
        ++q;

    return q;
}

template <typename Float>
BigDecimal BigDecimal::FromShortest(Float value)
{
    using Fp = IEEE<Float>;

    const Fp v(value);
    DECIMALISER_ASSERT(v.IsFinite());

    BigDecimal result;
    if (v.IsZero())
    {
        result.scale_ = 1;
        return result;
    }

    uint64_t digits;
    int exponent;
    dragon4::ToDigits(digits, exponent, v.AbsValue());

    if (digits < 10)
    {
        // A single digit is widened to the two-digit decimal closest to the value.
        // This differs from digits * 10 only for subnormals with very few significant bits.
        const BigDecimal exact = FromBinary(static_cast<double>(v.AbsValue()));

        int p = exponent - 1;
        if (DivPow10(exact.unscaled_, exact.scale_ + p, false) < 10)
            --p;

        digits = DivPow10(exact.unscaled_, exact.scale_ + p, true);
        exponent = p;
        if (digits == 100)
        {
            digits = 10;
            exponent++;
        }
    }

    result.negative_ = v.SignBit();

    const double abs_value = static_cast<double>(v.AbsValue());
    if (1e-3 <= abs_value && abs_value < 1e7)
    {
        // Plain notation: "0.001", "3.14", "100.0".
        for ( ; digits % 10 == 0; digits /= 10)
            exponent++;

        if (exponent >= 0)
        {
            impl::AssignU64MulPow10(result.unscaled_, digits, exponent + 1);
            result.scale_ = 1;
            return result;
        }
    }

    // Otherwise one integer digit and at least one fractional digit: "1.0E30", "4.9E-324".
    impl::AssignU64(result.unscaled_, digits);
    result.scale_ = -exponent;
    return result;
}

BigDecimal BigDecimal::ValueOf(double value)
{
    CheckFinite(value);
    return FromShortest(value);
}

BigDecimal BigDecimal::ValueOf(float value)
{
    CheckFinite(value);
    return FromShortest(value);
}

BigDecimal BigDecimal::FromBinary(double value)
{
    using Fp = IEEE<double>;

    CheckFinite(value);

    const Fp v(value);

    BigDecimal result;
    if (v.IsZero())
        return result;

    const auto F = v.PhysicalSignificand();
    const auto E = v.PhysicalExponent();

    uint64_t f;
    int e;
    if (E == 0)
    {
        f = F;
        e = Fp::MinExponent;
    }
    else
    {
        f = F + Fp::HiddenBit;
        e = static_cast<int>(E) - Fp::ExponentBias;
    }

    // Make f odd, so that the expansion below has no trailing zeros.
    while (f % 2 == 0)
    {
        f /= 2;
        e++;
    }

    result.negative_ = v.SignBit();
    if (e >= 0)
    {
        // f * 2^e
        impl::AssignU64MulPow2(result.unscaled_, f, e);
    }
    else
    {
        // f * 2^e = f * 5^-e / 10^-e
        impl::AssignU64(result.unscaled_, f);
        impl::MulPow5(result.unscaled_, -e);
        result.scale_ = -e;
    }

    return result;
}

int BigDecimal::Signum() const
{
    if (impl::IsZero(unscaled_))
        return 0;

    return negative_ ? -1 : +1;
}

int64_t BigDecimal::LongValueExact() const
{
    const int bits = impl::BitLength(unscaled_);
    if (bits <= 63)
    {
        const int64_t magnitude = static_cast<int64_t>(impl::ToU64(unscaled_));
        return negative_ ? -magnitude : magnitude;
    }

    // -2^63 is the only 64-bit value in range.
    if (negative_ && bits == 64 && impl::ToU64(unscaled_) == uint64_t{1} << 63)
        return std::numeric_limits<int64_t>::min();

    throw std::overflow_error("BigDecimal: unscaled value out of int64_t range");
}

std::string BigDecimal::ToString() const
{
    // Convert the unscaled value, 9 decimal digits at a time.
    std::string digits;

    impl::DiyInt q = unscaled_;
    while (!impl::IsZero(q))
    {
        uint32_t r = impl::DivModU32(q, 1000000000);
        for (int i = 0; i < 9; ++i)
        {
            digits.push_back(static_cast<char>('0' + r % 10));
            r /= 10;
        }
    }

    while (digits.size() > 1 && digits.back() == '0')
        digits.pop_back();
    if (digits.empty())
        digits.push_back('0');

    std::reverse(digits.begin(), digits.end());

    std::string result;
    if (Signum() < 0)
        result.push_back('-');

    if (scale_ <= 0)
    {
        result += digits;
        if (digits != "0")
            result.append(static_cast<size_t>(-scale_), '0');
        return result;
    }

    const size_t scale = static_cast<size_t>(scale_);
    if (digits.size() <= scale)
    {
        result += "0.";
        result.append(scale - digits.size(), '0');
        result += digits;
    }
    else
    {
        result.append(digits, 0, digits.size() - scale);
        result.push_back('.');
        result.append(digits, digits.size() - scale, std::string::npos);
    }

    return result;
}

// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "lite.h"

#include "decimal_math.h"
#include "ieee.h"

using namespace decimaliser;

// Beyond 15 significant digits the double check below is no longer conclusive.
static constexpr int64_t kMaxConclusiveMantissa = 1000000000000000; // 1e15

bool lite::ToDecimal(double value, DecimalAppender& appender)
{
    using Fp = IEEE<double>;

    const Fp v(value);
    if (!v.IsFinite())
        return false;

    const bool negative = v.SignBit();
    if (v.IsZero())
    {
        appender.Append(negative, 0, ZeroExponent);
        return true;
    }

    const double abs_value = v.AbsValue();

    for (int exponent = 0; exponent <= LargestExponentInLong; ++exponent)
    {
        const double factor = impl::kPow10_f64[exponent];

        int64_t mantissa;
        if (!impl::RoundToInt64(abs_value * factor, mantissa))
            return false;

        if (static_cast<double>(mantissa) / factor == abs_value)
        {
            appender.Append(negative, static_cast<uint64_t>(mantissa), exponent);
            return true;
        }

        if (mantissa >= kMaxConclusiveMantissa)
            return false;
    }

    return false;
}

bool lite::ToDecimal(float value, DecimalAppender& appender)
{
    using Fp = IEEE<float>;

    const Fp v(value);
    if (!v.IsFinite())
        return false;

    const bool negative = v.SignBit();
    if (v.IsZero())
    {
        appender.Append(negative, 0, ZeroExponent);
        return true;
    }

    const float abs_value = v.AbsValue();

    for (int exponent = 0; exponent <= LargestExponentInLong; ++exponent)
    {
        // Scale in double precision, check in single precision.
        int64_t mantissa;
        if (!impl::RoundToInt64(static_cast<double>(abs_value) * impl::kPow10_f64[exponent], mantissa))
            return false;

        const float factor = static_cast<float>(impl::kPow10_u64[exponent]);
        if (static_cast<float>(mantissa) / factor == abs_value)
        {
            appender.Append(negative, static_cast<uint64_t>(mantissa), exponent);
            return true;
        }
    }

    return false;
}

// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "maximum_precision.h"

#include "decimal_math.h"
#include "ieee.h"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <stdexcept>

using namespace decimaliser;

// Once the mantissa reaches this, one more digit might not fit.
static constexpr int64_t kMaxScalableMantissa = std::numeric_limits<int64_t>::max() / 10;

static inline void AppendTrimmed(DecimalAppender& appender, bool negative, int64_t mantissa, int exponent)
{
    DECIMALISER_ASSERT(mantissa >= 0);

    while (exponent > 0 && mantissa % 10 == 0)
    {
        mantissa /= 10;
        --exponent;
    }

    appender.Append(negative, static_cast<uint64_t>(mantissa), exponent);
}

MaximumPrecision::MaximumPrecision(int precision)
    : precision_(precision)
{
    if (precision < MinPrecision || precision > MaxPrecision)
    {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Precision must be between %d and %d, inclusive (got %d)", MinPrecision, MaxPrecision, precision);
        throw std::invalid_argument(buf);
    }
}

bool MaximumPrecision::ToDecimal(double value, DecimalAppender& appender) const
{
    using Fp = IEEE<double>;

    const Fp v(value);
    const bool negative = v.SignBit();
    const double abs_value = v.AbsValue();

    // Also rejects NaN and infinities.
    if (!(abs_value <= 1e18))
        return false;

    if (v.IsZero())
    {
        appender.Append(negative, 0, std::min(ZeroExponent, precision_));
        return true;
    }

    int64_t last_mantissa = 0;
    for (int exponent = 0; exponent <= precision_; ++exponent)
    {
        const double factor = impl::kPow10_f64[exponent];

        int64_t mantissa;
        if (!impl::RoundToInt64(abs_value * factor, mantissa))
        {
            // The product may round up to 2^63 just below the limit.
            DECIMALISER_ASSERT(exponent > 0);
            AppendTrimmed(appender, negative, last_mantissa, exponent - 1);
            return true;
        }

        if (static_cast<double>(mantissa) / factor == abs_value)
        {
            appender.Append(negative, static_cast<uint64_t>(mantissa), exponent);
            return true;
        }

        if (mantissa >= kMaxScalableMantissa || exponent == precision_)
        {
            AppendTrimmed(appender, negative, mantissa, exponent);
            return true;
        }

        last_mantissa = mantissa;
    }

    DECIMALISER_ASSERT(false && "unreachable");
    return false;
}

bool MaximumPrecision::ToDecimal(float value, DecimalAppender& appender) const
{
    using Fp = IEEE<float>;

    const Fp v(value);
    const bool negative = v.SignBit();
    const float abs_value = v.AbsValue();

    // 1e18f is 999999984306749440, which is still accepted.
    if (!(static_cast<double>(abs_value) < 1e18))
        return false;

    if (v.IsZero())
    {
        appender.Append(negative, 0, std::min(ZeroExponent, precision_));
        return true;
    }

    int64_t last_mantissa = 0;
    for (int exponent = 0; exponent <= precision_; ++exponent)
    {
        const double factor = impl::kPow10_f64[exponent];

        int64_t mantissa;
        if (!impl::RoundToInt64(static_cast<double>(abs_value) * factor, mantissa))
        {
            DECIMALISER_ASSERT(exponent > 0);
            AppendTrimmed(appender, negative, last_mantissa, exponent - 1);
            return true;
        }

        if (static_cast<float>(static_cast<double>(mantissa) / factor) == abs_value)
        {
            appender.Append(negative, static_cast<uint64_t>(mantissa), exponent);
            return true;
        }

        if (mantissa >= kMaxScalableMantissa || exponent == precision_)
        {
            AppendTrimmed(appender, negative, mantissa, exponent);
            return true;
        }

        last_mantissa = mantissa;
    }

    DECIMALISER_ASSERT(false && "unreachable");
    return false;
}

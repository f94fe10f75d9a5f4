// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "exact.h"

#include "big_decimal.h"
#include "ieee.h"

#include <stdexcept>

using namespace decimaliser;

template <typename Float>
static bool ToDecimalImpl(Float value, DecimalAppender& appender)
{
    using Fp = IEEE<Float>;

    const Fp v(value);
    if (!v.IsFinite() || v.IsNegativeZero())
        return false;

    const BigDecimal bd = BigDecimal::ValueOf(value);

    int64_t unscaled;
    try
    {
        unscaled = bd.LongValueExact();
    }
    catch (const std::overflow_error&)
    {
        return false;
    }

    // The magnitude of INT64_MIN has no int64_t representation.
    if (bd.UnscaledBitLength() > 63)
        return false;

    const bool negative = bd.Signum() < 0;
    const uint64_t mantissa = static_cast<uint64_t>(negative ? -unscaled : unscaled);

    appender.Append(negative, mantissa, bd.Scale());
    return true;
}

bool exact::ToDecimal(double value, DecimalAppender& appender)
{
    return ToDecimalImpl(value, appender);
}

bool exact::ToDecimal(float value, DecimalAppender& appender)
{
    return ToDecimalImpl(value, appender);
}

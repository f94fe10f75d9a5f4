// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decimal_appender.h"

namespace decimaliser {

// Decomposes values with at most 'precision' digits after the decimal point.
//
// Like the lite path, but the scan stops at 'precision' (or when the mantissa is about to
// overflow), and then the current candidate is rounded: trailing zeros are removed from the
// mantissa while the exponent is > 0, and the result is reported even though it is not exact.
//
// Succeeds for every finite value with |value| <= 1e18 (|value| < 1e18 for float), and the
// reported exponent is always <= precision.
//
// Immutable; a single instance may be shared between threads.
class MaximumPrecision
{
public:
    static constexpr int MinPrecision = 0;
    static constexpr int MaxPrecision = 18;

    // Throws std::invalid_argument unless MinPrecision <= precision <= MaxPrecision.
    explicit MaximumPrecision(int precision);

    int Precision() const { return precision_; }

    bool ToDecimal(double value, DecimalAppender& appender) const;
    bool ToDecimal(float value, DecimalAppender& appender) const;

private:
    int precision_;
};

} // namespace decimaliser

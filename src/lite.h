// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decimal_appender.h"

namespace decimaliser {
namespace lite {

// bool found = ToDecimal(value, appender);
//
// Tries to find mantissa and exponent (0 <= exponent <= 18) such that
//
//      round(|value| * 10^exponent) / 10^exponent == |value|
//
// using only 64-bit integer and binary floating-point arithmetic, scanning the exponents from 0
// upwards. The check is done in the precision of the input type.
//
// On success, appender.Append is called exactly once and true is returned.
// Returns false (without touching the appender) if no such decomposition exists, or if value is
// NaN or infinite. Failure is the expected outcome for values with many significant digits.
bool ToDecimal(double value, DecimalAppender& appender);

bool ToDecimal(float value, DecimalAppender& appender);

} // namespace lite
} // namespace decimaliser

// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decimal_appender.h"

namespace decimaliser {
namespace exact {

// bool found = ToDecimal(value, appender);
//
// Decomposes 'value' into the decimal of its canonical text form, computed with exact big-integer
// arithmetic (see BigDecimal::ValueOf). The exponent is the scale of the decimal and may be
// negative for large integers, e.g.
//
//      -9223372036854775808.0  ==>  (true, 9223372036854776, -3)
//      1e30                    ==>  (false, 10, -29)
//      100.0                   ==>  (false, 1000, 1)
//
// Returns false for NaN, infinities and -0.0 (whose sign is not represented by a BigDecimal),
// and if the unscaled value does not fit into 63 bits.
bool ToDecimal(double value, DecimalAppender& appender);

bool ToDecimal(float value, DecimalAppender& appender);

} // namespace exact
} // namespace decimaliser

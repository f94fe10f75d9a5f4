// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decimal_appender.h"

#include <cstdio>

using namespace decimaliser;

void DecimalAppender::AppendHighPrecision(double value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "d: %.17g", value);
    throw UnsupportedConversion(buf);
}

void DecimalAppender::AppendHighPrecision(float value)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "f: %.9g", static_cast<double>(value));
    throw UnsupportedConversion(buf);
}

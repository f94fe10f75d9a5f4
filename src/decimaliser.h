// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decimal_appender.h"

#include <cstdint>

namespace decimaliser {

//==================================================================================================
// Decimaliser
//
// A conversion policy: an ordered list of (at most two) engines, tried one after the other until
// one of them succeeds.
//
//  Simple()      lite
//  General()     lite, then exact; only for 0 and 1e-29 <= |v| < 1e45 (float: 1e-29 <= |v|)
//  Standard()    maximum precision 18, then exact
//  Bounded(p)    maximum precision p, then exact
//
// Policies are immutable values and may be shared between threads.
//==================================================================================================

enum class Method {
    Lite,
    MaximumPrecision,
    Exact,
};

struct Step
{
    Method method;
    int precision; // Method::MaximumPrecision only.
};

class Decimaliser
{
public:
    static Decimaliser Simple();
    static Decimaliser General();
    static Decimaliser Standard();

    // Throws std::invalid_argument unless 0 <= precision <= 18.
    static Decimaliser Bounded(int precision);

    // Tries the engines of this policy in order.
    // On success, appender.Append is called exactly once, with the result of the first engine
    // which succeeded. On failure, the appender is not touched.
    bool ToDecimal(double value, DecimalAppender& appender) const;
    bool ToDecimal(float value, DecimalAppender& appender) const;

    // Like ToDecimal, but calls appender.AppendHighPrecision(value) if no engine succeeds.
    void Append(double value, DecimalAppender& appender) const;
    void Append(float value, DecimalAppender& appender) const;

    int NumSteps() const { return num_steps_; }
    Step const& StepAt(int index) const;

private:
    Decimaliser(Step first, Step second);

    template <typename Float>
    bool ToDecimalImpl(Float value, DecimalAppender& appender) const;

    Step steps_[2];
    int num_steps_ = 0;
    // Only attempt values within the band of General().
    bool range_checked_ = false;
    // Results of the exact engine must have exponent <= 18 and round-trip through ToDouble/ToFloat.
    bool exact_checked_ = false;
};

// Returns (-1)^negative * mantissa * 10^-exponent, computed in double precision with at most one
// rounding when mantissa <= 2^53 and |exponent| <= 22.
double ToDouble(bool negative, uint64_t mantissa, int exponent);

// As above, rounded to single precision.
float ToFloat(bool negative, uint64_t mantissa, int exponent);

} // namespace decimaliser

// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decimaliser.h"

#include "decimal_math.h"
#include "exact.h"
#include "ieee.h"
#include "lite.h"
#include "maximum_precision.h"


using namespace decimaliser;

namespace {

// Holds back the result of an engine until the policy has accepted it.
struct Capture final : DecimalAppender
{
    bool negative = false;
    uint64_t mantissa = 0;
    int exponent = 0;

    void Append(bool negative_, uint64_t mantissa_, int exponent_) override
    {
        negative = negative_;
        mantissa = mantissa_;
        exponent = exponent_;
    }
};

constexpr Step kNoStep = {Method::Lite, 0};

template <typename Float>
bool RunStep(Step const& step, Float value, DecimalAppender& appender)
{
    switch (step.method)
    {
    case Method::Lite:
        return lite::ToDecimal(value, appender);
    case Method::MaximumPrecision:
        return MaximumPrecision(step.precision).ToDecimal(value, appender);
    case Method::Exact:
        return exact::ToDecimal(value, appender);
    }

    DECIMALISER_ASSERT(false && "invalid method");
    return false;
}

// The band of General().
inline bool InGeneralRange(double value)
{
    const double abs_value = IEEE<double>(value).AbsValue();
    return value == 0 || (1e-29 <= abs_value && abs_value < 1e45);
}

inline bool InGeneralRange(float value)
{
    const float abs_value = IEEE<float>(value).AbsValue();
    return value == 0 || 1e-29f <= abs_value;
}

inline float Reconstruct(float, Capture const& c)
{
    return ToFloat(c.negative, c.mantissa, c.exponent);
}

inline double Reconstruct(double, Capture const& c)
{
    return ToDouble(c.negative, c.mantissa, c.exponent);
}

} // namespace

Decimaliser::Decimaliser(Step first, Step second)
    : steps_{first, second}
    , num_steps_(2)
{
}

Decimaliser Decimaliser::Simple()
{
    Decimaliser d({Method::Lite, 0}, kNoStep);
    d.num_steps_ = 1;
    return d;
}

Decimaliser Decimaliser::General()
{
    Decimaliser d({Method::Lite, 0}, {Method::Exact, 0});
    d.range_checked_ = true;
    d.exact_checked_ = true;
    return d;
}

Decimaliser Decimaliser::Standard()
{
    return Bounded(MaximumPrecision::MaxPrecision);
}

Decimaliser Decimaliser::Bounded(int precision)
{
    // Validate now, not on first use.
    const MaximumPrecision bounded(precision);

    return Decimaliser({Method::MaximumPrecision, bounded.Precision()}, {Method::Exact, 0});
}

Step const& Decimaliser::StepAt(int index) const
{
    DECIMALISER_ASSERT(index >= 0);
    DECIMALISER_ASSERT(index < num_steps_);
    return steps_[index];
}

template <typename Float>
bool Decimaliser::ToDecimalImpl(Float value, DecimalAppender& appender) const
{
    if (range_checked_ && !InGeneralRange(value))
        return false;

    for (int i = 0; i < num_steps_; ++i)
    {
        const Step& step = steps_[i];

        Capture result;
        if (!RunStep(step, value, result))
            continue;

        // A non-zero value rounded to zero is not a decomposition of it.
        if (step.method == Method::MaximumPrecision && result.mantissa == 0 && value != 0)
            return false;

        if (step.method == Method::Exact && exact_checked_)
        {
            // The result must be usable as (mantissa / 10^exponent), with 10^exponent a long.
            if (result.exponent > LargestExponentInLong)
                return false;
            if (Reconstruct(value, result) != value)
                return false;
        }

        appender.Append(result.negative, result.mantissa, result.exponent);
        return true;
    }

    return false;
}

bool Decimaliser::ToDecimal(double value, DecimalAppender& appender) const
{
    return ToDecimalImpl(value, appender);
}

bool Decimaliser::ToDecimal(float value, DecimalAppender& appender) const
{
    return ToDecimalImpl(value, appender);
}

void Decimaliser::Append(double value, DecimalAppender& appender) const
{
    if (!ToDecimalImpl(value, appender))
        appender.AppendHighPrecision(value);
}

void Decimaliser::Append(float value, DecimalAppender& appender) const
{
    if (!ToDecimalImpl(value, appender))
        appender.AppendHighPrecision(value);
}

double decimaliser::ToDouble(bool negative, uint64_t mantissa, int exponent)
{
    // Trailing zeros only make the scaling below inexact.
    for ( ; mantissa != 0 && mantissa % 10 == 0; mantissa /= 10)
        --exponent;

    double v = static_cast<double>(mantissa);

    for ( ; exponent > impl::kMaxExactPow10; exponent -= impl::kMaxExactPow10)
        v /= impl::kPow10_f64[impl::kMaxExactPow10];
    for ( ; exponent < -impl::kMaxExactPow10; exponent += impl::kMaxExactPow10)
        v *= impl::kPow10_f64[impl::kMaxExactPow10];

    if (exponent > 0)
        v /= impl::kPow10_f64[exponent];
    else if (exponent < 0)
        v *= impl::kPow10_f64[-exponent];

    return negative ? -v : v;
}

float decimaliser::ToFloat(bool negative, uint64_t mantissa, int exponent)
{
    return static_cast<float>(ToDouble(negative, mantissa, exponent));
}

// Copyright 2019 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#include "decimal_text.h"

#include "decimal_math.h"
#include "dragon4.h"
#include "ieee.h"

#include <cmath>
#include <cstring>

using namespace decimaliser;

//==================================================================================================
// Digits
//==================================================================================================

static inline char* Utoa_2Digits(char* buf, uint32_t digits)
{
    static constexpr char Digits100[200] = {
        '0','0','0','1','0','2','0','3','0','4','0','5','0','6','0','7','0','8','0','9',
        '1','0','1','1','1','2','1','3','1','4','1','5','1','6','1','7','1','8','1','9',
        '2','0','2','1','2','2','2','3','2','4','2','5','2','6','2','7','2','8','2','9',
        '3','0','3','1','3','2','3','3','3','4','3','5','3','6','3','7','3','8','3','9',
        '4','0','4','1','4','2','4','3','4','4','4','5','4','6','4','7','4','8','4','9',
        '5','0','5','1','5','2','5','3','5','4','5','5','5','6','5','7','5','8','5','9',
        '6','0','6','1','6','2','6','3','6','4','6','5','6','6','6','7','6','8','6','9',
        '7','0','7','1','7','2','7','3','7','4','7','5','7','6','7','7','7','8','7','9',
        '8','0','8','1','8','2','8','3','8','4','8','5','8','6','8','7','8','8','8','9',
        '9','0','9','1','9','2','9','3','9','4','9','5','9','6','9','7','9','8','9','9',
    };

    DECIMALISER_ASSERT(digits <= 99);
    std::memcpy(buf, &Digits100[2*digits], 2*sizeof(char));
    return buf + 2;
}

static inline int DecimalLength(uint64_t v)
{
    DECIMALISER_ASSERT(v >= 1);

    int length = 1;
    for ( ; v >= 10; v /= 10)
        ++length;
    return length;
}

// Writes the 'length' decimal digits of 'value' into buf, two at a time from the right.
static inline void PrintDecimalDigits(char* buf, uint64_t value, int length)
{
    while (value >= 100)
    {
        DECIMALISER_ASSERT(length > 2);
        const uint64_t q = value / 100;
        length -= 2;
        Utoa_2Digits(buf + length, static_cast<uint32_t>(value - 100 * q));
        value = q;
    }

    if (value >= 10)
    {
        DECIMALISER_ASSERT(length == 2);
        Utoa_2Digits(buf, static_cast<uint32_t>(value));
    }
    else
    {
        DECIMALISER_ASSERT(length == 1);
        buf[0] = static_cast<char>('0' + value);
    }
}

//==================================================================================================
// Formatting
//==================================================================================================

// digits * 10^(decimal_point - num_digits), without an exponent field.
static char* FormatFixed(char* buffer, uint64_t digits, int num_digits, int decimal_point, bool force_trailing_dot_zero)
{
    DECIMALISER_ASSERT(num_digits >= 1);

    if (decimal_point <= 0)
    {
        // 0.[000]digits
        buffer[0] = '0';
        buffer[1] = '.';
        std::memset(buffer + 2, '0', static_cast<size_t>(-decimal_point));
        buffer += 2 + (-decimal_point);
        PrintDecimalDigits(buffer, digits, num_digits);
        return buffer + num_digits;
    }

    if (decimal_point < num_digits)
    {
        // dig.its
        PrintDecimalDigits(buffer + 1, digits, num_digits);
        std::memmove(buffer, buffer + 1, static_cast<size_t>(decimal_point));
        buffer[decimal_point] = '.';
        return buffer + (num_digits + 1);
    }

    // digits[000]
    PrintDecimalDigits(buffer, digits, num_digits);
    std::memset(buffer + num_digits, '0', static_cast<size_t>(decimal_point - num_digits));
    buffer += decimal_point;
    if (force_trailing_dot_zero)
    {
        *buffer++ = '.';
        *buffer++ = '0';
    }
    return buffer;
}

// Appends the exponent field: "+5", "-20", "+308".
// PRE: -1000 < value < 1000
static char* ExponentToString(char* buffer, int value)
{
    DECIMALISER_ASSERT(value > -1000);
    DECIMALISER_ASSERT(value <  1000);

    if (value < 0)
    {
        *buffer++ = '-';
        value = -value;
    }
    else
    {
        *buffer++ = '+';
    }

    const uint32_t k = static_cast<uint32_t>(value);
    if (k < 10)
    {
        *buffer++ = static_cast<char>('0' + k);
    }
    else if (k < 100)
    {
        buffer = Utoa_2Digits(buffer, k);
    }
    else
    {
        const uint32_t r = k % 10;
        const uint32_t q = k / 10;
        buffer = Utoa_2Digits(buffer, q);
        *buffer++ = static_cast<char>('0' + r);
    }

    return buffer;
}

static char* FormatScientific(char* buffer, uint64_t digits, int num_digits, int exponent)
{
    // buffer = ?ddddd ==> d.dddd
    PrintDecimalDigits(buffer + 1, digits, num_digits);
    buffer[0] = buffer[1];

    if (num_digits == 1)
    {
        // dE+123
        buffer += 1;
    }
    else
    {
        // d.igitsE+123
        buffer[1] = '.';
        buffer += 1 + num_digits;
    }

    *buffer++ = 'e';
    return ExponentToString(buffer, exponent);
}

// Print digits * 10^decimal_exponent in a form similar to printf("%g").
static char* FormatDigits(char* buffer, uint64_t digits, int decimal_exponent)
{
    const int num_digits = DecimalLength(digits);
    const int decimal_point = num_digits + decimal_exponent;

    // NB:
    // These are the values used by JavaScript's ToString applied to Number
    // type. Printf uses the values -4 and max_digits10 resp. (sort of).
    constexpr int MinExp = -6;
    constexpr int MaxExp = 21;

    const bool use_fixed = MinExp < decimal_point && decimal_point <= MaxExp;

    return use_fixed
        ? FormatFixed(buffer, digits, num_digits, decimal_point, /*force_trailing_dot_zero*/ false)
        : FormatScientific(buffer, digits, num_digits, decimal_point - 1);
}

template <typename Float>
static char* FormatShortest(char* buffer, Float value)
{
    const IEEE<Float> v(value);

    if (v.IsNaN())
    {
        std::memcpy(buffer, "NaN", 3);
        return buffer + 3;
    }

    if (v.SignBit())
    {
        *buffer++ = '-';
    }

    if (v.IsInf())
    {
        std::memcpy(buffer, "Infinity", 8);
        return buffer + 8;
    }

    if (v.IsZero())
    {
        *buffer++ = '0';
        return buffer;
    }

    uint64_t digits;
    int exponent;
    dragon4::ToDigits(digits, exponent, v.AbsValue());

    return FormatDigits(buffer, digits, exponent);
}

//==================================================================================================
// TextAppender
//==================================================================================================

void TextAppender::Append(bool negative, uint64_t mantissa, int exponent)
{
    DECIMALISER_ASSERT(exponent >= -MaxExponent);
    DECIMALISER_ASSERT(exponent <=  MaxExponent);

    char* buffer = next_;
    if (negative)
    {
        *buffer++ = '-';
    }

    // 0 * 10^3 is "0.0", not "0000.0".
    if (mantissa == 0 && exponent < 0)
    {
        exponent = 0;
    }

    const int num_digits = (mantissa == 0) ? 1 : DecimalLength(mantissa);
    next_ = FormatFixed(buffer, mantissa, num_digits, num_digits - exponent, /*force_trailing_dot_zero*/ true);
}

void TextAppender::AppendHighPrecision(double value)
{
    next_ = FormatShortest(next_, value);
}

void TextAppender::AppendHighPrecision(float value)
{
    next_ = FormatShortest(next_, value);
}

//==================================================================================================
// ToChars
//==================================================================================================

char* decimaliser::ToChars(char* buffer, double value, Decimaliser const& policy)
{
    TextAppender appender(buffer);
    policy.Append(value, appender);
    return appender.End();
}

char* decimaliser::ToChars(char* buffer, float value, Decimaliser const& policy)
{
    TextAppender appender(buffer);
    policy.Append(value, appender);
    return appender.End();
}

char* decimaliser::AppendDecimal(char* buffer, int64_t num, int decimal_places)
{
    DECIMALISER_ASSERT(decimal_places >= 0);

    // Also correct for INT64_MIN.
    const uint64_t magnitude = (num < 0) ? 0 - static_cast<uint64_t>(num) : static_cast<uint64_t>(num);
    if (num < 0)
    {
        *buffer++ = '-';
    }

    const int num_digits = (magnitude == 0) ? 1 : DecimalLength(magnitude);
    return FormatFixed(buffer, magnitude, num_digits, num_digits - decimal_places, /*force_trailing_dot_zero*/ false);
}

char* decimaliser::ToCharsFixed(char* buffer, double value, int decimal_places)
{
    DECIMALISER_ASSERT(decimal_places >= 0);

    if (decimal_places < 20)
    {
        const double scaled = value * impl::kPow10_f64[decimal_places];

        // Also rejects NaN.
        if (scaled >= -9223372036854775808.0 && scaled < 9223372036854775808.0)
        {
            // Round half-up. scaled - floor(scaled) is exact.
            const double r = std::floor(scaled);
            int64_t num = static_cast<int64_t>(r);
            if (scaled - r >= 0.5)
                ++num;

            return AppendDecimal(buffer, num, decimal_places);
        }
    }

    return ToChars(buffer, value);
}

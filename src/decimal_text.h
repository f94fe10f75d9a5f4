// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "decimal_appender.h"
#include "decimaliser.h"

#include <cstdint>

namespace decimaliser {

// Renders decompositions into a caller-owned character buffer.
// The output is _not_ null-terminated.
//
//  Append                  plain notation, at least one digit after the decimal point
//                          (true, 314, 2) ==> "-3.14",  (false, 1, -3) ==> "1000.0"
//  AppendHighPrecision     shortest round-trip digits, similar to printf("%g")
//                          "1e-20", "1.7976931348623157e+308", "NaN", "-Infinity"
//
// PRE: The buffer must hold at least MinBufferLength characters.
class TextAppender final : public DecimalAppender
{
public:
    // Largest |exponent| accepted by Append.
    // Covers every decomposition produced by the exact engine.
    static constexpr int MaxExponent = 340;

    static constexpr int MinBufferLength = 1 + 20 + MaxExponent + 2;

    explicit TextAppender(char* buffer) : next_(buffer) {}

    // Returns a pointer to the element following the characters written so far.
    char* End() const { return next_; }

    // PRE: -MaxExponent <= exponent <= MaxExponent
    void Append(bool negative, uint64_t mantissa, int exponent) override;

    void AppendHighPrecision(double value) override;
    void AppendHighPrecision(float value) override;

private:
    char* next_;
};

// Renders 'value' with the given policy, using TextAppender.
// Returns a pointer to the element following the characters written.
//
// PRE: The buffer must hold at least TextAppender::MinBufferLength characters.
char* ToChars(char* buffer, double value, Decimaliser const& policy = Decimaliser::General());
char* ToChars(char* buffer, float value, Decimaliser const& policy = Decimaliser::General());

// Writes num / 10^decimal_places in fixed notation: AppendDecimal(buf, -1234, 3) ==> "-1.234".
// With decimal_places == 0, this is the plain integer.
//
// PRE: decimal_places >= 0
// PRE: The buffer must hold at least 3 + 20 + decimal_places characters.
char* AppendDecimal(char* buffer, int64_t num, int decimal_places);

// Writes 'value' rounded (half-up) to exactly 'decimal_places' digits after the decimal point,
// trailing zeros included, if decimal_places < 20 and the scaled value fits into an int64_t.
// Otherwise writes ToChars(buffer, value).
//
// PRE: decimal_places >= 0
// PRE: The buffer must hold at least TextAppender::MinBufferLength characters.
char* ToCharsFixed(char* buffer, double value, int decimal_places);

} // namespace decimaliser

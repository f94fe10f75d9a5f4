// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace decimaliser {

// Thrown by the default high-precision escape of a DecimalAppender.
class UnsupportedConversion : public std::logic_error
{
public:
    explicit UnsupportedConversion(const std::string& what_arg) : std::logic_error(what_arg) {}
};

// Receives a decomposed decimal number:
//
//      value = (-1)^negative * mantissa * 10^-exponent
//
// Append is called at most once per conversion, and only after an engine has committed to its
// result. AppendHighPrecision is the escape for values no engine of the chosen policy could
// decompose. The default escape throws UnsupportedConversion: silently dropping precision is
// never acceptable.
class DecimalAppender
{
public:
    virtual ~DecimalAppender() = default;

    virtual void Append(bool negative, uint64_t mantissa, int exponent) = 0;

    virtual void AppendHighPrecision(double value);
    virtual void AppendHighPrecision(float value);
};

} // namespace decimaliser

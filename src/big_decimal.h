// Copyright 2020 Alexander Bolz
//
// Distributed under the Boost Software License, Version 1.0.
//  (See accompanying file LICENSE_1_0.txt or copy at https://www.boost.org/LICENSE_1_0.txt)

#pragma once

#include "diy_int.h"

#include <cstdint>
#include <string>

namespace decimaliser {

// An exact decimal number
//
//      (-1)^negative * unscaled * 10^-scale
//
// with an arbitrary-precision unscaled value. There is no negative zero: Signum() of any zero is 0.
class BigDecimal
{
public:
    // Zero, with scale 0.
    BigDecimal() = default;

    // The decimal written by the canonical text form of 'value': the shortest digits which round
    // back to 'value' in the precision of the argument, with at least two significant digits
    // (a single digit is replaced by the closest two-digit decimal).
    //  - 1e-3 <= |value| < 1e7: plain notation with at least one fractional digit,
    //    100.0 is 1000 with scale 1.
    //  - otherwise: 1e30 is "1.0E30", i.e. 10 with scale -29.
    // Zero is returned as 0 with scale 1.
    // Throws std::invalid_argument if value is NaN or infinite.
    static BigDecimal ValueOf(double value);
    static BigDecimal ValueOf(float value);

    // The exact value of the binary floating-point number, i.e. f * 2^e written out in decimal.
    // Throws std::invalid_argument if value is NaN or infinite.
    static BigDecimal FromBinary(double value);

    int Scale() const { return scale_; }

    // -1, 0 or +1
    int Signum() const;

    // Number of significant bits in |unscaled|.
    int UnscaledBitLength() const { return impl::BitLength(unscaled_); }

    // Returns the signed unscaled value.
    // Throws std::overflow_error if it does not fit into an int64_t.
    int64_t LongValueExact() const;

    // Plain notation, without an exponent field: "-0.001", "1200", "0.0".
    std::string ToString() const;

private:
    template <typename Float>
    static BigDecimal FromShortest(Float value);

    bool negative_ = false;
    impl::DiyInt unscaled_;
    int scale_ = 0;
};

} // namespace decimaliser

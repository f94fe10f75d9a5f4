#include <catch2/catch.hpp>

#include "decimal_math.h"
#include "decimaliser.h"
#include "lite.h"
#include "recording_appender.h"

#include <cstdint>
#include <limits>

using namespace decimaliser;

static constexpr double HardToDecimalise = 4.8846945805332034E-12;

template <typename Float>
static bool Lite(Float value, Decomposition& result)
{
    RecordingAppender appender;
    const bool ok = lite::ToDecimal(value, appender);
    CHECK(appender.num_appends == (ok ? 1 : 0));
    CHECK(appender.num_high_precision == 0);
    result = appender.last;
    return ok;
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("RoundToInt64")
{
    int64_t r = -1;

    // floor(x + 0.5): ties go up, not to even.
    REQUIRE(impl::RoundToInt64(2.5, r));
    CHECK(r == 3);
    REQUIRE(impl::RoundToInt64(3.5, r));
    CHECK(r == 4);
    REQUIRE(impl::RoundToInt64(0.5, r));
    CHECK(r == 1);

    REQUIRE(impl::RoundToInt64(2.4999999999999996, r));
    CHECK(r == 2);
    REQUIRE(impl::RoundToInt64(0.49999999999999994, r));
    CHECK(r == 0);
    REQUIRE(impl::RoundToInt64(0.0, r));
    CHECK(r == 0);

    REQUIRE(impl::RoundToInt64(4503599627370497.0, r));
    CHECK(r == 4503599627370497);
    REQUIRE(impl::RoundToInt64(9223372036854774784.0, r));
    CHECK(r == 9223372036854774784);

    CHECK(!impl::RoundToInt64(9223372036854775808.0, r));
    CHECK(!impl::RoundToInt64(1e19, r));
    CHECK(!impl::RoundToInt64(std::numeric_limits<double>::infinity(), r));
}

TEST_CASE("Double - Lite")
{
    Decomposition d;

    REQUIRE(Lite(-3.14, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Lite(123456789.012345, d));
    CHECK(d == Make(false, 123456789012345, 6));

    REQUIRE(Lite(-3.141592653589793, d));
    CHECK(d == Make(true, 3141592653589793, 15));

    REQUIRE(Lite(1e-6, d));
    CHECK(d == Make(false, 1, 6));

    REQUIRE(Lite(1e18, d));
    CHECK(d == Make(false, 1000000000000000000, 0));

    CHECK(!Lite(HardToDecimalise, d));
    CHECK(!Lite(0.1 + 0.2, d));
}

TEST_CASE("Double - Lite - Zero")
{
    Decomposition d;

    REQUIRE(Lite(0.0, d));
    CHECK(d == Make(false, 0, 1));

    REQUIRE(Lite(-0.0, d));
    CHECK(d == Make(true, 0, 1));
}

TEST_CASE("Double - Lite - Special values")
{
    Decomposition d;

    CHECK(!Lite(std::numeric_limits<double>::quiet_NaN(), d));
    CHECK(!Lite(std::numeric_limits<double>::infinity(), d));
    CHECK(!Lite(-std::numeric_limits<double>::infinity(), d));

    // 2^63 does not fit into an int64_t.
    CHECK(!Lite(static_cast<double>(std::numeric_limits<int64_t>::min()), d));
}

TEST_CASE("Double - Lite - Powers of ten")
{
    Decomposition d;

    double p = 1.0;
    for (int e = 0; e <= 18; ++e)
    {
        CAPTURE(e);
        REQUIRE(Lite(p, d));
        CHECK(static_cast<double>(d.mantissa) == p);
        CHECK(d.exponent == 0);

        const double q = 1.0 / p;
        REQUIRE(Lite(q, d));
        CHECK(d == Make(false, 1, e));

        p *= 10;
    }

    CHECK(!Lite(1e19, d));
    CHECK(!Lite(1e-19, d));
    CHECK(!Lite(1e-300, d));
    CHECK(!Lite(1e300, d));
}

TEST_CASE("Double - Lite - Few digits")
{
    Decomposition d;

    for (int64_t x = 0; x < 100000; x += 7)
    {
        int64_t f = 1;
        for (int i = 0; i <= 18; ++i)
        {
            const double value = static_cast<double>(x) / static_cast<double>(f);
            CAPTURE(x);
            CAPTURE(i);
            REQUIRE(Lite(value, d));
            CHECK(ToDouble(d.negative, d.mantissa, d.exponent) == value);
            f *= 10;
        }
    }
}

//==================================================================================================
//
//==================================================================================================

TEST_CASE("Single - Lite")
{
    Decomposition d;

    REQUIRE(Lite(-3.14f, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Lite(-3.1415927f, d));
    CHECK(d == Make(true, 31415927, 7));

    REQUIRE(Lite(123456.789f, d));
    CHECK(d == Make(false, 12345679, 2));

    REQUIRE(Lite(0.0f, d));
    CHECK(d == Make(false, 0, 1));

    REQUIRE(Lite(-0.0f, d));
    CHECK(d == Make(true, 0, 1));

    CHECK(!Lite(std::numeric_limits<float>::quiet_NaN(), d));
    CHECK(!Lite(std::numeric_limits<float>::infinity(), d));
    CHECK(!Lite(static_cast<float>(std::numeric_limits<int64_t>::min()), d));
}

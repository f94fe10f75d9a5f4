#include <catch2/catch.hpp>

#include "decimaliser.h"
#include "recording_appender.h"

#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace decimaliser;

static constexpr double HardToDecimalise = 4.8846945805332034E-12;

template <typename Float>
static bool Convert(Decimaliser const& policy, Float value, Decomposition& result)
{
    RecordingAppender appender;
    const bool ok = policy.ToDecimal(value, appender);
    CHECK(appender.num_appends == (ok ? 1 : 0));
    CHECK(appender.num_high_precision == 0);
    result = appender.last;
    return ok;
}

//==================================================================================================
// Policies
//==================================================================================================

TEST_CASE("Decimaliser - Steps")
{
    const Decimaliser simple = Decimaliser::Simple();
    REQUIRE(simple.NumSteps() == 1);
    CHECK(simple.StepAt(0).method == Method::Lite);

    const Decimaliser general = Decimaliser::General();
    REQUIRE(general.NumSteps() == 2);
    CHECK(general.StepAt(0).method == Method::Lite);
    CHECK(general.StepAt(1).method == Method::Exact);

    const Decimaliser standard = Decimaliser::Standard();
    REQUIRE(standard.NumSteps() == 2);
    CHECK(standard.StepAt(0).method == Method::MaximumPrecision);
    CHECK(standard.StepAt(0).precision == 18);
    CHECK(standard.StepAt(1).method == Method::Exact);

    const Decimaliser bounded = Decimaliser::Bounded(4);
    REQUIRE(bounded.NumSteps() == 2);
    CHECK(bounded.StepAt(0).method == Method::MaximumPrecision);
    CHECK(bounded.StepAt(0).precision == 4);
    CHECK(bounded.StepAt(1).method == Method::Exact);

    CHECK_THROWS_AS(Decimaliser::Bounded(-1), std::invalid_argument);
    CHECK_THROWS_AS(Decimaliser::Bounded(19), std::invalid_argument);
}

TEST_CASE("Double - Simple")
{
    const Decimaliser policy = Decimaliser::Simple();
    Decomposition d;

    REQUIRE(Convert(policy, -3.14, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Convert(policy, -0.0, d));
    CHECK(d == Make(true, 0, 1));

    CHECK(!Convert(policy, HardToDecimalise, d));
    CHECK(!Convert(policy, 1e30, d));
    CHECK(!Convert(policy, std::numeric_limits<double>::quiet_NaN(), d));
}

TEST_CASE("Double - General")
{
    const Decimaliser policy = Decimaliser::General();
    Decomposition d;

    REQUIRE(Convert(policy, -3.14, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Convert(policy, 0.0, d));
    CHECK(d == Make(false, 0, 1));

    REQUIRE(Convert(policy, -0.0, d));
    CHECK(d == Make(true, 0, 1));

    REQUIRE(Convert(policy, 1e-6, d));
    CHECK(d == Make(false, 1, 6));

    // Exact tier.
    REQUIRE(Convert(policy, 1e30, d));
    CHECK(d == Make(false, 10, -29));

    REQUIRE(Convert(policy, 1e19, d));
    CHECK(d == Make(false, 10, -18));

    REQUIRE(Convert(policy, 0.1 + 0.2, d));
    CHECK(d == Make(false, 30000000000000004, 17));

    REQUIRE(Convert(policy, static_cast<double>(std::numeric_limits<int64_t>::min()), d));
    CHECK(d == Make(true, 9223372036854776, -3));

    // The exponent of the exact result is too large.
    CHECK(!Convert(policy, HardToDecimalise, d));
    CHECK(!Convert(policy, 1e-20, d));

    // Outside the band.
    CHECK(!Convert(policy, 1e-30, d));
    CHECK(!Convert(policy, -1e-30, d));
    CHECK(!Convert(policy, 1e45, d));
    CHECK(!Convert(policy, std::numeric_limits<double>::max(), d));
    CHECK(!Convert(policy, std::numeric_limits<double>::denorm_min(), d));

    CHECK(!Convert(policy, std::numeric_limits<double>::quiet_NaN(), d));
    CHECK(!Convert(policy, std::numeric_limits<double>::infinity(), d));
}

TEST_CASE("Double - General - Round trip")
{
    const Decimaliser policy = Decimaliser::General();
    std::mt19937_64 random(1357);
    std::uniform_real_distribution<double> log_magnitude(-29.0, 45.0);
    std::uniform_int_distribution<int> num_digits(1, 17);

    Decomposition d;
    int num_converted = 0;
    for (int i = 0; i < 100000; ++i)
    {
        // Round to a few significant digits, so that a good share of the values is accepted.
        const double magnitude = std::pow(10.0, log_magnitude(random));
        const double scale = std::pow(10.0, num_digits(random) - std::ceil(std::log10(magnitude)));
        const double value = std::round(magnitude * scale) / scale;
        if (!std::isfinite(value))
            continue;

        CAPTURE(value);
        if (!Convert(policy, value, d))
            continue;

        ++num_converted;
        CHECK(d.exponent <= 18);
        CHECK(ToDouble(d.negative, d.mantissa, d.exponent) == value);
    }

    CHECK(num_converted > 0);
}

TEST_CASE("ToDouble")
{
    CHECK(ToDouble(true, 314, 2) == -3.14);
    CHECK(ToDouble(false, 1, -30) == 1e30);
    CHECK(ToDouble(false, 10, -29) == 1e30);
    CHECK(ToDouble(false, 1000, 1) == 100.0);
    CHECK(ToDouble(false, 0, 1) == 0.0);
    CHECK(std::signbit(ToDouble(true, 0, 1)));

    CHECK(ToFloat(false, 10, -29) == 1e30f);
    CHECK(ToFloat(true, 9223372, -12) == static_cast<float>(std::numeric_limits<int64_t>::min()));
}

TEST_CASE("Double - Standard")
{
    const Decimaliser policy = Decimaliser::Standard();
    Decomposition d;

    REQUIRE(Convert(policy, HardToDecimalise, d));
    CHECK(d == Make(false, 4884695, 18));

    // Rounds to zero at 18 decimal places.
    CHECK(!Convert(policy, 1e-20, d));
    CHECK(!Convert(policy, -1e-20, d));
    CHECK(!Convert(policy, std::numeric_limits<double>::denorm_min(), d));

    REQUIRE(Convert(policy, 1e-18, d));
    CHECK(d == Make(false, 1, 18));

    REQUIRE(Convert(policy, -0.0, d));
    CHECK(d == Make(true, 0, 1));

    REQUIRE(Convert(policy, 1e18, d));
    CHECK(d == Make(false, 1000000000000000000, 0));

    // Exact tier.
    REQUIRE(Convert(policy, 1e19, d));
    CHECK(d == Make(false, 10, -18));

    REQUIRE(Convert(policy, -1e300, d));
    CHECK(d == Make(true, 10, -299));

    REQUIRE(Convert(policy, std::numeric_limits<double>::max(), d));
    CHECK(d == Make(false, 17976931348623157, -292));

    CHECK(!Convert(policy, std::numeric_limits<double>::quiet_NaN(), d));
    CHECK(!Convert(policy, -std::numeric_limits<double>::infinity(), d));
}

TEST_CASE("Double - Bounded")
{
    Decomposition d;

    REQUIRE(Convert(Decimaliser::Bounded(16), HardToDecimalise, d));
    CHECK(d == Make(false, 48847, 16));

    REQUIRE(Convert(Decimaliser::Bounded(2), -3.14159, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Convert(Decimaliser::Bounded(0), 0.0, d));
    CHECK(d == Make(false, 0, 0));

    REQUIRE(Convert(Decimaliser::Bounded(0), 0.7, d));
    CHECK(d == Make(false, 1, 0));

    // Non-zero values which round to zero are not decomposed.
    CHECK(!Convert(Decimaliser::Bounded(0), 0.3, d));
    CHECK(!Convert(Decimaliser::Bounded(0), -0.3, d));
    CHECK(!Convert(Decimaliser::Bounded(5), 1e-6, d));
    CHECK(!Convert(Decimaliser::Bounded(5), -1e-20, d));

    REQUIRE(Convert(Decimaliser::Bounded(5), 6e-6, d));
    CHECK(d == Make(false, 1, 5));
}

//==================================================================================================
// Escape
//==================================================================================================

TEST_CASE("Decimaliser - Append")
{
    {
        RecordingAppender appender;
        Decimaliser::Simple().Append(-3.14, appender);
        CHECK(appender.num_appends == 1);
        CHECK(appender.num_high_precision == 0);
        CHECK(appender.last == Make(true, 314, 2));
    }
    {
        RecordingAppender appender;
        Decimaliser::Simple().Append(HardToDecimalise, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == HardToDecimalise);
    }
    {
        RecordingAppender appender;
        Decimaliser::General().Append(1e-20, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == 1e-20);
    }
    {
        RecordingAppender appender;
        Decimaliser::Standard().Append(1e-20, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == 1e-20);
    }
    {
        RecordingAppender appender;
        Decimaliser::Bounded(5).Append(-1e-20, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == -1e-20);
    }
    {
        RecordingAppender appender;
        Decimaliser::Standard().Append(1e-20f, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == static_cast<double>(1e-20f));
    }
    {
        RecordingAppender appender;
        Decimaliser::General().Append(1e-30f, appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(appender.high_precision_value == static_cast<double>(1e-30f));
    }
    {
        RecordingAppender appender;
        Decimaliser::Standard().Append(std::numeric_limits<double>::quiet_NaN(), appender);
        CHECK(appender.num_appends == 0);
        CHECK(appender.num_high_precision == 1);
        CHECK(std::isnan(appender.high_precision_value));
    }
}

TEST_CASE("Decimaliser - Default escape throws")
{
    StrictAppender appender;

    CHECK_THROWS_AS(Decimaliser::Simple().Append(HardToDecimalise, appender), UnsupportedConversion);
    CHECK_THROWS_AS(Decimaliser::General().Append(1e-30, appender), UnsupportedConversion);
    CHECK_THROWS_AS(Decimaliser::General().Append(1e-30f, appender), UnsupportedConversion);
    CHECK_THROWS_AS(Decimaliser::Standard().Append(std::numeric_limits<double>::infinity(), appender), UnsupportedConversion);
    CHECK_THROWS_AS(Decimaliser::Standard().Append(1e-20, appender), UnsupportedConversion);
    CHECK(appender.num_appends == 0);

    CHECK_NOTHROW(Decimaliser::Simple().Append(-3.14, appender));
    CHECK(appender.num_appends == 1);

    try
    {
        Decimaliser::Simple().Append(HardToDecimalise, appender);
        FAIL("expected UnsupportedConversion");
    }
    catch (const UnsupportedConversion& e)
    {
        CHECK(std::string(e.what()) == "d: 4.8846945805332034e-12");
    }
}

//==================================================================================================
// Single precision
//==================================================================================================

TEST_CASE("Single - Decimaliser")
{
    Decomposition d;

    REQUIRE(Convert(Decimaliser::Simple(), -3.14f, d));
    CHECK(d == Make(true, 314, 2));

    REQUIRE(Convert(Decimaliser::General(), 1e30f, d));
    CHECK(d == Make(false, 10, -29));

    REQUIRE(Convert(Decimaliser::General(), -0.0f, d));
    CHECK(d == Make(true, 0, 1));

    CHECK(!Convert(Decimaliser::General(), 1e-30f, d));
    CHECK(!Convert(Decimaliser::General(), std::numeric_limits<float>::infinity(), d));

    REQUIRE(Convert(Decimaliser::Standard(), 123456.789f, d));
    CHECK(d == Make(false, 12345679, 2));

    // 1e18f is 999999984306749440, below 1e18.
    REQUIRE(Convert(Decimaliser::Standard(), 1e18f, d));
    CHECK(d == Make(false, 999999984306749440, 0));

    REQUIRE(Convert(Decimaliser::Standard(), 1e19f, d));
    CHECK(d == Make(false, 10, -18));

    CHECK(!Convert(Decimaliser::Standard(), 1e-20f, d));
    CHECK(!Convert(Decimaliser::Standard(), -1e-20f, d));

    REQUIRE(Convert(Decimaliser::Standard(), static_cast<float>(std::numeric_limits<int64_t>::min()), d));
    CHECK(d == Make(true, 9223372, -12));
}

//==================================================================================================
// Threads
//==================================================================================================

TEST_CASE("Decimaliser - Shared between threads")
{
    const Decimaliser policies[] = {
        Decimaliser::Simple(),
        Decimaliser::General(),
        Decimaliser::Standard(),
        Decimaliser::Bounded(6),
    };

    std::vector<double> values;
    std::mt19937_64 random(2468);
    std::uniform_real_distribution<double> log_magnitude(-25.0, 25.0);
    for (int i = 0; i < 2000; ++i)
    {
        const double value = std::round(std::pow(10.0, log_magnitude(random)) * 1000.0) / 1000.0;
        values.push_back((i % 3 == 0) ? -value : value);
    }

    // Expected results, computed on this thread.
    std::vector<Decomposition> expected;
    std::vector<int> expected_ok;
    for (auto const& policy : policies)
    {
        for (double value : values)
        {
            RecordingAppender appender;
            expected_ok.push_back(policy.ToDecimal(value, appender) ? 1 : 0);
            expected.push_back(appender.last);
        }
    }

    constexpr int NumThreads = 4;
    std::vector<std::vector<Decomposition>> results(NumThreads);
    std::vector<std::vector<int>> results_ok(NumThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < NumThreads; ++t)
    {
        threads.emplace_back([&, t]() {
            for (auto const& policy : policies)
            {
                for (double value : values)
                {
                    RecordingAppender appender;
                    results_ok[t].push_back(policy.ToDecimal(value, appender) ? 1 : 0);
                    results[t].push_back(appender.last);
                }
            }
        });
    }

    for (auto& thread : threads)
        thread.join();

    for (int t = 0; t < NumThreads; ++t)
    {
        CAPTURE(t);
        CHECK(results_ok[t] == expected_ok);
        CHECK(results[t] == expected);
    }
}

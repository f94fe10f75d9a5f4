#include "benchmark/benchmark.h"

#include "decimal_text.h"
#include "decimaliser.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <random>
#include <utility>
#include <vector>

//==================================================================================================
//
//==================================================================================================

template <typename Target, typename Source>
static Target ReinterpretBits(Source const& source)
{
    static_assert(sizeof(Target) == sizeof(Source), "size mismatch");

    Target target;
    std::memcpy(&target, &source, sizeof(Source));
    return target;
}

class JenkinsRandom
{
    // A small noncryptographic PRNG
    // http://burtleburtle.net/bob/rand/smallprng.html

    uint32_t a;
    uint32_t b;
    uint32_t c;
    uint32_t d;

    static uint32_t Rotate(uint32_t value, int n) {
        return (value << n) | (value >> (32 - n));
    }

    uint32_t Gen() {
        const uint32_t e = a - Rotate(b, 27);
        a = b ^ Rotate(c, 17);
        b = c + d;
        c = d + e;
        d = e + a;
        return d;
    }

public:
    using result_type = uint32_t;

    static constexpr uint32_t min() { return 0; }
    static constexpr uint32_t max() { return UINT32_MAX; }

    explicit JenkinsRandom(uint32_t seed = 0) {
        a = 0xF1EA5EED;
        b = seed;
        c = seed;
        d = seed;
        for (int i = 0; i < 20; ++i) {
            static_cast<void>(Gen());
        }
    }

    uint32_t operator()() { return Gen(); }
};

static JenkinsRandom rng;

//==================================================================================================
//
//==================================================================================================

static constexpr int NumFloats = 1 << 13;

template <typename ...Args>
static inline char const* StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return strdup(buf); // leak...
}

// Counts digits, so that the work cannot be optimized away.
struct CountingAppender final : decimaliser::DecimalAppender
{
    uint64_t sum = 0;

    void Append(bool negative, uint64_t mantissa, int exponent) override {
        sum += mantissa + static_cast<uint64_t>(exponent) + (negative ? 1 : 0);
    }

    void AppendHighPrecision(double) override { ++sum; }
    void AppendHighPrecision(float) override { ++sum; }
};

template <typename Float>
static inline void BenchToDecimal(benchmark::State& state, decimaliser::Decimaliser const& policy, std::vector<Float> const& numbers)
{
    CountingAppender appender;

    int index = 0;
    for (auto _ : state)
    {
        policy.Append(numbers[index], appender);
        index = (index + 1) & (NumFloats - 1);
    }

    benchmark::DoNotOptimize(appender.sum);
}

template <typename Float>
static inline void BenchToChars(benchmark::State& state, decimaliser::Decimaliser const& policy, std::vector<Float> const& numbers)
{
    int index = 0;

    uint64_t sum = 0;
    for (auto _ : state)
    {
        char buffer[decimaliser::TextAppender::MinBufferLength];
        decimaliser::ToChars(buffer, numbers[index], policy);
        sum += static_cast<unsigned char>(buffer[0]);
        index = (index + 1) & (NumFloats - 1);
    }

    if (sum == UINT64_MAX)
        abort();
}

static void AddStatistics(benchmark::internal::Benchmark* bench)
{
    bench->ComputeStatistics("min", [](const std::vector<double>& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->Repetitions(3);
    bench->ReportAggregatesOnly();
}

struct NamedPolicy
{
    char const* name;
    decimaliser::Decimaliser policy;
};

static std::vector<NamedPolicy> const& Policies()
{
    static const std::vector<NamedPolicy> policies = {
        {"simple", decimaliser::Decimaliser::Simple()},
        {"general", decimaliser::Decimaliser::General()},
        {"standard", decimaliser::Decimaliser::Standard()},
        {"bounded(6)", decimaliser::Decimaliser::Bounded(6)},
    };
    return policies;
}

template <typename Float>
static inline void RegisterBenchmarks(char const* name, std::vector<Float> const& numbers)
{
    const char* float_name = sizeof(Float) == 4 ? "single" : "double";

    for (auto const& named : Policies())
    {
        AddStatistics(benchmark::RegisterBenchmark(StrPrintf("%s - %s - %s - decimal", float_name, named.name, name), BenchToDecimal<Float>, named.policy, numbers));
        AddStatistics(benchmark::RegisterBenchmark(StrPrintf("%s - %s - %s - chars", float_name, named.name, name), BenchToChars<Float>, named.policy, numbers));
    }
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

static inline void Register_RandomBits_double()
{
    std::vector<double> numbers(NumFloats);

    std::uniform_int_distribution<uint64_t> gen(1, 0x7FF0000000000000ull - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<double>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

static inline void Register_RandomBits_single()
{
    std::vector<float> numbers(NumFloats);

    std::uniform_int_distribution<uint32_t> gen(1, 0x7F800000u - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return ReinterpretBits<float>(gen(rng)); });

    RegisterBenchmarks("Random-bits", numbers);
}

template <typename Float>
static inline void Register_Uniform(Float low, Float high)
{
    std::vector<Float> numbers(NumFloats);

    std::uniform_real_distribution<Float> gen(low, high);
    std::generate(numbers.begin(), numbers.end(), [&] { return gen(rng); });

    RegisterBenchmarks(StrPrintf("Uniform %.1g/%.1g", static_cast<double>(low), static_cast<double>(high)), numbers);
}

// Prices and the like: few digits after the decimal point.
static inline void Register_Digits_double(int digits, int decimal_places)
{
    std::vector<double> numbers(NumFloats);

    const double scale = decimaliser::ToDouble(false, 1, decimal_places);
    int64_t limit = 1;
    for (int i = 0; i < digits; ++i)
        limit *= 10;

    std::uniform_int_distribution<int64_t> gen(1, limit - 1);
    std::generate(numbers.begin(), numbers.end(), [&] { return static_cast<double>(gen(rng)) * scale; });

    RegisterBenchmarks(StrPrintf("%d-digits/%d-places", digits, decimal_places), numbers);
}

//--------------------------------------------------------------------------------------------------
//
//--------------------------------------------------------------------------------------------------

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#endif

    printf("Preparing benchmarks...\n");

    Register_RandomBits_double();
    Register_Uniform(0.0, 1.0);
    Register_Uniform(1.0, 2.0);
    for (int d = 1; d <= 15; d += 2)
    {
        Register_Digits_double(d, 2);
        Register_Digits_double(d, d / 2);
    }

    Register_RandomBits_single();
    Register_Uniform(0.0f, 1.0f);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
}

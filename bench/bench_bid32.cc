#include "benchmark/benchmark.h"

#include <cstdio>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <limits>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "bidconv.h"
#include "decimal32.h"

#define BENCH_BIDCONV()             1
#define BENCH_DOUBLE_CONVERSION()   1

static constexpr int NumValues = 1 << 14;

#if BENCH_BIDCONV()
struct D2FBidconv
{
    float operator()(uint32_t bits) const
    {
        return bidconv::Decimal32ToFloat(bits);
    }
};
#endif

#if BENCH_DOUBLE_CONVERSION()
#include "double-conversion/double-conversion.h"
// Formats the decimal32 value as a string and parses it back.
struct D2FDoubleConversion
{
    float operator()(uint32_t bits) const
    {
        const bidconv::Decimal32 d(bits);

        char buf[64];
        const int len = std::snprintf(buf, sizeof(buf), "%s%ue%d", d.SignBit() ? "-" : "", d.Coefficient(), d.Exponent());

        double_conversion::StringToDoubleConverter s2f(0, 0.0, 0.0, "inf", "nan");
        int processed_characters_count = 0;
        return s2f.StringToFloat(buf, len, &processed_characters_count);
    }
};
#endif

template <typename Converter>
static void BenchIt(benchmark::State& state, std::vector<uint32_t> const& values)
{
    Converter convert;

    size_t index = 0;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize( convert(values[index]) );
        index = (index + 1) & (NumValues - 1);
    }
}

template <typename Converter>
static void RegisterBenchmarks(char const* name, std::vector<uint32_t> const& values)
{
    auto* bench = benchmark::RegisterBenchmark(name, BenchIt<Converter>, values);

    bench->ComputeStatistics("min", [](std::vector<double> const& v) -> double {
        return *(std::min_element(std::begin(v), std::end(v)));
    });
    bench->ReportAggregatesOnly();
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

template <typename ...Args>
static inline std::string StrPrintf(char const* format, Args&&... args)
{
    char buf[1024];
    snprintf(buf, 1024, format, std::forward<Args>(args)...);
    return std::string(buf);
}

static inline void RegisterUniform_decimal32(char const* name, int min_exponent, int max_exponent, uint32_t max_coefficient)
{
    std::vector<uint32_t> values(NumValues);

    std::uniform_int_distribution<int> gen_exponent(min_exponent, max_exponent);
    std::uniform_int_distribution<uint32_t> gen_coefficient(1, max_coefficient);
    std::uniform_int_distribution<int> gen_sign(0, 1);

    std::generate(values.begin(), values.end(), [&] {
        const bool sign = gen_sign(rng) != 0;
        const int exponent = gen_exponent(rng);
        const uint32_t coefficient = gen_coefficient(rng);
        return bidconv::Decimal32::Make(sign, exponent, coefficient).bits;
    });

#if BENCH_BIDCONV()
    RegisterBenchmarks<D2FBidconv         >(StrPrintf("%s bidconv           ", name).c_str(), values);
#endif
#if BENCH_DOUBLE_CONVERSION()
    RegisterBenchmarks<D2FDoubleConversion>(StrPrintf("%s double_conversion ", name).c_str(), values);
#endif
}

int main(int argc, char** argv)
{
#if defined(__clang__)
    printf("clang %d.%d\n", __clang_major__, __clang_minor__);
#elif defined(__GNUC__)
    printf("gcc %s\n", __VERSION__);
#elif defined(_MSC_VER)
    printf("msc %d\n", _MSC_FULL_VER);
#endif

    using bidconv::Decimal32;

    RegisterUniform_decimal32("warm up", 0, 0, Decimal32::MaxCoefficient);
    RegisterUniform_decimal32("warm up", 0, 0, Decimal32::MaxCoefficient);

    RegisterUniform_decimal32("integers 7 digits   ", 0, 0, Decimal32::MaxCoefficient);
    RegisterUniform_decimal32("integers 3 digits   ", 0, 0, 999);
    RegisterUniform_decimal32("q in [-10,10]       ", -10, 10, Decimal32::MaxCoefficient);
    RegisterUniform_decimal32("q in [-45,38]       ", -45, 38, Decimal32::MaxCoefficient);
    RegisterUniform_decimal32("subnormal [-52,-39] ", -52, -39, Decimal32::MaxCoefficient);
    RegisterUniform_decimal32("q in [min,max]      ", Decimal32::MinExponent, Decimal32::MaxExponent, Decimal32::MaxCoefficient);

    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();

    return 0;
}

#include "catch.hpp"

#include "bidconv.h"
#include "bid32_impl.h"
#include "bid32_tables.h"
#include "decimal32.h"

#include "reference.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

using bidconv::Binary32;
using bidconv::Decimal32;
using bidconv::StatusFlags;

static uint32_t Convert(bool sign, int exponent, uint32_t coefficient)
{
    return bidconv::Decimal32ToBinary32Bits(Decimal32::Make(sign, exponent, coefficient).bits);
}

static uint32_t ConvertFlags(bool sign, int exponent, uint32_t coefficient)
{
    return bidconv::Decimal32ToBinary32(Decimal32::Make(sign, exponent, coefficient).bits).flags;
}

// Maps binary32 bit patterns to integers with the same order as the float values, with -0 == +0.
static int64_t OrderedBits(uint32_t bits)
{
    const int64_t magnitude = bits & 0x7FFFFFFF;
    return (bits & 0x80000000) != 0 ? -magnitude : magnitude;
}

//==================================================================================================
// Special values
//==================================================================================================

TEST_CASE("Decimal32ToBinary32 - zero")
{
    CHECK(Convert(false, 0, 0) == 0x00000000);
    CHECK(Convert(true,  0, 0) == 0x80000000);

    for (int q = Decimal32::MinExponent; q <= Decimal32::MaxExponent; ++q)
    {
        CHECK(Convert(false, q, 0) == 0x00000000);
        CHECK(Convert(true,  q, 0) == 0x80000000);
        CHECK(ConvertFlags(true, q, 0) == StatusFlags::none);
    }

    CHECK(bidconv::Decimal32ToFloat(0x00000000) == 0.0f);
    CHECK(!std::signbit(bidconv::Decimal32ToFloat(0x00000000)));
    CHECK(std::signbit(bidconv::Decimal32ToFloat(0x80000000)));
}

TEST_CASE("Decimal32ToBinary32 - non-canonical coefficients")
{
    // Coefficients 10000000 ... 2^23 + 2^21 - 1 in the large-coefficient layout read as zero.
    for (uint32_t c : {10000000u, 10485759u})
    {
        const uint32_t trailing = c & Decimal32::LargeCoefficientMask;
        const uint32_t pos = 0x60000000u | (101u << 21) | trailing;
        const uint32_t neg = 0x80000000u | pos;

        const auto r_pos = bidconv::Decimal32ToBinary32(pos);
        CHECK(r_pos.bits == 0x00000000);
        CHECK(r_pos.flags == StatusFlags::none);
        const auto r_neg = bidconv::Decimal32ToBinary32(neg);
        CHECK(r_neg.bits == 0x80000000);
        CHECK(r_neg.flags == StatusFlags::none);
    }

    // 9999999 itself is canonical.
    const uint32_t max_coefficient = 0x60000000u | (101u << 21) | (9999999u & Decimal32::LargeCoefficientMask);
    CHECK(bidconv::Decimal32ToFloat(max_coefficient) == 9999999.0f);
}

TEST_CASE("Decimal32ToBinary32 - infinity")
{
    const auto pos = bidconv::Decimal32ToBinary32(0x78000000);
    CHECK(pos.bits == 0x7F800000);
    CHECK(pos.flags == StatusFlags::none);
    CHECK(pos.Value() == std::numeric_limits<float>::infinity());

    const auto neg = bidconv::Decimal32ToBinary32(0xF8000000);
    CHECK(neg.bits == 0xFF800000);
    CHECK(neg.flags == StatusFlags::none);

    // The trailing bits of an infinity are ignored.
    CHECK(bidconv::Decimal32ToBinary32Bits(0x7BFFFFFF) == 0x7F800000);
    CHECK(bidconv::Decimal32ToBinary32Bits(0xF9234567) == 0xFF800000);
}

TEST_CASE("Decimal32ToBinary32 - NaN")
{
    SECTION("quiet")
    {
        const auto r = bidconv::Decimal32ToBinary32(Decimal32::QuietNaN(false).bits);
        CHECK(r.bits == 0x7FC00000);
        CHECK(r.flags == StatusFlags::none);
        CHECK(std::isnan(r.Value()));

        const auto r_neg = bidconv::Decimal32ToBinary32(Decimal32::QuietNaN(true).bits);
        CHECK(r_neg.bits == 0xFFC00000);
    }

    SECTION("payload")
    {
        for (uint32_t p : {1u, 2u, 12345u, 500000u, 999999u})
        {
            const auto r = bidconv::Decimal32ToBinary32(Decimal32::QuietNaN(false, p).bits);
            CHECK(r.bits == (0x7FC00000u | (p << 2)));
            CHECK(Binary32(r.bits).IsQuietNaN());
        }

        // Non-canonical payloads read as 0.
        for (uint32_t p : {1000000u, 0xFFFFFu})
        {
            CHECK(bidconv::Decimal32ToBinary32Bits(Decimal32::QuietNaN(true, p).bits) == 0xFFC00000);
        }

        // Bits above the 20-bit payload field do not leak into the result.
        CHECK(bidconv::Decimal32ToBinary32Bits(0x7DF00005) == (0x7FC00000u | (5u << 2)));
    }

    SECTION("signaling")
    {
        const auto r = bidconv::Decimal32ToBinary32(Decimal32::SignalingNaN(false, 42).bits);
        CHECK(r.bits == (0x7FC00000u | (42u << 2)));
        CHECK(r.flags == StatusFlags::invalid);

        const auto r_neg = bidconv::Decimal32ToBinary32(Decimal32::SignalingNaN(true).bits);
        CHECK(r_neg.bits == 0xFFC00000);
        CHECK(r_neg.flags == StatusFlags::invalid);
    }
}

//==================================================================================================
// Exact results
//==================================================================================================

TEST_CASE("Decimal32ToBinary32 - integers")
{
    // Every coefficient < 2^24 is exactly representable.
    uint32_t num_failures = 0;
    uint32_t first_failure = 0;
    for (uint32_t c = 1; c <= Decimal32::MaxCoefficient; ++c)
    {
        const auto r = bidconv::Decimal32ToBinary32(Decimal32::Make(false, 0, c).bits);
        if (r.Value() != static_cast<float>(c) || r.flags != StatusFlags::none)
        {
            if (num_failures++ == 0)
                first_failure = c;
        }
    }
    INFO("first failure: " << first_failure);
    CHECK(num_failures == 0);
}

TEST_CASE("Decimal32ToBinary32 - powers of two")
{
    uint32_t p = 1;
    for (int k = 0; k <= 23; ++k, p *= 2)
    {
        const auto r = bidconv::Decimal32ToBinary32(Decimal32::Make(false, 0, p).bits);
        CHECK(r.bits == Binary32::Make(false, static_cast<uint32_t>(127 + k), 0).bits);
        CHECK(r.flags == StatusFlags::none);
    }

    // 2^23
    CHECK(Convert(false, 0, 8388608) == 0x4B000000);

    // 2^24 needs 8 digits. 1677722 * 10 = 2^24 + 4 is the nearest decimal32 value, and it is
    // exactly representable.
    CHECK(Convert(false, 1, 1677722) == 0x4B800002);
    CHECK(bidconv::Decimal32ToFloat(Decimal32::Make(false, 1, 1677722).bits) == 16777220.0f);
    CHECK(ConvertFlags(false, 1, 1677722) == StatusFlags::none);

    // Negative powers of two with coefficients divisible by 5^n.
    CHECK(Convert(false, -1, 5) == 0x3F000000); // 0.5
    CHECK(ConvertFlags(false, -1, 5) == StatusFlags::none);
    CHECK(Convert(true, -2, 25) == 0xBE800000); // -0.25
    CHECK(bidconv::Decimal32ToFloat(Decimal32::Make(false, -6, 15625).bits) == 0.015625f);
    CHECK(ConvertFlags(false, -6, 15625) == StatusFlags::none);
}

//==================================================================================================
// Rounding
//==================================================================================================

TEST_CASE("Decimal32ToBinary32 - inexact")
{
    CHECK(Convert(false, -1, 1) == 0x3DCCCCCD); // 0.1f
    CHECK(ConvertFlags(false, -1, 1) == StatusFlags::inexact);

    CHECK(Convert(false, 38, 1) == 0x7E967699); // 1e38f
    CHECK(ConvertFlags(false, 38, 1) == StatusFlags::inexact);

    // Exact: 8 digits would be needed for the next tie.
    CHECK(Convert(false, 1, 3355443) == 0x4BFFFFFF); // 33554430
    CHECK(Convert(false, 0, 8388609) == BitsFromFloat(8388609.0f));

    // Exact ties in [2^25, 2^26), where the spacing is 4.
    // 33554450 is halfway between 33554448 and 33554452 (round to even: down).
    CHECK(Convert(false, 1, 3355445) == BitsFromFloat(33554448.0f));
    CHECK(ConvertFlags(false, 1, 3355445) == StatusFlags::inexact);
    // 33554470 is halfway between 33554468 and 33554472 (round to even: up).
    CHECK(Convert(false, 1, 3355447) == BitsFromFloat(33554472.0f));
    CHECK(Convert(true,  1, 3355447) == BitsFromFloat(-33554472.0f));
}

TEST_CASE("Decimal32ToBinary32 - significand carry")
{
    // Values in [2^K (1 - 2^-25), 2^K) round up to 2^K.
    CHECK(Convert(false, -42, 6018531) == 0x05000000); // 2^-117
    CHECK(Convert(false, -23, 5551115) == 0x24800000); // 2^-54
    CHECK(Convert(false, -22, 8881784) == 0x26800000); // 2^-50
    CHECK(Convert(false, -31, 8271806) == 0x17800000); // 2^-80

    // Subnormal carry: 2^-140
    CHECK(Convert(false, -49, 7174648) == 0x00000200);
    CHECK(Convert(true,  -49, 7174648) == 0x80000200);
}

TEST_CASE("Decimal32ToBinary32 - subnormals and underflow")
{
    // denorm_min = 1.40129846e-45
    CHECK(Convert(false, -51, 1401298) == 0x00000001);
    CHECK(ConvertFlags(false, -51, 1401298) == (StatusFlags::underflow | StatusFlags::inexact));
    CHECK(bidconv::Decimal32ToFloat(Decimal32::Make(false, -51, 1401298).bits) == std::numeric_limits<float>::denorm_min());

    // 2^-150 = 7.00649232e-46 is the midpoint between 0 and denorm_min.
    CHECK(Convert(false, -52, 7006492) == 0x00000000);
    CHECK(ConvertFlags(false, -52, 7006492) == (StatusFlags::underflow | StatusFlags::inexact));
    CHECK(Convert(false, -52, 7006493) == 0x00000001);
    CHECK(Convert(true,  -52, 7006492) == 0x80000000);
    CHECK(Convert(true,  -52, 7006493) == 0x80000001);

    CHECK(Convert(false, -45, 1) == 0x00000001);
    CHECK(Convert(false, -46, 1) == 0x00000000);

    // Largest subnormals below FLT_MIN = 1.17549435e-38
    CHECK(Convert(false, -44, 1175494) == 0x007FFFFD);
    CHECK(Binary32(Convert(false, -44, 1175494)).IsSubnormal());

    // Underflow is decided on the packed result: subnormal and inexact.
    CHECK(ConvertFlags(false, -44, 1175494) == (StatusFlags::underflow | StatusFlags::inexact));
    // The next decimal32 value is already normal. The decimal grid near FLT_MIN is much coarser
    // than the interval in which bounded and unbounded tininess detection could disagree.
    CHECK(Convert(false, -44, 1175495) == 0x00800005);
    CHECK(ConvertFlags(false, -44, 1175495) == StatusFlags::inexact);

    // Far below the subnormal range, including exponents below the table range.
    for (int q = Decimal32::MinExponent; q <= -53; ++q)
    {
        CHECK(Convert(false, q, 9999999) == 0x00000000);
        CHECK(Convert(true,  q, 9999999) == 0x80000000);
        CHECK(ConvertFlags(true, q, 1) == (StatusFlags::underflow | StatusFlags::inexact));
    }
}

TEST_CASE("Decimal32ToBinary32 - overflow")
{
    // FLT_MAX = 3.40282347e38, FLT_MAX + ulp/2 = 3.40282357e38
    CHECK(Convert(false, 32, 3402823) == 0x7F7FFFFD);
    CHECK(ConvertFlags(false, 32, 3402823) == StatusFlags::inexact);

    CHECK(Convert(false, 32, 3402824) == 0x7F800000);
    CHECK(Convert(true,  32, 3402824) == 0xFF800000);
    CHECK(ConvertFlags(false, 32, 3402824) == (StatusFlags::overflow | StatusFlags::inexact));

    // Everything >= 3.4028236e38 overflows.
    CHECK(Convert(false, 32, 3402824) == 0x7F800000);
    CHECK(Convert(false, 33, 340283) == 0x7F800000);
    CHECK(Convert(false, 38, 4) == 0x7F800000);
    CHECK(Convert(false, 38, 9999999) == 0x7F800000);

    // Exponents >= 39 always overflow.
    for (int q = 39; q <= Decimal32::MaxExponent; ++q)
    {
        CHECK(Convert(false, q, 1) == 0x7F800000);
        CHECK(Convert(true,  q, 9999999) == 0xFF800000);
        CHECK(ConvertFlags(true, q, 1) == (StatusFlags::overflow | StatusFlags::inexact));
    }
}

//==================================================================================================
// Comparison with double-conversion
//==================================================================================================

static void CheckAgainstReference(bool sign, int exponent, uint32_t coefficient, uint32_t& num_failures)
{
    const uint32_t expected = ReferenceToBinary32(sign, coefficient, exponent);
    const uint32_t actual = Convert(sign, exponent, coefficient);
    if (expected != actual)
    {
        if (num_failures++ < 10)
        {
            FAIL_CHECK((sign ? "-" : "") << coefficient << "e" << exponent
                << ": expected " << FloatFromBits(expected) << ", actual " << FloatFromBits(actual));
        }
    }
}

TEST_CASE("Decimal32ToBinary32 - reference")
{
    std::mt19937 rng(1234);
    std::uniform_int_distribution<uint32_t> gen(1, Decimal32::MaxCoefficient);

    static constexpr uint32_t EdgeCoefficients[] = {
        1, 2, 3, 5, 7, 9, 10, 99, 125, 999999, 1000000, 1234567,
        4194303, 4194304, 8388607, 8388608, 8388609, 9999998, 9999999,
    };

    uint32_t num_failures = 0;
    for (int q = Decimal32::MinExponent; q <= Decimal32::MaxExponent; ++q)
    {
        for (const uint32_t c : EdgeCoefficients)
        {
            CheckAgainstReference(false, q, c, num_failures);
            CheckAgainstReference(true,  q, c, num_failures);
        }
        for (int i = 0; i < 2000; ++i)
        {
            CheckAgainstReference((i & 1) != 0, q, gen(rng), num_failures);
        }
    }
    CHECK(num_failures == 0);
}

TEST_CASE("Decimal32ToBinary32 - near midpoints")
{
    // Decimals close to the midpoint between two adjacent binary32 values are the hardest cases.
    std::mt19937 rng(4321);
    std::uniform_int_distribution<uint32_t> gen_significand(1u << 23, (1u << 24) - 1);
    std::uniform_int_distribution<int> gen_exponent(-149, 104);

    uint32_t num_failures = 0;
    for (int i = 0; i < 100000; ++i)
    {
        const double m = 2.0 * gen_significand(rng) + 1.0;
        const double midpoint = std::ldexp(m, gen_exponent(rng) - 1);

        int q = static_cast<int>(std::floor(std::log10(midpoint))) - 6;
        double c = std::nearbyint(midpoint / std::pow(10.0, q));
        if (c > Decimal32::MaxCoefficient)
        {
            c = std::nearbyint(c / 10);
            q++;
        }
        if (c < 1 || q < Decimal32::MinExponent || q > Decimal32::MaxExponent)
            continue;

        const auto coefficient = static_cast<uint32_t>(c);
        CheckAgainstReference(false, q, coefficient, num_failures);
        if (coefficient > 1)
            CheckAgainstReference(false, q, coefficient - 1, num_failures);
        if (coefficient < Decimal32::MaxCoefficient)
            CheckAgainstReference(true, q, coefficient + 1, num_failures);
    }
    CHECK(num_failures == 0);
}

//==================================================================================================
// Properties
//==================================================================================================

TEST_CASE("Decimal32ToBinary32 - cohort members convert equally")
{
    // c * 10^q == (c * 10^n) * 10^(q - n)
    std::mt19937 rng(99);
    std::uniform_int_distribution<uint32_t> gen_coefficient(1, 999999);
    std::uniform_int_distribution<int> gen_exponent(Decimal32::MinExponent + 6, Decimal32::MaxExponent);

    for (int i = 0; i < 20000; ++i)
    {
        uint32_t c = gen_coefficient(rng);
        const int q = gen_exponent(rng);
        const uint32_t expected = Convert(false, q, c);

        int n = 0;
        while (c <= Decimal32::MaxCoefficient / 10)
        {
            c *= 10;
            ++n;
            const uint32_t actual = Convert(false, q - n, c);
            if (actual != expected)
            {
                FAIL_CHECK(c << "e" << (q - n));
            }
        }
    }
}

TEST_CASE("Decimal32ToBinary32 - monotonic")
{
    // Walk upwards through all binades with 7-digit coefficients in random steps.
    // c * 10^q for c in [10^6, 10^7) and increasing q visits the values in increasing order.
    std::mt19937 rng(7);
    std::uniform_int_distribution<uint32_t> gen_step(1, 3000);

    int64_t prev_pos = OrderedBits(0x00000000);
    int64_t prev_neg = OrderedBits(0x80000000);
    uint32_t num_failures = 0;
    for (int q = Decimal32::MinExponent; q <= Decimal32::MaxExponent; ++q)
    {
        for (uint32_t c = 1000000; c <= Decimal32::MaxCoefficient; c += gen_step(rng))
        {
            const int64_t pos = OrderedBits(Convert(false, q, c));
            const int64_t neg = OrderedBits(Convert(true, q, c));
            if (pos < prev_pos || neg > prev_neg)
                ++num_failures;
            prev_pos = pos;
            prev_neg = neg;
        }
    }
    CHECK(num_failures == 0);

    // The walk must have reached infinity.
    CHECK(prev_pos == OrderedBits(0x7F800000));
    CHECK(prev_neg == OrderedBits(0xFF800000));
}

//==================================================================================================
// Stages
//==================================================================================================

TEST_CASE("DecodeBid32")
{
    using namespace bidconv::impl;

    SECTION("small coefficient")
    {
        const auto d = DecodeBid32(Decimal32::Make(true, -5, 1).bits);
        CHECK(d.kind == Bid32Kind::finite);
        CHECK(d.sign);
        CHECK(d.exponent == -5);
        CHECK(d.coefficient == (1u << 23));
        CHECK(d.shift == 23);
    }

    SECTION("normalized")
    {
        const auto d = DecodeBid32(Decimal32::Make(false, 12, 1234567).bits);
        CHECK(d.kind == Bid32Kind::finite);
        CHECK(!d.sign);
        CHECK(d.exponent == 12);
        CHECK(d.coefficient >= (1u << 23));
        CHECK(d.coefficient <  (1u << 24));
        CHECK((d.coefficient >> d.shift) == 1234567);
        CHECK(d.coefficient == (1234567u << d.shift));
    }

    SECTION("large coefficient")
    {
        const auto d = DecodeBid32(Decimal32::Make(false, 90, 9999999).bits);
        CHECK(d.kind == Bid32Kind::finite);
        CHECK(d.exponent == 90);
        CHECK(d.coefficient == 9999999);
        CHECK(d.shift == 0);
    }

    SECTION("special")
    {
        CHECK(DecodeBid32(0x00000000).kind == Bid32Kind::zero);
        CHECK(DecodeBid32(0x6CBFFFFF).kind == Bid32Kind::zero); // 10485759: non-canonical
        CHECK(DecodeBid32(0x78000000).kind == Bid32Kind::infinity);

        const auto qnan = DecodeBid32(0xFC000010);
        CHECK(qnan.kind == Bid32Kind::nan);
        CHECK(qnan.sign);
        CHECK(!qnan.signaling);
        CHECK(qnan.payload == 16);

        const auto snan = DecodeBid32(0x7E0FFFFF); // payload 1048575: non-canonical
        CHECK(snan.kind == Bid32Kind::nan);
        CHECK(snan.signaling);
        CHECK(snan.payload == 0);
    }
}

TEST_CASE("MultiplyByReciprocal - breakpoint")
{
    using namespace bidconv::impl;

    // Coefficients are scaled to [2^48, 2^49). k = 89 + shift.
    for (int e = MinTableExponent; e <= MaxTableExponent; ++e)
    {
        const uint64_t bp = Breakpoint(e).hi;
        if (bp < (uint64_t{1} << 48) || bp + 1 >= (uint64_t{1} << 49))
            continue;

        const int k = 89 + 20;

        const auto at = MultiplyByReciprocal(bp, e, k);
        const auto above = MultiplyByReciprocal(bp + 1, e, k);
        const auto lowest = MultiplyByReciprocal(uint64_t{1} << 48, e, k);
        const auto highest = MultiplyByReciprocal((uint64_t{1} << 49) - 1, e, k);

        CHECK(!at.high_multiplier);
        CHECK(above.high_multiplier);
        CHECK(!lowest.high_multiplier);
        CHECK(highest.high_multiplier);

        // With the underflow shift disabled, the high branch has an exponent one larger.
        if (at.exponent > 1)
        {
            CHECK(above.exponent == at.exponent + 1);
            CHECK(at.exponent == BaseExponent(e) - k);

            // Both branches produce provisional significands in [2^23, 2^24).
            CHECK(at.z.w[5] >= (uint64_t{1} << 23));
            CHECK(at.z.w[5] <  (uint64_t{1} << 24));
            CHECK(above.z.w[5] >= (uint64_t{1} << 23));
            CHECK(above.z.w[5] <  (uint64_t{1} << 24));
            CHECK(lowest.z.w[5] >= (uint64_t{1} << 23));
            CHECK(highest.z.w[5] < (uint64_t{1} << 24));
        }
    }
}

TEST_CASE("MultiplyByReciprocal - underflow shift")
{
    using namespace bidconv::impl;

    // 1 * 10^-50: exponent 1 after compensation.
    const auto p = MultiplyByReciprocal(uint64_t{1} << 48, -50, 89 + 23);
    CHECK(p.exponent == 1);
    CHECK(p.z.w[5] < (uint64_t{1} << 23));

    // Exponents far below the subnormal range shift by at most 26 bits, leaving a zero
    // significand and a non-zero remainder below one half.
    const auto q = MultiplyByReciprocal((uint64_t{1} << 49) - 1, MinTableExponent, 89);
    CHECK(q.exponent == 1);
    CHECK(q.z.w[5] == 0);
    CHECK(q.z.w[4] != 0);
    CHECK(q.z.w[4] < 0x8000000000000000);
}

TEST_CASE("Tables")
{
    using namespace bidconv::impl;

    // e = 0: L = 48
    CHECK(Breakpoint(0).hi == 0x0001FFFFFFFFFFFF);
    CHECK(Breakpoint(0).lo == 0xFFFFFFFFFFFFFFFF);
    CHECK(BaseExponent(0) == 239);
    CHECK(Multiplier1(0).w[3] == 0x0000008000000000);
    CHECK(Multiplier1(0).w[2] == 0);
    CHECK(Multiplier1(0).w[1] == 0);
    CHECK(Multiplier1(0).w[0] == 0);

    // Base exponents grow by floor or ceil of log2(10) per decade.
    for (int e = MinTableExponent; e < MaxTableExponent; ++e)
    {
        const int delta = BaseExponent(e + 1) - BaseExponent(e);
        CHECK((delta == 3 || delta == 4));
    }

    // Round-to-nearest-even boundaries: (sign << 1) | parity
    CHECK(RoundBoundary(0).hi == 0x8000000000000000);
    CHECK(RoundBoundary(0).lo == 0);
    CHECK(RoundBoundary(1).hi == 0x7FFFFFFFFFFFFFFF);
    CHECK(RoundBoundary(1).lo == 0xFFFFFFFFFFFFFFFF);
    CHECK(RoundBoundary(2).hi == RoundBoundary(0).hi);
    CHECK(RoundBoundary(3).lo == RoundBoundary(1).lo);
}

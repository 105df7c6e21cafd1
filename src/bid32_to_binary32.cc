// Copyright 2020 Alexander Bolz
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "bidconv.h"
#include "bid32_impl.h"
#include "bid32_tables.h"
#include "binary32.h"
#include "decimal32.h"
#include "multiword.h"

#include <cstdint>

using namespace bidconv::impl;

using bidconv::Binary32;
using bidconv::Binary32Result;
using bidconv::Decimal32;
using bidconv::StatusFlags;

//==================================================================================================
// DecodeBid32
//==================================================================================================

DecodedBid32 bidconv::impl::DecodeBid32(uint32_t x)
{
    const Decimal32 d(x);

    DecodedBid32 r = {};
    r.sign = d.SignBit();

    if (d.HasLargeCoefficient())
    {
        if (!d.IsFinite())
        {
            if (d.IsInf())
            {
                r.kind = Bid32Kind::infinity;
                return r;
            }

            r.kind = Bid32Kind::nan;
            r.signaling = d.IsSignalingNaN();
            r.payload = d.NaNPayload();
            return r;
        }

        // 2^23 <= c < 2^24: already normalized.
        r.exponent = d.Exponent();
        r.coefficient = Decimal32::ImplicitCoefficientBit | (x & Decimal32::LargeCoefficientMask);
        r.shift = 0;

        if (r.coefficient > Decimal32::MaxCoefficient)
        {
            r.kind = Bid32Kind::zero;
            return r;
        }

        r.kind = Bid32Kind::finite;
        return r;
    }

    const uint32_t c = x & Decimal32::SmallCoefficientMask;
    if (c == 0)
    {
        r.kind = Bid32Kind::zero;
        return r;
    }

    r.kind = Bid32Kind::finite;
    r.exponent = d.Exponent();
    r.shift = CountLeadingZeros32(c) - 8;
    r.coefficient = c << r.shift;

    BIDCONV_ASSERT(r.coefficient >= (uint32_t{1} << 23));
    BIDCONV_ASSERT(r.coefficient <  (uint32_t{1} << 24));
    return r;
}

//==================================================================================================
// MultiplyByReciprocal
//==================================================================================================

// Underflow compensation stops at precision + 2 bits. Shifting further would only move bits
// that already lie entirely below the rounding position.
static constexpr int MaxUnderflowShift = 26;

ReciprocalProduct bidconv::impl::MultiplyByReciprocal(uint64_t c, int e, int k)
{
    BIDCONV_ASSERT(c >= (uint64_t{1} << 48));
    BIDCONV_ASSERT(c <  (uint64_t{1} << 49));

    ReciprocalProduct p;

    p.exponent = BaseExponent(e) - k;
    p.high_multiplier = !LessEqual128({c, 0}, Breakpoint(e));

    Uint256 const& r = p.high_multiplier ? Multiplier2(e) : Multiplier1(e);
    if (p.high_multiplier)
        p.exponent++;

    const Uint320 product = Mul64x256(c, r);

    // Left-align the product in 384 bits to make room for the underflow shift.
    p.z.w[0] = 0;
    p.z.w[1] = product.w[0];
    p.z.w[2] = product.w[1];
    p.z.w[3] = product.w[2];
    p.z.w[4] = product.w[3];
    p.z.w[5] = product.w[4];

    if (p.exponent < 1)
    {
        int d = 1 - p.exponent;
        if (d > MaxUnderflowShift)
            d = MaxUnderflowShift;

        p.exponent = 1;
        p.z = ShiftRight384(p.z, d);
    }

    return p;
}

//==================================================================================================
// RoundAndPack
//==================================================================================================

Binary32Result bidconv::impl::RoundAndPack(bool sign, ReciprocalProduct const& p)
{
    static constexpr uint64_t HiddenBit = Binary32::HiddenBit;

    uint64_t significand = p.z.w[5];
    int exponent = p.exponent;

    BIDCONV_ASSERT(significand < 2 * HiddenBit);

    const uint64x2 round_sticky = {p.z.w[4], p.z.w[3]};

    // Only round-to-nearest-even is supported; rows for other rounding modes would follow at
    // index 4 * mode.
    const int index = (sign ? 2 : 0) + static_cast<int>(significand & 1);
    if (Less128(RoundBoundary(index), round_sticky))
    {
        significand++;
        if (significand == 2 * HiddenBit)
        {
            significand = HiddenBit;
            exponent++;
        }
    }

    if (exponent >= static_cast<int>(Binary32::MaxBiasedExponent))
    {
        return {Binary32::Infinity(sign).bits, StatusFlags::overflow | StatusFlags::inexact};
    }

    if (significand < HiddenBit)
    {
        // Subnormal or zero.
        exponent = 0;
    }
    else
    {
        significand &= Binary32::SignificandMask;
    }

    uint32_t flags = StatusFlags::none;
    if (round_sticky.hi != 0 || round_sticky.lo != 0)
    {
        flags |= StatusFlags::inexact;
        if (exponent == 0)
            flags |= StatusFlags::underflow;
    }

    const auto bits = Binary32::Make(sign, static_cast<uint32_t>(exponent), static_cast<uint32_t>(significand)).bits;
    return {bits, flags};
}

//==================================================================================================
// Decimal32ToBinary32
//==================================================================================================

Binary32Result bidconv::Decimal32ToBinary32(uint32_t x)
{
    const DecodedBid32 d = DecodeBid32(x);

    switch (d.kind)
    {
    case Bid32Kind::zero:
        return {Binary32::Zero(d.sign).bits, StatusFlags::none};
    case Bid32Kind::infinity:
        return {Binary32::Infinity(d.sign).bits, StatusFlags::none};
    case Bid32Kind::nan:
        return {Binary32::QuietNaN(d.sign, d.payload).bits, d.signaling ? StatusFlags::invalid : StatusFlags::none};
    case Bid32Kind::finite:
        break;
    }

    // Scale the coefficient from [2^23, 2^24) to [2^112, 2^113). The low 64 bits of the
    // 128-bit coefficient are zero, so only the high word is carried along.
    const uint64_t c = uint64_t{d.coefficient} << 25;
    const int k = d.shift + 89;

    // 10^39 > 2^128 = (max + ulp(max)), so these values overflow even with coefficient 1.
    if (d.exponent > MaxTableExponent)
    {
        return {Binary32::Infinity(d.sign).bits, StatusFlags::overflow | StatusFlags::inexact};
    }

    // For e <= -80, 10^e * 9999999 < 2^-151: everything rounds to zero, and clamping keeps the
    // round/sticky words non-zero.
    const int e = d.exponent < MinTableExponent ? MinTableExponent : d.exponent;

    return RoundAndPack(d.sign, MultiplyByReciprocal(c, e, k));
}

uint32_t bidconv::Decimal32ToBinary32Bits(uint32_t x)
{
    return Decimal32ToBinary32(x).bits;
}

float bidconv::Decimal32ToFloat(uint32_t x)
{
    return Decimal32ToBinary32(x).Value();
}

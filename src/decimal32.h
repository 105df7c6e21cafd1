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

#pragma once

#include "bidconv_config.h"

#include <cstdint>

namespace bidconv {

// An IEEE 754-2008 decimal32 value in the binary integer decimal (BID) encoding.
//
// Finite values are (-1)^s * c * 10^q with 0 <= c <= 9999999 and -101 <= q <= 90.
// Two layouts exist for finite values:
//
//  s 00..10 eeeeee ccccccccccccccccccccccc     (c < 2^23)
//  s 11 eeeeeeee ccccccccccccccccccccc         (c = 2^23 + trailing 21 bits)
//
// Coefficients > 9999999 in the second layout are non-canonical and read as 0.
struct Decimal32
{
    using bits_type = uint32_t;

    static constexpr int       Precision          = 7;
    static constexpr int       ExponentBias       = 101;
    static constexpr int       MinExponent        = -101; // = q_min
    static constexpr int       MaxExponent        = 90;   // = q_max
    static constexpr bits_type MaxCoefficient     = 9999999;
    static constexpr bits_type MaxNaNPayload      = 999999;

    static constexpr bits_type SignMask           = 0x80000000;
    static constexpr bits_type SpecialEncodingMask = 0x60000000; // G0 G1 = 11
    static constexpr bits_type InfinityMask       = 0x78000000;
    static constexpr bits_type NaNMask            = 0x7C000000;
    static constexpr bits_type SignalingNaNMask   = 0x7E000000;
    static constexpr bits_type NaNPayloadMask     = 0x000FFFFF;

    static constexpr int       SmallCoefficientBits = 23; // explicit coefficient bits, layout B
    static constexpr int       LargeCoefficientBits = 21; // trailing coefficient bits, layout A
    static constexpr bits_type SmallCoefficientMask = (bits_type{1} << SmallCoefficientBits) - 1;
    static constexpr bits_type LargeCoefficientMask = (bits_type{1} << LargeCoefficientBits) - 1;
    static constexpr bits_type ImplicitCoefficientBit = bits_type{1} << SmallCoefficientBits;

    bits_type bits;

    explicit Decimal32(bits_type bits_) : bits(bits_) {}

    // Returns the canonical encoding of (-1)^sign * coefficient * 10^exponent.
    static Decimal32 Make(bool sign, int exponent, bits_type coefficient)
    {
        BIDCONV_ASSERT(exponent >= MinExponent);
        BIDCONV_ASSERT(exponent <= MaxExponent);
        BIDCONV_ASSERT(coefficient <= MaxCoefficient);

        const bits_type s = sign ? SignMask : 0;
        const bits_type q = static_cast<bits_type>(exponent + ExponentBias);

        if (coefficient < ImplicitCoefficientBit)
            return Decimal32(s | (q << SmallCoefficientBits) | coefficient);

        return Decimal32(s | SpecialEncodingMask | (q << LargeCoefficientBits) | (coefficient & LargeCoefficientMask));
    }

    static Decimal32 Infinity(bool sign) {
        return Decimal32((sign ? SignMask : 0) | InfinityMask);
    }

    static Decimal32 QuietNaN(bool sign, bits_type payload = 0) {
        return Decimal32((sign ? SignMask : 0) | NaNMask | (payload & NaNPayloadMask));
    }

    static Decimal32 SignalingNaN(bool sign, bits_type payload = 0) {
        return Decimal32((sign ? SignMask : 0) | SignalingNaNMask | (payload & NaNPayloadMask));
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    bool HasLargeCoefficient() const {
        return (bits & SpecialEncodingMask) == SpecialEncodingMask;
    }

    bool IsFinite() const {
        return (bits & InfinityMask) != InfinityMask;
    }

    bool IsInf() const {
        return (bits & NaNMask) == InfinityMask;
    }

    bool IsNaN() const {
        return (bits & NaNMask) == NaNMask;
    }

    bool IsSignalingNaN() const {
        return (bits & SignalingNaNMask) == SignalingNaNMask;
    }

    // Returns the biased exponent.
    // PRE: IsFinite()
    bits_type BiasedExponent() const {
        BIDCONV_ASSERT(IsFinite());
        return HasLargeCoefficient()
            ? (bits >> LargeCoefficientBits) & 0xFF
            : (bits >> SmallCoefficientBits) & 0xFF;
    }

    // Returns the unbiased exponent q.
    // PRE: IsFinite()
    int Exponent() const {
        return static_cast<int>(BiasedExponent()) - ExponentBias;
    }

    // Returns the coefficient c. Non-canonical coefficients are returned as 0.
    // PRE: IsFinite()
    bits_type Coefficient() const {
        BIDCONV_ASSERT(IsFinite());
        if (!HasLargeCoefficient())
            return bits & SmallCoefficientMask;

        const bits_type c = ImplicitCoefficientBit | (bits & LargeCoefficientMask);
        return c <= MaxCoefficient ? c : 0;
    }

    bool IsZero() const {
        return IsFinite() && Coefficient() == 0;
    }

    // A finite value is canonical iff its coefficient is in range. NaN payloads must be in
    // range and the unused bits of the special encodings must be zero.
    bool IsCanonical() const {
        if (IsNaN())
            return (bits & 0x01F00000) == 0 && (bits & NaNPayloadMask) <= MaxNaNPayload;
        if (IsInf())
            return (bits & 0x03FFFFFF) == 0;
        return !HasLargeCoefficient() || (ImplicitCoefficientBit | (bits & LargeCoefficientMask)) <= MaxCoefficient;
    }

    // Returns the NaN payload, or 0 if the payload is non-canonical.
    // PRE: IsNaN()
    bits_type NaNPayload() const {
        BIDCONV_ASSERT(IsNaN());
        const bits_type payload = bits & NaNPayloadMask;
        return payload <= MaxNaNPayload ? payload : 0;
    }
};

// NaNs propagate unchanged.
inline Decimal32 Negate(Decimal32 x)
{
    return x.IsNaN() ? x : Decimal32(x.bits ^ Decimal32::SignMask);
}

} // namespace bidconv

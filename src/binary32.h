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
#include <cstring>
#include <limits>

namespace bidconv {

namespace impl {

template <typename Dest, typename Source>
inline Dest ReinterpretBits(Source source)
{
    static_assert(sizeof(Dest) == sizeof(Source), "size mismatch");

    Dest dest;
    std::memcpy(&dest, &source, sizeof(Source));
    return dest;
}

} // namespace impl

// An IEEE 754 binary32 bit pattern.
struct Binary32
{
    static_assert(std::numeric_limits<float>::is_iec559
               && std::numeric_limits<float>::digits == 24
               && std::numeric_limits<float>::max_exponent == 128,
        "IEEE-754 single-precision implementation required");

    using value_type = float;
    using bits_type = uint32_t;

    static constexpr int       SignificandSize = std::numeric_limits<value_type>::digits; // = p   (includes the hidden bit)
    static constexpr bits_type MaxBiasedExponent = 2 * std::numeric_limits<value_type>::max_exponent - 1; // = 255
    static constexpr bits_type HiddenBit       = bits_type{1} << (SignificandSize - 1);   // = 2^(p-1)
    static constexpr bits_type SignificandMask = HiddenBit - 1;                           // = 2^(p-1) - 1
    static constexpr bits_type ExponentMask    = MaxBiasedExponent << (SignificandSize - 1);
    static constexpr bits_type SignMask        = ~(~bits_type{0} >> 1);
    static constexpr bits_type QuietBit        = HiddenBit >> 1;

    bits_type bits;

    explicit Binary32(bits_type bits_) : bits(bits_) {}
    explicit Binary32(value_type value) : bits(impl::ReinterpretBits<bits_type>(value)) {}

    // Packs the given fields.
    // The significand must not include the hidden bit.
    static Binary32 Make(bool sign, bits_type biased_exponent, bits_type significand)
    {
        BIDCONV_ASSERT(biased_exponent <= MaxBiasedExponent);
        BIDCONV_ASSERT(significand <= SignificandMask);

        return Binary32((sign ? SignMask : 0) | (biased_exponent << (SignificandSize - 1)) | significand);
    }

    static Binary32 Zero(bool sign) {
        return Make(sign, 0, 0);
    }

    static Binary32 Infinity(bool sign) {
        return Make(sign, MaxBiasedExponent, 0);
    }

    // Returns a quiet NaN carrying the given 20-bit decimal payload. The payload is
    // left-aligned in the 22 bits below the quiet bit.
    static Binary32 QuietNaN(bool sign, bits_type payload)
    {
        BIDCONV_ASSERT(payload < (bits_type{1} << 20));

        return Make(sign, MaxBiasedExponent, QuietBit | (payload << 2));
    }

    bits_type PhysicalSignificand() const {
        return bits & SignificandMask;
    }

    bits_type PhysicalExponent() const {
        return (bits & ExponentMask) >> (SignificandSize - 1);
    }

    bool IsFinite() const {
        return (bits & ExponentMask) != ExponentMask;
    }

    bool IsInf() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) == 0;
    }

    bool IsNaN() const {
        return (bits & ExponentMask) == ExponentMask && (bits & SignificandMask) != 0;
    }

    bool IsQuietNaN() const {
        return IsNaN() && (bits & QuietBit) != 0;
    }

    bool IsSubnormal() const {
        return (bits & ExponentMask) == 0 && (bits & SignificandMask) != 0;
    }

    bool IsZero() const {
        return (bits & ~SignMask) == 0;
    }

    bool SignBit() const {
        return (bits & SignMask) != 0;
    }

    value_type Value() const {
        return impl::ReinterpretBits<value_type>(bits);
    }
};

} // namespace bidconv

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

#include "bidconv.h"
#include "multiword.h"

namespace bidconv {
namespace impl {

enum class Bid32Kind {
    finite,
    zero,
    infinity,
    nan,
};

// Result of unpacking a decimal32 value.
//
// For finite values: x = (-1)^sign * 10^exponent * coefficient / 2^shift,
// with 2^23 <= coefficient < 2^24.
struct DecodedBid32
{
    Bid32Kind kind;
    bool sign;
    bool signaling;     // nan only
    uint32_t payload;   // nan only, 0 if non-canonical
    int exponent;
    uint32_t coefficient;
    int shift;
};

DecodedBid32 DecodeBid32(uint32_t x);

// Output of the reciprocal multiplication.
//
// z.w[5] holds the provisional significand, z.w[4] and z.w[3] the round/sticky words.
// exponent is the provisional biased binary32 exponent (>= 1).
struct ReciprocalProduct
{
    Uint384 z;
    int exponent;
    bool high_multiplier;
};

// Computes 10^e * c / 2^k scaled to a provisional 24-bit significand, compensating exponent
// underflow by shifting the product right (by at most 26 bits).
//
// PRE: 2^48 <= c < 2^49, i.e. c * 2^64 is in [2^112, 2^113)
// PRE: MinTableExponent <= e <= MaxTableExponent
ReciprocalProduct MultiplyByReciprocal(uint64_t c, int e, int k);

// Applies round-to-nearest-even and packs the binary32 result.
Binary32Result RoundAndPack(bool sign, ReciprocalProduct const& p);

} // namespace impl
} // namespace bidconv

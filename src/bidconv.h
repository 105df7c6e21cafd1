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

#include "binary32.h"

#include <cstdint>

namespace bidconv {

// IEEE 754 exception flags, using the bit values of the Intel decimal floating-point library.
struct StatusFlags
{
    static constexpr uint32_t none      = 0x00;
    static constexpr uint32_t invalid   = 0x01;
    static constexpr uint32_t overflow  = 0x08;
    static constexpr uint32_t underflow = 0x10;
    static constexpr uint32_t inexact   = 0x20;
};

struct Binary32Result
{
    uint32_t bits;
    uint32_t flags; // StatusFlags

    float Value() const {
        return Binary32(bits).Value();
    }
};

// Binary32Result result = Decimal32ToBinary32(x);
//
// Converts the given decimal32 value (BID encoding) into the nearest binary32 value, using
// round-to-nearest-even.
//
//  - Zeros (including non-canonical encodings) convert to zeros of the same sign.
//  - Infinities convert to infinities of the same sign.
//  - NaNs convert to quiet NaNs of the same sign. The decimal payload is left-aligned in the
//    binary payload; non-canonical payloads (> 999999) become 0.
//    Signaling NaNs raise StatusFlags::invalid.
//  - Finite values too large for binary32 convert to infinity and raise overflow and inexact.
//
// StatusFlags::inexact is raised whenever the result differs from the decimal value,
// StatusFlags::underflow if additionally the packed result is subnormal or zero. Tininess is
// detected on the exponent-bounded result; no decimal32 value lies close enough below FLT_MIN
// for this to differ from detection with an unbounded exponent.
Binary32Result Decimal32ToBinary32(uint32_t x);

// Returns Decimal32ToBinary32(x).bits.
uint32_t Decimal32ToBinary32Bits(uint32_t x);

// Returns Decimal32ToBinary32(x).Value().
float Decimal32ToFloat(uint32_t x);

} // namespace bidconv

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
#if defined(_MSC_VER)
#include <intrin.h>
#endif

namespace bidconv {
namespace impl {

//==================================================================================================
// Fixed-width unsigned integers
//
// Wider values are stored as arrays of 64-bit words, least significant word first.
//==================================================================================================

struct uint64x2
{
    uint64_t hi;
    uint64_t lo;
};

struct Uint256 { uint64_t w[4]; };
struct Uint320 { uint64_t w[5]; };
struct Uint384 { uint64_t w[6]; };

struct AddResult
{
    uint64_t sum;
    uint64_t carry; // 0 or 1
};

inline uint32_t Lo32(uint64_t x)
{
    return static_cast<uint32_t>(x);
}

inline uint32_t Hi32(uint64_t x)
{
    return static_cast<uint32_t>(x >> 32);
}

// Returns the full 128-bit product a * b.
BIDCONV_FORCE_INLINE uint64x2 Mul128(uint64_t a, uint64_t b)
{
#if BIDCONV_USE_INTRINSICS() && defined(__SIZEOF_INT128__)

    __extension__ using uint128_t = unsigned __int128;

    const uint128_t p = uint128_t{a} * b;
    return {static_cast<uint64_t>(p >> 64), static_cast<uint64_t>(p)};

#elif BIDCONV_USE_INTRINSICS() && defined(_MSC_VER) && defined(_M_X64)

    uint64_t hi;
    const uint64_t lo = _umul128(a, b, &hi);
    return {hi, lo};

#else

    // p = (a_lo + 2^32 a_hi) (b_lo + 2^32 b_hi)
    //   = b00 + 2^32 (b01 + b10) + 2^64 b11
    const uint64_t b00 = uint64_t{Lo32(a)} * Lo32(b);
    const uint64_t b01 = uint64_t{Lo32(a)} * Hi32(b);
    const uint64_t b10 = uint64_t{Hi32(a)} * Lo32(b);
    const uint64_t b11 = uint64_t{Hi32(a)} * Hi32(b);

    // Neither sum can overflow: each is at most (2^32-1)^2 + 2 (2^32-1) < 2^64.
    const uint64_t mid1 = b10 + Hi32(b00);
    const uint64_t mid2 = b01 + Lo32(mid1);

    const uint64_t hi = b11 + Hi32(mid1) + Hi32(mid2);
    const uint64_t lo = Lo32(b00) | uint64_t{Lo32(mid2)} << 32;
    return {hi, lo};

#endif
}

// Returns x + y and the carry out of bit 63.
inline AddResult AddCarryOut(uint64_t x, uint64_t y)
{
    const uint64_t sum = x + y;
    return {sum, sum < x ? 1u : 0u};
}

// Returns x + y + carry_in and the carry out of bit 63.
// PRE: carry_in is 0 or 1
inline AddResult AddCarryInOut(uint64_t x, uint64_t y, uint64_t carry_in)
{
    BIDCONV_ASSERT(carry_in <= 1);

    const uint64_t x1 = x + carry_in;
    const uint64_t sum = x1 + y;
    return {sum, (sum < x1 || x1 < carry_in) ? 1u : 0u};
}

// Returns the full 320-bit product a * b.
inline Uint320 Mul64x256(uint64_t a, Uint256 const& b)
{
    const uint64x2 p0 = Mul128(a, b.w[0]);
    const uint64x2 p1 = Mul128(a, b.w[1]);
    const uint64x2 p2 = Mul128(a, b.w[2]);
    const uint64x2 p3 = Mul128(a, b.w[3]);

    const AddResult s1 = AddCarryOut(p1.lo, p0.hi);
    const AddResult s2 = AddCarryInOut(p2.lo, p1.hi, s1.carry);
    const AddResult s3 = AddCarryInOut(p3.lo, p2.hi, s2.carry);

    // p3.hi <= 2^64 - 2, so adding the final carry cannot overflow.
    return {{p0.lo, s1.sum, s2.sum, s3.sum, p3.hi + s3.carry}};
}

// Returns z >> n.
// PRE: 1 <= n <= 63
inline Uint384 ShiftRight384(Uint384 const& z, int n)
{
    BIDCONV_ASSERT(n >= 1);
    BIDCONV_ASSERT(n <= 63);

    Uint384 r;
    for (int i = 0; i < 5; ++i)
    {
        r.w[i] = (z.w[i + 1] << (64 - n)) | (z.w[i] >> n);
    }
    r.w[5] = z.w[5] >> n;
    return r;
}

// Returns x < y.
inline bool Less128(uint64x2 x, uint64x2 y)
{
    return x.hi < y.hi || (x.hi == y.hi && x.lo < y.lo);
}

// Returns x <= y.
inline bool LessEqual128(uint64x2 x, uint64x2 y)
{
    return x.hi < y.hi || (x.hi == y.hi && x.lo <= y.lo);
}

// Returns the number of leading 0-bits in x, starting at the most significant bit position.
// PRE: x != 0
inline int CountLeadingZeros32(uint32_t x)
{
    BIDCONV_ASSERT(x != 0);

#if defined(_MSC_VER)
    unsigned long index;
    _BitScanReverse(&index, x);
    return 31 - static_cast<int>(index);
#elif defined(__GNUC__)
    return __builtin_clz(x);
#else
    int lz = 0;
    while ((x >> 31) == 0) {
        x <<= 1;
        ++lz;
    }
    return lz;
#endif
}

} // namespace impl
} // namespace bidconv

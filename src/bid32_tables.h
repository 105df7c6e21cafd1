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

#include "multiword.h"

namespace bidconv {
namespace impl {

// Range of decimal exponents covered by the reciprocal tables.
// Exponents >= MaxTableExponent + 1 always overflow, exponents < MinTableExponent are clamped.
static constexpr int MinTableExponent = -80;
static constexpr int MaxTableExponent =  38;

// Largest coefficient (scaled to [2^112, 2^113)) that uses Multiplier1(e).
uint64x2 Breakpoint(int e);

// Biased binary32 exponent of 10^e * c / 2^k, plus k, for c <= Breakpoint(e).
int BaseExponent(int e);

// ceil(10^e * 2^(279 - L)) and ceil(10^e * 2^(278 - L)), where L = floor(log2(2^48 * 10^e)).
Uint256 const& Multiplier1(int e);
Uint256 const& Multiplier2(int e);

// Round-to-nearest-even boundaries, indexed by (sign << 1) | (significand & 1).
// The significand is rounded up iff the round/sticky words compare greater.
uint64x2 RoundBoundary(int index);

} // namespace impl
} // namespace bidconv

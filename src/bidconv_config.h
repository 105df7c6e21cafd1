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

#include <cassert>

#ifndef BIDCONV_ASSERT
#define BIDCONV_ASSERT(X) assert(X)
#endif

#ifndef BIDCONV_FORCE_INLINE
#if defined(_MSC_VER)
#define BIDCONV_FORCE_INLINE __forceinline
#elif defined(__GNUC__)
#define BIDCONV_FORCE_INLINE __attribute__((always_inline)) inline
#else
#define BIDCONV_FORCE_INLINE inline
#endif
#endif

// 1: use unsigned __int128 or _umul128 for 64x64-bit products where available.
// 0: use 32x32-bit partial products only.
#ifndef BIDCONV_USE_INTRINSICS
#define BIDCONV_USE_INTRINSICS() 1
#endif

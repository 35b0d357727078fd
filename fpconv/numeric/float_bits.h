//
// Copyright 2026 The fpconv Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//
// -----------------------------------------------------------------------------
// File: float_bits.h
// -----------------------------------------------------------------------------
//
// This header describes the IEEE-754 binary interchange formats supported by
// fpconv (binary16, binary32 and binary64) and the operations that take a raw
// bit pattern of one of those formats apart.
//
// Bit patterns are always carried in a `uint64_t`, right aligned, whatever the
// width. A binary16 value occupies the low 16 bits, a binary32 value the low
// 32 bits.

#ifndef FPCONV_NUMERIC_FLOAT_BITS_H_
#define FPCONV_NUMERIC_FLOAT_BITS_H_

#include <cstdint>

#include "fpconv/base/config.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

// FloatWidth
//
// The closed set of supported storage widths, in bits.
enum class FloatWidth : int {
  k16 = 16,
  k32 = 32,
  k64 = 64,
};

// FloatInfo
//
// The layout of a binary format: the number of explicit mantissa bits, the
// number of exponent bits and the exponent bias. `bias` is stored negated so
// that `field + bias` is the unbiased exponent.
struct FloatInfo {
  int mantissa_bits;
  int exponent_bits;
  int bias;
};

// GetFloatInfo()
//
// Returns the layout of `width`.
constexpr FloatInfo GetFloatInfo(FloatWidth width) {
  switch (width) {
    case FloatWidth::k16:
      return FloatInfo{10, 5, -15};
    case FloatWidth::k32:
      return FloatInfo{23, 8, -127};
    case FloatWidth::k64:
      break;
  }
  return FloatInfo{52, 11, -1023};
}

// FloatWidthFromBits()
//
// Maps a bit count to a `FloatWidth`. Any value other than 16, 32 or 64 is a
// programming error: it is logged at FATAL severity and the process aborts.
FloatWidth FloatWidthFromBits(int bits);

// FloatClass
//
// The category of a decoded bit pattern.
enum class FloatClass {
  kZero,
  kDenormal,
  kNormal,
  kInfinity,
  kNaN,
};

// DecomposedFloat
//
// A decoded bit pattern. For finite values the magnitude is exactly
// `mantissa * 2^(exponent - mantissa_bits)`. Normal values carry their
// implicit leading bit in `mantissa`; zeros and denormals use the minimum
// normal exponent `bias + 1`.
struct DecomposedFloat {
  uint64_t mantissa;
  int exponent;
  bool negative;
  FloatClass kind;
};

// Decompose()
//
// Splits `bits` into sign, exponent and mantissa according to `width`. Bits
// above the width are ignored.
DecomposedFloat Decompose(uint64_t bits, FloatWidth width);

// FloatToBits()
//
// Returns the bit pattern of `value` rounded to `width` with
// round-to-nearest-even. Values beyond the largest finite number of the width
// become infinities; NaNs stay NaNs.
uint64_t FloatToBits(double value, FloatWidth width);

// BitsToDouble()
//
// Returns the `double` equal to the value encoded by `bits`. The conversion is
// exact for every width.
double BitsToDouble(uint64_t bits, FloatWidth width);

namespace float_bits_internal {

// Rounds `value` to the nearest binary16 and returns its bit pattern.
uint16_t DoubleToBinary16(double value);

}  // namespace float_bits_internal

FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_NUMERIC_FLOAT_BITS_H_

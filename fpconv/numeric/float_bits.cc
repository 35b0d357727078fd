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

#include "fpconv/numeric/float_bits.h"

#include <cmath>
#include <cstdint>
#include <limits>

#include "absl/base/casts.h"
#include "absl/base/internal/raw_logging.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

static_assert(std::numeric_limits<double>::is_iec559 &&
                  std::numeric_limits<double>::digits == 53,
              "fpconv requires IEEE binary64 doubles");
static_assert(std::numeric_limits<float>::is_iec559 &&
                  std::numeric_limits<float>::digits == 24,
              "fpconv requires IEEE binary32 floats");

FloatWidth FloatWidthFromBits(int bits) {
  switch (bits) {
    case 16:
      return FloatWidth::k16;
    case 32:
      return FloatWidth::k32;
    case 64:
      return FloatWidth::k64;
    default:
      ABSL_RAW_LOG(FATAL, "fpconv: unsupported float width %d bits", bits);
  }
  return FloatWidth::k64;  // Not reached.
}

DecomposedFloat Decompose(uint64_t bits, FloatWidth width) {
  const FloatInfo info = GetFloatInfo(width);
  const uint64_t exponent_mask = (uint64_t{1} << info.exponent_bits) - 1;
  const uint64_t mantissa_mask = (uint64_t{1} << info.mantissa_bits) - 1;

  DecomposedFloat out;
  out.negative =
      ((bits >> (info.exponent_bits + info.mantissa_bits)) & 1) != 0;
  int exp = static_cast<int>((bits >> info.mantissa_bits) & exponent_mask);
  out.mantissa = bits & mantissa_mask;

  if (static_cast<uint64_t>(exp) == exponent_mask) {
    out.kind = out.mantissa != 0 ? FloatClass::kNaN : FloatClass::kInfinity;
  } else if (exp == 0) {
    // No implicit bit; denormals share the minimum normal exponent.
    exp = 1;
    out.kind = out.mantissa != 0 ? FloatClass::kDenormal : FloatClass::kZero;
  } else {
    out.mantissa |= uint64_t{1} << info.mantissa_bits;
    out.kind = FloatClass::kNormal;
  }
  out.exponent = exp + info.bias;
  return out;
}

namespace float_bits_internal {

uint16_t DoubleToBinary16(double value) {
  constexpr FloatInfo kDouble = GetFloatInfo(FloatWidth::k64);
  constexpr FloatInfo kHalf = GetFloatInfo(FloatWidth::k16);

  const uint64_t bits = absl::bit_cast<uint64_t>(value);
  const DecomposedFloat d = Decompose(bits, FloatWidth::k64);
  const uint16_t sign = d.negative ? uint16_t{0x8000} : uint16_t{0};

  switch (d.kind) {
    case FloatClass::kNaN:
      return sign | uint16_t{0x7e00};
    case FloatClass::kInfinity:
      return sign | uint16_t{0x7c00};
    case FloatClass::kZero:
    case FloatClass::kDenormal:
      // binary64 denormals are far below half the smallest binary16 denormal.
      return sign;
    case FloatClass::kNormal:
      break;
  }

  const int min_exp = kHalf.bias + 1;
  int exp = d.exponent < min_exp ? min_exp : d.exponent;
  const int shift =
      kDouble.mantissa_bits - kHalf.mantissa_bits + (exp - d.exponent);
  if (shift >= 64) return sign;
  if (exp > -kHalf.bias) return sign | uint16_t{0x7c00};

  uint64_t mant = d.mantissa >> shift;
  const uint64_t rem = d.mantissa & ((uint64_t{1} << shift) - 1);
  const uint64_t half = uint64_t{1} << (shift - 1);
  if (rem > half || (rem == half && (mant & 1) != 0)) ++mant;
  if (mant == uint64_t{2} << kHalf.mantissa_bits) {
    mant >>= 1;
    ++exp;
    if (exp > -kHalf.bias) return sign | uint16_t{0x7c00};
  }

  const uint64_t implicit = uint64_t{1} << kHalf.mantissa_bits;
  const uint64_t field =
      (mant & implicit) != 0 ? static_cast<uint64_t>(exp - kHalf.bias) : 0;
  return static_cast<uint16_t>(sign | (field << kHalf.mantissa_bits) |
                               (mant & (implicit - 1)));
}

}  // namespace float_bits_internal

uint64_t FloatToBits(double value, FloatWidth width) {
  switch (width) {
    case FloatWidth::k16:
      return float_bits_internal::DoubleToBinary16(value);
    case FloatWidth::k32:
      return absl::bit_cast<uint32_t>(static_cast<float>(value));
    case FloatWidth::k64:
      break;
  }
  return absl::bit_cast<uint64_t>(value);
}

double BitsToDouble(uint64_t bits, FloatWidth width) {
  if (width == FloatWidth::k64) return absl::bit_cast<double>(bits);

  const FloatInfo info = GetFloatInfo(width);
  const DecomposedFloat d = Decompose(bits, width);
  double magnitude;
  switch (d.kind) {
    case FloatClass::kNaN:
      magnitude = std::numeric_limits<double>::quiet_NaN();
      break;
    case FloatClass::kInfinity:
      magnitude = std::numeric_limits<double>::infinity();
      break;
    default:
      magnitude = std::ldexp(static_cast<double>(d.mantissa),
                             d.exponent - info.mantissa_bits);
      break;
  }
  return d.negative ? -magnitude : magnitude;
}

FPCONV_NAMESPACE_END
}  // namespace fpconv

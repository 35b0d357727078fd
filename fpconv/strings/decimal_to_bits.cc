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

#include "fpconv/strings/decimal_to_bits.h"

#include <cstdint>

#include "absl/base/casts.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

namespace {

// Binary shift that brings a decimal with |decimal_point| == i closer to
// [0.5, 1) without overshooting: kPowTab[i] is about i * log2(10), rounded
// down.
constexpr int kPowTab[] = {1, 3, 6, 9, 13, 16, 19, 23, 26};
constexpr int kPowTabSize = sizeof(kPowTab) / sizeof(kPowTab[0]);
constexpr int kMaxStep = 27;

// Past these decimal exponents every supported width is certain to overflow
// or underflow.
constexpr int kOverflowDecimalPoint = 310;
constexpr int kUnderflowDecimalPoint = -330;

int ShiftFor(int decimal_point_magnitude) {
  return decimal_point_magnitude < kPowTabSize
             ? kPowTab[decimal_point_magnitude]
             : kMaxStep;
}

uint64_t Assemble(uint64_t mantissa, int exp, bool negative,
                  const FloatInfo& info) {
  const uint64_t exponent_mask = (uint64_t{1} << info.exponent_bits) - 1;
  uint64_t bits = mantissa & ((uint64_t{1} << info.mantissa_bits) - 1);
  bits |= (static_cast<uint64_t>(exp - info.bias) & exponent_mask)
          << info.mantissa_bits;
  if (negative) {
    bits |= uint64_t{1} << (info.mantissa_bits + info.exponent_bits);
  }
  return bits;
}

}  // namespace

DecimalToBitsResult DecimalToBits(const Decimal& d, FloatWidth width) {
  const FloatInfo info = GetFloatInfo(width);
  const int min_exp = info.bias + 1;
  const int overflow_biased_exp = (1 << info.exponent_bits) - 1;
  const uint64_t infinity_bits =
      Assemble(0, overflow_biased_exp + info.bias, d.negative(), info);

  if (d.empty() || d.decimal_point() < kUnderflowDecimalPoint) {
    return {Assemble(0, info.bias, d.negative(), info), false};
  }
  if (d.decimal_point() > kOverflowDecimalPoint) {
    return {infinity_bits, true};
  }

  Decimal x = d;

  // Scale by powers of two until the value is in [0.5, 1).
  int exp = 0;
  while (x.decimal_point() > 0) {
    const int n = ShiftFor(x.decimal_point());
    x.Shift(-n);
    exp += n;
  }
  while (x.decimal_point() < 0 ||
         (x.decimal_point() == 0 && x.digits()[0] < '5')) {
    const int n = ShiftFor(-x.decimal_point());
    x.Shift(n);
    exp -= n;
  }

  // The binary formats normalize to [1, 2).
  --exp;

  // Below the minimum normal exponent, denormalize.
  if (exp < min_exp) {
    const int n = min_exp - exp;
    x.Shift(-n);
    exp += n;
  }

  if (exp - info.bias >= overflow_biased_exp) {
    return {infinity_bits, true};
  }

  // Extract 1 + mantissa_bits bits.
  x.Shift(1 + info.mantissa_bits);
  uint64_t mantissa = x.RoundedInteger();

  // Rounding can carry into a new leading bit.
  if (mantissa == uint64_t{2} << info.mantissa_bits) {
    mantissa >>= 1;
    ++exp;
    if (exp - info.bias >= overflow_biased_exp) {
      return {infinity_bits, true};
    }
  }

  // No implicit bit: denormal.
  if ((mantissa & (uint64_t{1} << info.mantissa_bits)) == 0) {
    exp = info.bias;
  }

  return {Assemble(mantissa, exp, d.negative(), info), false};
}

double DecimalToDouble(const Decimal& d, bool* overflow) {
  const DecimalToBitsResult r = DecimalToBits(d, FloatWidth::k64);
  if (overflow != nullptr) *overflow = r.overflow;
  return absl::bit_cast<double>(r.bits);
}

float DecimalToFloat(const Decimal& d, bool* overflow) {
  const DecimalToBitsResult r = DecimalToBits(d, FloatWidth::k32);
  if (overflow != nullptr) *overflow = r.overflow;
  return absl::bit_cast<float>(static_cast<uint32_t>(r.bits));
}

FPCONV_NAMESPACE_END
}  // namespace fpconv

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
// File: decimal_to_bits.h
// -----------------------------------------------------------------------------
//
// Converts a `Decimal` to the nearest value of a binary floating-point format,
// rounding to nearest with ties to even.
//
// Example:
//
//   absl::StatusOr<fpconv::Decimal> d = fpconv::Decimal::FromDigits("1", 0);
//   if (d.ok()) {
//     fpconv::DecimalToBitsResult r =
//         fpconv::DecimalToBits(*d, fpconv::FloatWidth::k32);
//     // r.bits == 0x3dcccccd, the binary32 nearest 0.1.
//   }

#ifndef FPCONV_STRINGS_DECIMAL_TO_BITS_H_
#define FPCONV_STRINGS_DECIMAL_TO_BITS_H_

#include <cstdint>

#include "absl/base/attributes.h"
#include "fpconv/base/config.h"
#include "fpconv/numeric/float_bits.h"
#include "fpconv/strings/decimal.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

// DecimalToBitsResult
//
// `bits` is the right-aligned bit pattern of the result. `overflow` is set
// when the magnitude is too large for the format; `bits` is then the
// infinity of the decimal's sign. Underflow is not an error: values below
// half the smallest denormal become a signed zero.
struct DecimalToBitsResult {
  uint64_t bits;
  bool overflow;
};

// DecimalToBits()
//
// Returns the `width` value nearest to `d`. `d` is not modified.
ABSL_MUST_USE_RESULT DecimalToBitsResult DecimalToBits(const Decimal& d,
                                                       FloatWidth width);

// DecimalToDouble()
// DecimalToFloat()
//
// Convenience wrappers returning the native value. `overflow` may be null.
double DecimalToDouble(const Decimal& d, bool* overflow = nullptr);
float DecimalToFloat(const Decimal& d, bool* overflow = nullptr);

FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_DECIMAL_TO_BITS_H_

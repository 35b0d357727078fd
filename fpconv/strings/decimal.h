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
// File: decimal.h
// -----------------------------------------------------------------------------
//
// This header defines `fpconv::Decimal`, a fixed-capacity decimal number used
// as the exact intermediate form when converting between binary floating-point
// values and text.
//
// A `Decimal` holds the value
//
//   (negative ? -1 : 1) * 0.d[0]d[1]...d[count-1] * 10^decimal_point
//
// where every `d[i]` is an ASCII digit. Trailing zero digits are never stored
// and the value zero has `count() == 0`. The capacity is large enough to hold
// the exact decimal expansion of every finite binary64 value; digits that would
// not fit are dropped and remembered in `truncated()`, which the rounding
// operations treat as a non-zero tail.
//
// Example:
//
//   fpconv::Decimal d;
//   d.Assign(3);
//   d.Shift(-2);              // 0.75
//   d.Round(1);               // 0.8
//   uint64_t n = d.RoundedInteger();  // 1

#ifndef FPCONV_STRINGS_DECIMAL_H_
#define FPCONV_STRINGS_DECIMAL_H_

#include <cstdint>
#include <string>

#include "absl/base/attributes.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "fpconv/base/config.h"

namespace fpconv {
FPCONV_NAMESPACE_BEGIN

class Decimal {
 public:
  // The maximum number of stored digits. The longest exact binary64 value,
  // (2^53 - 1) * 2^-1074, has 767 significant digits.
  static constexpr int kMaxDigits = 800;

  // The largest power of two applied in a single shift pass. A digit shifted
  // left by this amount plus its carry still fits in 64 bits.
  static constexpr int kMaxShift = 60;

  Decimal() = default;

  Decimal(const Decimal&) = default;
  Decimal& operator=(const Decimal&) = default;

  // Decimal::FromDigits()
  //
  // Builds a decimal from a string of ASCII digits, the position of the decimal
  // point relative to the first digit, and a sign. Leading and trailing zeros
  // are allowed and normalized away. Returns `InvalidArgumentError` when
  // `digits` contains a non-digit or more significant digits than
  // `kMaxDigits`.
  static absl::StatusOr<Decimal> FromDigits(absl::string_view digits,
                                            int decimal_point,
                                            bool negative = false);

  // Sets the value to the non-negative integer `v`. The sign is left as is.
  void Assign(uint64_t v);

  // Multiplies the value by 2^k. Negative `k` divides. Division that produces
  // more than `kMaxDigits` digits drops the excess and sets `truncated()`.
  void Shift(int k);

  // Keeps the first `nd` digits, rounding to nearest with ties to even. A
  // truncated tail breaks a tie upwards. No-op when `nd < 0` or
  // `nd >= count()`.
  void Round(int nd);

  // Keeps the first `nd` digits, rounding towards zero. Every rounding that
  // drops digits also clears `truncated()`.
  void RoundDown(int nd);

  // Keeps the first `nd` digits, rounding away from zero. `RoundUp(0)` on a
  // non-zero value yields `10^decimal_point`.
  void RoundUp(int nd);

  // Returns the value rounded to the nearest integer, ties to even.
  // Saturates to `UINT64_MAX` when the rounded value does not fit in 64 bits.
  ABSL_MUST_USE_RESULT uint64_t RoundedInteger() const;

  // Accessors.
  const char* digits() const { return digits_; }
  int count() const { return count_; }
  int decimal_point() const { return decimal_point_; }
  bool negative() const { return negative_; }
  bool truncated() const { return truncated_; }
  bool empty() const { return count_ == 0; }

  void set_negative(bool negative) { negative_ = negative; }

  // Returns the digits as a string view.
  absl::string_view digit_view() const {
    return absl::string_view(digits_, static_cast<size_t>(count_));
  }

  // Returns a debugging representation, e.g. "-0.125e1".
  std::string ToString() const;

 private:
  // Drops trailing zero digits and resets the decimal point of a zero value.
  void Trim();
  void LeftShift(int k);
  void RightShift(int k);
  bool ShouldRoundUp(int nd) const;

  char digits_[kMaxDigits];
  int count_ = 0;
  int decimal_point_ = 0;
  bool negative_ = false;
  bool truncated_ = false;
};

FPCONV_NAMESPACE_END
}  // namespace fpconv

#endif  // FPCONV_STRINGS_DECIMAL_H_
